/**
 * @file main.cpp
 * @brief vmbench - Command-line interface
 *
 * Runs the jobs of an index file, each in its own disposable VM sandbox,
 * and leaves a summary.json per job plus orchestrator.log under the
 * results root.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "vmbench/core/errors.hpp"
#include "vmbench/core/sandbox_backends.hpp"
#include "vmbench/orchestrator/orchestrator.hpp"
#include "vmbench/orchestrator/runner_config.hpp"

#include <chrono>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <memory>

using json = nlohmann::json;
using namespace vmbench;

/*******************************************************************************
 * UI and Display Functions
 ******************************************************************************/

void PrintBanner() {
    std::cout << R"(
╔═══════════════════════════════════════════════════════════════╗
║                                                               ║
║   vmbench - sandboxed VM job runner                           ║
║                              v1.0.0                           ║
║                                                               ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;
}

void SetupLogging(const std::filesystem::path& results_root, bool verbose) {
    std::filesystem::create_directories(results_root);

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        (results_root / "orchestrator.log").string(), false);

    auto logger = std::make_shared<spdlog::logger>(
        "vmbench", spdlog::sinks_init_list{console, file});
    spdlog::set_default_logger(logger);

    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::flush_on(spdlog::level::warn);

    if (verbose) {
        spdlog::debug("[DEBUG] Verbose logging enabled");
    }
}

/*******************************************************************************
 * Job Body
 ******************************************************************************/

// Replay the "solution" code cells of a job; the last final answer is the output
orchestrator::JobBodyResult ReplaySolution(orchestrator::JobContext& ctx) {
    orchestrator::JobBodyResult result;
    auto started = std::chrono::steady_clock::now();

    if (!ctx.job.solution.is_array() || ctx.job.solution.empty()) {
        spdlog::info("[{}] No solution cells, leaving the outcome to evaluation", ctx.job.uid);
        result.agent_state = "skipped";
        return result;
    }

    json messages = json::array();
    int cell_index = 0;
    for (const auto& cell : ctx.job.solution) {
        ctx.cancel.ThrowIfCancelled();
        ++cell_index;

        auto code = cell.is_string() ? cell.get<std::string>() : cell.value("code", "");
        spdlog::info("[{}] Running solution cell {}/{}", ctx.job.uid, cell_index,
                     ctx.job.solution.size());

        auto run = ctx.code.RunCode(code, true);
        messages.push_back({{"cell", cell_index}, {"code", code}, {"output", run.output}});
        if (run.result) {
            result.output = *run.result;
        }
    }

    double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    result.agent_state = "success";
    result.messages = messages;
    result.timing = {{"duration", std::round(seconds * 100.0) / 100.0}};
    return result;
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    PrintBanner();

    CLI::App app{"vmbench - run jobs in disposable VM sandboxes"};

    std::string index_file;
    std::string config_file;
    std::string tasks_root;
    std::string results_root;
    int concurrency = 1;
    int start_port = 60000;
    int timeout = 720;
    std::string image;
    std::string storage_root;
    std::string only;
    bool preserve = false;
    bool verbose = false;

    app.add_option("index", index_file, "Job index file ({tool: [uid, ...]})")
        ->check(CLI::ExistingFile);
    app.add_option("-c,--config", config_file, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("--tasks-root", tasks_root, "Root directory of job definitions");
    app.add_option("--results-root", results_root, "Root directory for job outputs");
    app.add_option("-j,--concurrency", concurrency, "Number of parallel sandboxes")
        ->check(CLI::PositiveNumber);
    app.add_option("--start-port", start_port, "First host port of the port pool")
        ->check(CLI::Range(1, 65535));
    app.add_option("--timeout", timeout, "Per-job timeout in seconds")
        ->check(CLI::PositiveNumber);
    app.add_option("--image", image, "Sandbox container image");
    app.add_option("--storage-root", storage_root, "Root directory of VM disks");
    app.add_option("--only", only, "Run a single job given as tool/uid");
    app.add_flag("--preserve", preserve, "Keep sandboxes after their jobs finish");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    try {
        orchestrator::RunnerConfig config;
        if (!config_file.empty()) {
            config = orchestrator::LoadRunnerConfig(config_file);
        }

        // Command-line overrides
        if (app.count("index")) config.index_file = index_file;
        if (app.count("--tasks-root")) config.tasks_root = tasks_root;
        if (app.count("--results-root")) config.results_root = results_root;
        if (app.count("--concurrency")) config.concurrency = concurrency;
        if (app.count("--start-port")) config.start_port = start_port;
        if (app.count("--timeout")) config.job_timeout = std::chrono::seconds(timeout);
        if (app.count("--image")) config.image = image;
        if (app.count("--storage-root")) config.storage_root = storage_root;
        if (preserve) config.preserve_on_exit = true;

        SetupLogging(config.results_root, verbose);

        spdlog::info("[INIT] Index:        {}", config.index_file.string());
        spdlog::info("[INIT] Tasks root:   {}", config.tasks_root.string());
        spdlog::info("[INIT] Results root: {}", config.results_root.string());
        spdlog::info("[INIT] Concurrency:  {}", config.concurrency);
        spdlog::info("[INIT] Timeout:      {}s", config.job_timeout.count());

        orchestrator::Orchestrator runner(config, std::make_shared<core::DefaultBackends>());
        auto stats = runner.RunAll(ReplaySolution,
                                   only.empty() ? std::nullopt : std::optional<std::string>(only));

        spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
        spdlog::info("[DONE] {} job(s): {} completed, {} failed, {} timed out",
                     stats.total, stats.completed, stats.failed, stats.timed_out);
        spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");

        return (stats.failed > 0 || stats.timed_out > 0) ? 1 : 0;

    } catch (const core::VmbenchError& e) {
        spdlog::error("[ERROR] {}", e.what());
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("[ERROR] Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
