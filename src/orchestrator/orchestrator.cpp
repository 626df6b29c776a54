/**
 * @file orchestrator.cpp
 * @brief Job pipeline, deadline supervision and the job queue
 *
 * **Threads per job**:
 * ```
 * caller (supervisor)            worker
 * ───────────────────            ──────
 * spawn worker          ──────>  bootstrap sandbox, open kernel
 * wait (poll interval)           setup steps, body, evaluation
 *   done?  -> join, return       persist summary, cleanup
 *   deadline?
 *     cancel token
 *     seal TIMED_OUT summary
 *     force-remove container ──> blocked I/O fails, worker unwinds
 *     wait grace, join or detach
 * detached? next job on the block waits for the worker
 * ```
 *
 * @date 2025
 */

#include "vmbench/orchestrator/orchestrator.hpp"
#include "vmbench/core/code_execution_channel.hpp"
#include "vmbench/core/errors.hpp"
#include "vmbench/core/sandbox_manager.hpp"
#include "vmbench/orchestrator/error_log.hpp"
#include "vmbench/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <fstream>
#include <thread>

using json = nlohmann::json;

namespace vmbench {
namespace orchestrator {

using utils::StringUtils;

namespace {

std::string Divider(const std::string& title = "", char fill = '=', std::size_t length = 80) {
    if (title.empty()) {
        return std::string(length, fill);
    }
    std::string text = " " + title + " ";
    if (text.size() >= length) {
        return text;
    }
    std::size_t left = (length - text.size()) / 2;
    return std::string(left, fill) + text + std::string(length - text.size() - left, fill);
}

/**
 * @struct JobRun
 * @brief Per-job state shared between supervisor and worker
 */
struct JobRun {
    explicit JobRun(JobDescriptor job)
        : record(std::move(job)) {}

    JobRecord record;
    PortBlock ports;
    CancellationToken cancel;

    std::mutex mutex;
    std::condition_variable cv;
    bool done{false};
    std::shared_ptr<core::SandboxManager> manager;

    void SetManager(std::shared_ptr<core::SandboxManager> m) {
        std::lock_guard<std::mutex> lock(mutex);
        manager = std::move(m);
    }

    std::shared_ptr<core::SandboxManager> Manager() {
        std::lock_guard<std::mutex> lock(mutex);
        return manager;
    }

    void MarkDone() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            done = true;
        }
        cv.notify_all();
    }
};

void PersistQuietly(JobRun& run, const JobOutput& output) {
    try {
        if (!run.record.Persist(output)) {
            spdlog::debug("[{}] Record sealed, worker summary discarded", run.record.Job().uid);
        }
    }
    catch (const std::exception& e) {
        spdlog::error("[{}] Failed to save summary: {}", run.record.Job().uid, e.what());
    }
}

std::optional<std::string> LogError(JobRun& run, const char* type, const std::exception& e) {
    const auto& job = run.record.Job();
    try {
        return WriteErrorLog(job.ResultDir(), job.uid, type, e);
    }
    catch (const std::exception& write_error) {
        spdlog::error("[{}] Failed to write error log: {}", job.uid, write_error.what());
        return std::nullopt;
    }
}

void LogJobSummary(const JobDescriptor& job, const JobOutput& output) {
    spdlog::info("{}", Divider("Job " + job.uid.substr(0, 8) + " Summary", '-', 60));
    spdlog::info("UID:    {}", job.uid);
    spdlog::info("State:  {}", JobStateToString(output.state));
    spdlog::info("Score:  {}", output.score);
    if (output.total_timing.is_object() && output.total_timing.contains("duration")) {
        spdlog::info("Timing: {} seconds", output.total_timing["duration"].dump());
    }
    if (output.eval_error) {
        auto lines = StringUtils::SplitLines(*output.eval_error);
        spdlog::error("Eval Error: {}", lines.empty() ? "" : lines.front());
        if (output.error_log_path) {
            spdlog::error("Full error log: {}", (job.ResultDir() / *output.error_log_path).string());
        }
    }
    spdlog::info("{}", Divider("", '=', 60));
}

std::shared_ptr<core::SandboxManager> BuildSandbox(const Orchestrator::Environment& env,
                                                   const JobDescriptor& job,
                                                   const PortBlock& ports) {
    core::SandboxOptions options;
    options.name = job.ContainerName();
    options.image = env.config.image;
    options.vm_ram = env.config.vm_ram;
    options.vm_cpu_cores = env.config.vm_cpu_cores;
    options.vm_disk_size = env.config.vm_disk_size;
    options.enable_debug = env.config.enable_debug;
    options.host_ports = ports;
    options.storage_root = env.config.storage_root;
    options.shared_dir = job.ResultDir();

    auto descriptor = core::SandboxDescriptor::Create(options);

    core::SandboxManagerOptions manager_options;
    manager_options.shell.username = env.config.shell_username;
    manager_options.shell.password = env.config.shell_password;
    manager_options.shell.key_file = env.config.shell_key_file;
    manager_options.shell.initial_delay = env.config.shell_initial_delay;
    manager_options.ready_timeout = env.config.ready_timeout;
    manager_options.ready_interval = env.config.ready_interval;
    manager_options.health_retries = env.config.health_retries;
    manager_options.health_delay = env.config.health_delay;
    manager_options.preserve_on_exit = env.config.preserve_on_exit;

    return std::make_shared<core::SandboxManager>(std::move(descriptor), env.backends,
                                                  manager_options);
}

void Evaluate(const Orchestrator::Environment& env, JobRun& run, JobContext& context,
              JobOutput& output) {
    const auto& job = run.record.Job();
    output.state = JobState::COMPLETED;

    if (!job.evaluation) {
        spdlog::info("[{}] No evaluation function defined, skipping evaluation", job.uid);
        output.score = -1.0;
        return;
    }

    const auto& step = *job.evaluation;
    if (!env.registry.HasEvaluator(step.func)) {
        output.score = 0.0;
        output.eval_error = core::UnknownStepError("Unknown evaluation function: " + step.func).what();
        spdlog::warn("[{}] {}", job.uid, *output.eval_error);
        return;
    }

    try {
        output.score = env.registry.Evaluate(step, context);
        spdlog::info("[{}] Evaluation complete. Score assigned: {}", job.uid, output.score);
    }
    catch (const std::exception& e) {
        if (run.cancel.IsCancelled()) {
            throw;
        }
        output.score = 0.0;
        output.eval_error = "Evaluation function '" + step.func + "' failed: " + e.what();
        output.error_log_path = LogError(run, error_types::kEvaluation, e);
    }
}

// Worker side of one job
void RunPipeline(const Orchestrator::Environment& env, JobRun& run, const JobBody& body) {
    const auto& job = run.record.Job();
    JobOutput output;

    std::shared_ptr<core::SandboxManager> manager;
    std::unique_ptr<core::CodeExecutionChannel> code;

    auto teardown = [&]() {
        try {
            if (code) {
                code->Cleanup();
            } else if (manager && !env.config.preserve_on_exit) {
                manager->Cleanup(true);
            }
        }
        catch (const std::exception& e) {
            spdlog::warn("[{}] Teardown failed: {}", job.uid, e.what());
        }
    };

    // Sandbox and kernel bring-up
    try {
        spdlog::info("[{}] Assigned ports: {}", job.uid, json(run.ports).dump());
        manager = BuildSandbox(env, job, run.ports);
        run.SetManager(manager);
        run.cancel.ThrowIfCancelled();

        manager->Bootstrap();
        run.cancel.ThrowIfCancelled();

        const auto& descriptor = manager->Descriptor();
        auto gateway = env.backends->NewKernelGateway(descriptor.ServiceHost(),
                                                      descriptor.HostPort(core::port_keys::kKernel));
        code = std::make_unique<core::CodeExecutionChannel>(
            std::move(gateway), env.config.preserve_on_exit ? nullptr : manager);
        code->InitializeSession(env.config.kernel_retries, env.config.kernel_delay);

        if (!env.config.preinstall_packages.empty()) {
            code->InstallPackages(env.config.preinstall_packages);
        }
    }
    catch (const std::exception& e) {
        if (!run.cancel.IsCancelled()) {
            output.state = JobState::ORCHESTRATOR_ERROR;
            output.score = 0.0;
            output.eval_error = std::string("Sandbox setup failed: ") + e.what();
            output.error_log_path = LogError(run, error_types::kOrchestratorSetup, e);
            PersistQuietly(run, output);
        }
        teardown();
        return;
    }

    JobContext context{job, *manager, *code, run.cancel};

    // Task phase and evaluation
    try {
        for (const auto& step : job.config) {
            run.cancel.ThrowIfCancelled();
            env.registry.RunSetup(step, context);
        }
        spdlog::info("[{}] Setup complete", job.uid);

        run.cancel.ThrowIfCancelled();
        if (body) {
            auto result = body(context);
            output.agent_state = result.agent_state;
            output.output = result.output;
            output.messages = result.messages;
            output.total_tokens = result.tokens;
            output.total_timing = result.timing;
        }
        spdlog::info("[{}] Job body finished with state '{}'", job.uid,
                     output.agent_state.value_or("none"));

        run.cancel.ThrowIfCancelled();
        Evaluate(env, run, context, output);
    }
    catch (const std::exception& e) {
        if (!run.cancel.IsCancelled()) {
            output.state = JobState::TASK_EXECUTION_ERROR;
            output.score = 0.0;
            output.eval_error = std::string("Orchestrator error: ") + e.what();
            output.error_log_path = LogError(run, error_types::kTaskExecution, e);
        }
    }

    PersistQuietly(run, output);
    teardown();
}

} // namespace

// ============================================================================
// PORT LEASES
// ============================================================================

/**
 * @class PortLeases
 * @brief Port blocks still held by workers detached after their deadline
 *
 * A detached worker may still own a container bound to its block. The next
 * job on that block waits until the worker is gone, force-removing its
 * container on every round.
 */
class PortLeases {
public:
    void Hold(std::shared_ptr<JobRun> run) {
        std::lock_guard<std::mutex> lock(mutex_);
        held_.push_back(std::move(run));
    }

    void AwaitRelease(const PortBlock& ports, std::chrono::milliseconds retry,
                      std::chrono::seconds limit) {
        std::shared_ptr<JobRun> holder;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = std::find_if(held_.begin(), held_.end(),
                                   [&ports](const auto& run) { return run->ports == ports; });
            if (it == held_.end()) {
                return;
            }
            holder = *it;
            held_.erase(it);
        }

        const auto& uid = holder->record.Job().uid;
        spdlog::warn("[{}] Waiting for detached worker to release its ports", uid);
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (true) {
            if (auto manager = holder->Manager()) {
                manager->ForceRemove();
            }
            {
                std::unique_lock<std::mutex> lock(holder->mutex);
                if (holder->cv.wait_for(lock, retry, [&holder] { return holder->done; })) {
                    break;
                }
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                spdlog::error("[{}] Detached worker still running after {}s, reusing its ports",
                              uid, limit.count());
                return;
            }
        }
        spdlog::info("✓ [{}] Detached worker finished, ports released", uid);
    }

private:
    std::mutex mutex_;
    std::vector<std::shared_ptr<JobRun>> held_;
};

// ============================================================================
// JOB RECORD
// ============================================================================

JobRecord::JobRecord(JobDescriptor job)
    : job_(std::move(job)) {}

bool JobRecord::Persist(const JobOutput& output) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sealed_) {
        return false;
    }
    output_ = output;
    SaveSummary(job_, output_, job_.ResultDir());
    return true;
}

bool JobRecord::Seal(const JobOutput& output) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sealed_) {
        return false;
    }
    sealed_ = true;
    output_ = output;
    SaveSummary(job_, output_, job_.ResultDir());
    return true;
}

bool JobRecord::IsSealed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sealed_;
}

JobOutput JobRecord::Output() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return output_;
}

// ============================================================================
// ORCHESTRATOR
// ============================================================================

Orchestrator::Orchestrator(RunnerConfig config,
                           std::shared_ptr<core::SandboxBackends> backends,
                           StepRegistry registry)
    : env_(std::make_shared<const Environment>(
          Environment{std::move(config), std::move(backends), std::move(registry)})),
      leases_(std::make_shared<PortLeases>()) {}

JobOutput Orchestrator::RunJob(int index, int total, const std::string& tool,
                               const std::string& uid, const PortBlock& ports,
                               const JobBody& body) {
    const auto& config = env_->config;
    spdlog::info("{}", Divider("Job " + std::to_string(index + 1) + "/" + std::to_string(total) +
                               ": " + uid.substr(0, 8) + " (" + tool + ")"));

    // Job definition
    JobDescriptor job;
    try {
        job = JobDescriptor::Load(config.tasks_root, tool, uid, config.results_root);
        spdlog::info("[{}] Loaded job definition", uid);
    }
    catch (const core::JobDefinitionError& e) {
        job.uid = uid;
        job.tool = tool;
        job.tasks_root = config.tasks_root;
        job.results_root = config.results_root;

        JobOutput output;
        output.state = JobState::SETUP_ERROR;
        output.score = 0.0;
        if (std::filesystem::exists(job.TaskDir() / (uid + ".json"))) {
            output.eval_error = e.what();
        } else {
            output.eval_error = "Task definition file not found: " + uid;
        }
        try {
            output.error_log_path = WriteErrorLog(job.ResultDir(), uid, error_types::kTaskDefinition, e);
        }
        catch (const std::exception& write_error) {
            spdlog::error("[{}] Failed to write error log: {}", uid, write_error.what());
        }
        try {
            SaveSummary(job, output, job.ResultDir());
        }
        catch (const std::exception& save_error) {
            spdlog::error("[{}] Failed to save summary: {}", uid, save_error.what());
        }
        LogJobSummary(job, output);
        return output;
    }

    leases_->AwaitRelease(ports, std::max(config.cancel_grace, config.poll_interval),
                          config.job_timeout);

    auto run = std::make_shared<JobRun>(job);
    run->ports = ports;

    auto env = env_;
    std::thread worker([env, run, body]() {
        try {
            RunPipeline(*env, *run, body);
        }
        catch (const std::exception& e) {
            spdlog::error("[{}] Job worker failed: {}", run->record.Job().uid, e.what());
        }
        run->MarkDone();
    });

    // Supervision
    auto deadline = std::chrono::steady_clock::now() + config.job_timeout;
    {
        std::unique_lock<std::mutex> lock(run->mutex);
        while (!run->done && std::chrono::steady_clock::now() < deadline) {
            run->cv.wait_for(lock, config.poll_interval);
        }
        if (run->done) {
            lock.unlock();
            worker.join();
            auto output = run->record.Output();
            LogJobSummary(job, output);
            return output;
        }
    }

    spdlog::error("[{}] Job exceeded {}s, cancelling", uid, config.job_timeout.count());
    run->cancel.Cancel();

    JobOutput timed_out;
    timed_out.state = JobState::TIMED_OUT;
    timed_out.score = 0.0;
    timed_out.eval_error = "Job timed out after " + std::to_string(config.job_timeout.count()) + "s";
    try {
        timed_out.error_log_path = WriteErrorLog(job.ResultDir(), uid, error_types::kTimeout,
                                                 *timed_out.eval_error,
                                                 "Deadline reached while the job was running.\n");
    }
    catch (const std::exception& e) {
        spdlog::error("[{}] Failed to write error log: {}", uid, e.what());
    }
    try {
        run->record.Seal(timed_out);
    }
    catch (const std::exception& e) {
        spdlog::error("[{}] Failed to save summary: {}", uid, e.what());
    }

    if (auto manager = run->Manager()) {
        manager->ForceRemove();
    }

    bool finished = false;
    {
        std::unique_lock<std::mutex> lock(run->mutex);
        finished = run->cv.wait_for(lock, config.cancel_grace, [&run] { return run->done; });
    }
    if (finished) {
        worker.join();
    } else {
        spdlog::warn("[{}] Worker did not unwind within {}ms, detaching", uid,
                     config.cancel_grace.count());
        worker.detach();
        leases_->Hold(run);
    }

    LogJobSummary(job, timed_out);
    return timed_out;
}

std::vector<std::pair<std::string, std::string>> Orchestrator::LoadIndex(
    const std::filesystem::path& index_file) {

    std::ifstream file(index_file);
    if (!file) {
        throw core::JobDefinitionError("Job index not found: " + index_file.string());
    }

    std::vector<std::pair<std::string, std::string>> jobs;
    try {
        json index;
        file >> index;
        for (const auto& [tool, uids] : index.items()) {
            for (const auto& uid : uids) {
                jobs.emplace_back(tool, uid.get<std::string>());
            }
        }
    }
    catch (const json::exception& e) {
        throw core::JobDefinitionError("Invalid job index " + index_file.string() + ": " + e.what());
    }
    return jobs;
}

RunStatistics Orchestrator::RunAll(const JobBody& body, const std::optional<std::string>& only) {
    const auto& config = env_->config;

    auto jobs = LoadIndex(config.index_file);
    if (only) {
        std::vector<std::pair<std::string, std::string>> selected;
        for (const auto& entry : jobs) {
            if (entry.first + "/" + entry.second == *only) {
                selected.push_back(entry);
            }
        }
        jobs = std::move(selected);
    }

    const int slots = std::max(1, config.concurrency);
    auto pool = GeneratePortPool(config.start_port, slots, config.port_keys);
    SavePortPool(pool, config.results_root / config.port_pool_file);

    spdlog::info("{}", Divider("RUNNING " + std::to_string(jobs.size()) + " JOB(S) ON " +
                               std::to_string(slots) + " SLOT(S)"));

    RunStatistics stats;
    stats.total = static_cast<int>(jobs.size());
    std::mutex stats_mutex;
    std::atomic<std::size_t> next{0};
    const int total = stats.total;

    auto record = [&](JobState state) {
        std::lock_guard<std::mutex> lock(stats_mutex);
        if (state == JobState::COMPLETED) {
            ++stats.completed;
        } else if (state == JobState::TIMED_OUT) {
            ++stats.timed_out;
        } else {
            ++stats.failed;
        }
    };

    auto slot_loop = [&](const PortBlock& block) {
        while (true) {
            std::size_t i = next.fetch_add(1);
            if (i >= jobs.size()) {
                return;
            }
            const auto& [tool, uid] = jobs[i];
            try {
                record(RunJob(static_cast<int>(i), total, tool, uid, block, body).state);
            }
            catch (const std::exception& e) {
                spdlog::error("[{}] Job failed outside the pipeline: {}", uid, e.what());
                record(JobState::ORCHESTRATOR_ERROR);
            }
        }
    };

    if (slots == 1) {
        slot_loop(pool.front());
    } else {
        std::vector<std::thread> workers;
        workers.reserve(pool.size());
        for (const auto& block : pool) {
            workers.emplace_back(slot_loop, std::cref(block));
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }

    spdlog::info("{}", Divider("RUN COMPLETE"));
    spdlog::info("Total: {}  Completed: {}  Failed: {}  Timed out: {}",
                 stats.total, stats.completed, stats.failed, stats.timed_out);
    return stats;
}

} // namespace orchestrator
} // namespace vmbench
