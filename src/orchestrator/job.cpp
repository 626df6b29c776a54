/**
 * @file job.cpp
 * @brief Job definition loading and summary persistence
 *
 * @date 2025
 */

#include "vmbench/orchestrator/job.hpp"
#include "vmbench/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <fstream>
#include <system_error>

using json = nlohmann::json;

namespace vmbench {
namespace orchestrator {

std::string JobStateToString(JobState state) {
    switch (state) {
        case JobState::INITIALIZING:         return "INITIALIZING";
        case JobState::COMPLETED:            return "COMPLETED";
        case JobState::SETUP_ERROR:          return "SETUP_ERROR";
        case JobState::TIMED_OUT:            return "TIMED_OUT";
        case JobState::ORCHESTRATOR_ERROR:   return "ORCHESTRATOR_ERROR";
        case JobState::TASK_EXECUTION_ERROR: return "TASK_EXECUTION_ERROR";
    }
    return "UNKNOWN";
}

namespace {

StepCall ParseStep(const json& j) {
    StepCall step;
    step.func = j.value("func", "");
    if (j.contains("arguments") && j["arguments"].is_object()) {
        step.arguments = j["arguments"];
    }
    return step;
}

json StepToJson(const StepCall& step) {
    return json{{"func", step.func}, {"arguments", step.arguments}};
}

json OptionalToJson(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

std::filesystem::path JobDescriptor::TaskDir() const {
    return tasks_root / tool / uid;
}

std::filesystem::path JobDescriptor::ResultDir() const {
    return results_root / tool / uid;
}

std::string JobDescriptor::ContainerName() const {
    // Docker names allow [a-zA-Z0-9_.-]
    std::string name = "vmbench-" + tool + "-" + uid;
    for (auto& c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.' && c != '-') {
            c = '_';
        }
    }
    return name;
}

JobDescriptor JobDescriptor::Load(const std::filesystem::path& tasks_root,
                                  const std::string& tool,
                                  const std::string& uid,
                                  const std::filesystem::path& results_root) {
    auto path = tasks_root / tool / uid / (uid + ".json");
    std::ifstream file(path);
    if (!file) {
        throw core::JobDefinitionError("Job definition not found: " + path.string());
    }

    json meta;
    try {
        file >> meta;
    }
    catch (const json::parse_error& e) {
        throw core::JobDefinitionError("Invalid job definition " + path.string() + ": " + e.what());
    }

    JobDescriptor job;
    job.uid = uid;
    job.tool = tool;
    job.tasks_root = tasks_root;
    job.results_root = results_root;

    try {
        job.prompt = meta.at("instruction").get<std::string>();
        job.steps = meta.value("action_number", 6);
        job.dependencies = meta.value("dependencies", std::vector<std::string>{"*"});
        for (const auto& step : meta.value("config", json::array())) {
            job.config.push_back(ParseStep(step));
        }
        if (meta.contains("evaluation") && meta["evaluation"].is_object() &&
            !meta["evaluation"].value("func", "").empty()) {
            job.evaluation = ParseStep(meta["evaluation"]);
        }
        job.tags = meta.value("tags", std::vector<std::string>{});
        if (meta.contains("counterpart") && meta["counterpart"].is_string()) {
            job.counterpart = meta["counterpart"].get<std::string>();
        }
        job.source = meta.value("source", std::vector<std::string>{});
        job.related_apps = meta.value("related_apps", std::vector<std::string>{});
        if (meta.contains("solution") && meta["solution"].is_array()) {
            job.solution = meta["solution"];
        }
    }
    catch (const json::exception& e) {
        throw core::JobDefinitionError("Invalid job definition " + path.string() + ": " + e.what());
    }

    return job;
}

json BuildSummary(const JobDescriptor& descriptor, const JobOutput& output) {
    json config = json::array();
    for (const auto& step : descriptor.config) {
        config.push_back(StepToJson(step));
    }

    return json{
        {"uid", descriptor.uid},
        {"tool", descriptor.tool},
        {"prompt", descriptor.prompt},
        {"steps", descriptor.steps},
        {"dependencies", descriptor.dependencies},
        {"config", config},
        {"evaluation", descriptor.evaluation ? StepToJson(*descriptor.evaluation) : json::object()},
        {"tags", descriptor.tags},
        {"counterpart", OptionalToJson(descriptor.counterpart)},
        {"source", descriptor.source},
        {"related_apps", descriptor.related_apps},
        {"results", {
            {"score", output.score},
            {"eval_error", OptionalToJson(output.eval_error)},
            {"error_log_path", OptionalToJson(output.error_log_path)},
            {"output", output.output},
            {"state", JobStateToString(output.state)},
            {"agent_state", OptionalToJson(output.agent_state)},
            {"messages", output.messages},
            {"total_tokens", output.total_tokens},
            {"total_timing", output.total_timing}
        }}
    };
}

std::filesystem::path SaveSummary(const JobDescriptor& descriptor, const JobOutput& output,
                                  const std::filesystem::path& result_dir) {
    std::filesystem::create_directories(result_dir);

    auto target = result_dir / "summary.json";
    auto temp = result_dir / "summary.json.tmp";
    {
        std::ofstream file(temp, std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Cannot write " + temp.string());
        }
        file << BuildSummary(descriptor, output).dump(2);
    }
    std::filesystem::rename(temp, target);

    spdlog::info("Summary saved to: {}", target.string());
    return target;
}

} // namespace orchestrator
} // namespace vmbench
