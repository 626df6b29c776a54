/**
 * @file step_registry.cpp
 * @brief Step dispatch and built-in steps
 *
 * @date 2025
 */

#include "vmbench/orchestrator/step_registry.hpp"
#include "vmbench/core/errors.hpp"
#include "vmbench/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <utility>

using json = nlohmann::json;

namespace vmbench {
namespace orchestrator {

using utils::StringUtils;

namespace {

constexpr const char* kDefaultRemoteDir = "/home/user/Desktop";

std::string RequireString(const json& args, const std::string& key) {
    if (!args.contains(key) || !args[key].is_string()) {
        throw core::JobDefinitionError("Missing string argument '" + key + "'");
    }
    return args[key].get<std::string>();
}

std::filesystem::path ResolveLocal(const JobContext& context, const std::string& local_path) {
    auto path = context.job.TaskDir() / local_path;
    if (!std::filesystem::exists(path)) {
        throw core::FileTransferError("Local file not found: " + path.string());
    }
    return path;
}

// Upload a script, mark it executable and return its remote path
std::string UploadScript(JobContext& context, const json& args) {
    auto local = ResolveLocal(context, RequireString(args, "local_path"));
    std::string remote_dir = args.value("remote_path", std::string(kDefaultRemoteDir));
    std::string remote = remote_dir + "/" + local.filename().string();

    spdlog::debug("Uploading script: {} -> {}", local.string(), remote);
    context.Shell().PutFile(local, remote, true, true);
    context.Shell().ExecCommand("chmod +x " + StringUtils::ShellQuote(remote), {}, true);
    return remote;
}

std::map<std::string, std::string> ScriptEnv(const JobContext& context) {
    auto env = context.sandbox.Descriptor().RuntimeEnv();
    env["TASK_SETUP_LOG"] = context.sandbox.Descriptor().GuestSetupLog();
    return env;
}

} // namespace

// ============================================================================
// REGISTRY
// ============================================================================

StepRegistry StepRegistry::WithBuiltins() {
    StepRegistry registry;
    registry.RegisterSetup("upload_file_to_vm", steps::UploadFileToVm);
    registry.RegisterSetup("upload_script_and_execute", steps::UploadScriptAndExecute);
    registry.RegisterSetup("execute_command", steps::ExecuteCommand);
    registry.RegisterEvaluator("script_exit_status", steps::ScriptExitStatus);
    return registry;
}

void StepRegistry::RegisterSetup(const std::string& name, SetupHandler handler) {
    setup_[name] = std::move(handler);
}

void StepRegistry::RegisterEvaluator(const std::string& name, EvalHandler handler) {
    evaluators_[name] = std::move(handler);
}

bool StepRegistry::HasSetup(const std::string& name) const {
    return setup_.count(name) > 0;
}

bool StepRegistry::HasEvaluator(const std::string& name) const {
    return evaluators_.count(name) > 0;
}

void StepRegistry::RunSetup(const StepCall& step, JobContext& context) const {
    auto it = setup_.find(step.func);
    if (it == setup_.end()) {
        throw core::UnknownStepError("Unknown setup function: " + step.func);
    }
    spdlog::info("[{}] Setup step: {}", context.job.uid, step.func);
    it->second(context, step.arguments);
}

double StepRegistry::Evaluate(const StepCall& step, JobContext& context) const {
    auto it = evaluators_.find(step.func);
    if (it == evaluators_.end()) {
        throw core::UnknownStepError("Unknown evaluation function: " + step.func);
    }
    spdlog::info("[{}] Evaluation: {}", context.job.uid, step.func);
    return it->second(context, step.arguments);
}

std::vector<std::string> StepRegistry::SetupNames() const {
    std::vector<std::string> names;
    for (const auto& entry : setup_) {
        names.push_back(entry.first);
    }
    return names;
}

std::vector<std::string> StepRegistry::EvaluatorNames() const {
    std::vector<std::string> names;
    for (const auto& entry : evaluators_) {
        names.push_back(entry.first);
    }
    return names;
}

// ============================================================================
// BUILT-IN STEPS
// ============================================================================

namespace steps {

void UploadFileToVm(JobContext& context, const json& args) {
    auto local = ResolveLocal(context, RequireString(args, "local_path"));
    auto remote = RequireString(args, "remote_path");

    spdlog::info("Uploading file to VM: {} -> {}", local.string(), remote);
    context.Shell().PutFile(local, remote, true, true);
}

void UploadScriptAndExecute(JobContext& context, const json& args) {
    auto remote = UploadScript(context, args);

    spdlog::info("Executing {}", remote);
    auto result = context.Shell().ExecCommand(StringUtils::ShellQuote(remote), ScriptEnv(context));
    if (result && !result->stderr_output.empty()) {
        spdlog::warn("stderr:\n{}", result->stderr_output);
    }
    spdlog::info("✓ Script executed successfully");
}

void ExecuteCommand(JobContext& context, const json& args) {
    auto command = RequireString(args, "command");
    bool as_root = args.value("as_root", false);

    auto result = context.Shell().ExecCommand(command, context.sandbox.Descriptor().RuntimeEnv(),
                                              as_root);
    if (result) {
        spdlog::debug("{}", result->stdout_output);
    }
}

double ScriptExitStatus(JobContext& context, const json& args) {
    auto remote = UploadScript(context, args);

    try {
        context.Shell().ExecCommand(StringUtils::ShellQuote(remote), ScriptEnv(context));
    }
    catch (const core::CommandTimeoutError&) {
        throw;
    }
    catch (const core::RemoteCommandError& e) {
        spdlog::info("Evaluation script exited with status {}", e.Status());
        return 0.0;
    }
    return 1.0;
}

} // namespace steps

} // namespace orchestrator
} // namespace vmbench
