/**
 * @file step_registry.hpp
 * @brief Name -> handler tables for setup steps and evaluators
 *
 * Job definitions name their setup steps and evaluator by string; the
 * registry resolves the names to typed handlers and rejects unknown ones.
 *
 * **Built-in setup steps**:
 * - `upload_file_to_vm(local_path, remote_path)`
 * - `upload_script_and_execute(local_path, remote_path = "/home/user/Desktop")`
 * - `execute_command(command, as_root = false)`
 *
 * **Built-in evaluators**:
 * - `script_exit_status(local_path, remote_path = "/home/user/Desktop")`
 *
 * @date 2025
 */

#pragma once

#include "vmbench/orchestrator/job.hpp"
#include "vmbench/orchestrator/job_context.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace vmbench {
namespace orchestrator {

using SetupHandler = std::function<void(JobContext&, const nlohmann::json&)>;
using EvalHandler = std::function<double(JobContext&, const nlohmann::json&)>;

/**
 * @class StepRegistry
 * @brief Setup and evaluation dispatch
 *
 * **Usage Example**:
 * @code
 * auto registry = StepRegistry::WithBuiltins();
 * registry.RegisterEvaluator("file_exists", [](JobContext& ctx, const json& args) {
 *     return ctx.Shell().ExecCommand("test -f " + args.at("path").get<std::string>()) ? 1.0 : 0.0;
 * });
 *
 * for (const auto& step : job.config) {
 *     registry.RunSetup(step, ctx);
 * }
 * @endcode
 */
class StepRegistry {
public:
    /// Registry with the built-in steps registered
    static StepRegistry WithBuiltins();

    void RegisterSetup(const std::string& name, SetupHandler handler);
    void RegisterEvaluator(const std::string& name, EvalHandler handler);

    bool HasSetup(const std::string& name) const;
    bool HasEvaluator(const std::string& name) const;

    /**
     * @brief Run one setup step
     * @throws core::UnknownStepError if the name is not registered
     */
    void RunSetup(const StepCall& step, JobContext& context) const;

    /**
     * @brief Run the evaluator
     * @return Score
     * @throws core::UnknownStepError if the name is not registered
     */
    double Evaluate(const StepCall& step, JobContext& context) const;

    std::vector<std::string> SetupNames() const;
    std::vector<std::string> EvaluatorNames() const;

private:
    std::map<std::string, SetupHandler> setup_;
    std::map<std::string, EvalHandler> evaluators_;
};

namespace steps {

void UploadFileToVm(JobContext& context, const nlohmann::json& args);
void UploadScriptAndExecute(JobContext& context, const nlohmann::json& args);
void ExecuteCommand(JobContext& context, const nlohmann::json& args);
double ScriptExitStatus(JobContext& context, const nlohmann::json& args);

} // namespace steps

} // namespace orchestrator
} // namespace vmbench
