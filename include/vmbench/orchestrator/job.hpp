/**
 * @file job.hpp
 * @brief Job definition, job outcome and summary persistence
 *
 * A job definition lives at `<tasks_root>/<tool>/<uid>/<uid>.json`; its
 * outcome is written to `<results_root>/<tool>/<uid>/summary.json`.
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace vmbench {
namespace orchestrator {

/**
 * @enum JobState
 * @brief Final classification of a job
 */
enum class JobState {
    INITIALIZING,          ///< Not finished yet
    COMPLETED,             ///< Task phase and evaluation ran
    SETUP_ERROR,           ///< Job definition missing or invalid
    TIMED_OUT,             ///< Deadline passed
    ORCHESTRATOR_ERROR,    ///< Sandbox or kernel bring-up failed
    TASK_EXECUTION_ERROR   ///< Setup step or job body failed
};

std::string JobStateToString(JobState state);

/**
 * @struct StepCall
 * @brief Named step with its keyword arguments
 */
struct StepCall {
    std::string func;                                           ///< Registry name
    nlohmann::json arguments = nlohmann::json::object();        ///< Keyword arguments
};

/**
 * @struct JobDescriptor
 * @brief Parsed job definition
 */
struct JobDescriptor {
    std::string uid;
    std::string tool;
    std::string prompt;                                   ///< "instruction"
    int steps{6};                                         ///< "action_number"
    std::vector<std::string> dependencies{"*"};
    std::vector<StepCall> config;                         ///< Setup steps in order
    std::optional<StepCall> evaluation;                   ///< Evaluation step, if any
    std::vector<std::string> tags;
    std::optional<std::string> counterpart;
    std::vector<std::string> source;
    std::vector<std::string> related_apps;
    nlohmann::json solution = nlohmann::json::array();    ///< Optional code cells to replay

    std::filesystem::path tasks_root;                     ///< Root the definition was read from
    std::filesystem::path results_root{"results"};        ///< Root for job outputs

    /// tasks_root/tool/uid
    std::filesystem::path TaskDir() const;

    /// results_root/tool/uid
    std::filesystem::path ResultDir() const;

    /// "vmbench-<tool>-<uid>", unique per job, with characters docker rejects replaced by '_'
    std::string ContainerName() const;

    /**
     * @brief Load a job definition
     * @param tasks_root Root of the job definitions
     * @param tool Tool group
     * @param uid Job id
     * @param results_root Root of the job outputs
     * @throws core::JobDefinitionError if the file is missing or malformed
     */
    static JobDescriptor Load(const std::filesystem::path& tasks_root,
                              const std::string& tool,
                              const std::string& uid,
                              const std::filesystem::path& results_root = "results");
};

/**
 * @struct JobOutput
 * @brief Outcome of one job
 */
struct JobOutput {
    double score{0.0};                          ///< -1.0 means "not evaluated"
    std::optional<std::string> eval_error;
    std::optional<std::string> error_log_path;  ///< Relative to the result directory
    nlohmann::json output;                      ///< Job body output
    JobState state{JobState::INITIALIZING};
    std::optional<std::string> agent_state;     ///< State reported by the job body
    nlohmann::json messages;
    nlohmann::json total_tokens;
    nlohmann::json total_timing;
};

/**
 * @brief Serialize descriptor fields plus `results`
 */
nlohmann::json BuildSummary(const JobDescriptor& descriptor, const JobOutput& output);

/**
 * @brief Atomically write result_dir/summary.json
 * @return Path of the written file
 */
std::filesystem::path SaveSummary(const JobDescriptor& descriptor, const JobOutput& output,
                                  const std::filesystem::path& result_dir);

} // namespace orchestrator
} // namespace vmbench
