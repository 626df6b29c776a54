/**
 * @file orchestrator.hpp
 * @brief Runs jobs in sandboxes with per-job deadlines and bounded concurrency
 *
 * Every job gets its own sandbox on a dedicated port block, runs its setup
 * steps and body, is evaluated, and leaves a summary.json behind whatever
 * happened. One job failing never affects another.
 *
 * @date 2025
 */

#pragma once

#include "vmbench/core/sandbox_backends.hpp"
#include "vmbench/orchestrator/job.hpp"
#include "vmbench/orchestrator/job_context.hpp"
#include "vmbench/orchestrator/port_pool.hpp"
#include "vmbench/orchestrator/runner_config.hpp"
#include "vmbench/orchestrator/step_registry.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vmbench {
namespace orchestrator {

/**
 * @struct JobBodyResult
 * @brief What a job body reports back
 */
struct JobBodyResult {
    std::optional<std::string> agent_state;   ///< Free-form state ("success", "max_steps", ...)
    nlohmann::json output;                    ///< Final answer or other output
    nlohmann::json messages;                  ///< Conversation or step log
    nlohmann::json tokens;                    ///< Token usage
    nlohmann::json timing;                    ///< Timing information
};

/// Task phase of a job, run after its setup steps
using JobBody = std::function<JobBodyResult(JobContext&)>;

/**
 * @struct RunStatistics
 * @brief Totals over a RunAll call
 */
struct RunStatistics {
    int total{0};
    int completed{0};
    int failed{0};
    int timed_out{0};
};

/**
 * @class JobRecord
 * @brief Summary persistence that can be sealed
 *
 * Once sealed (by the supervisor on timeout) later writes are ignored, so a
 * worker that unwinds after the deadline cannot overwrite TIMED_OUT.
 */
class JobRecord {
public:
    explicit JobRecord(JobDescriptor job);

    /**
     * @brief Write the summary unless sealed
     * @return false if the record was already sealed
     */
    bool Persist(const JobOutput& output);

    /**
     * @brief Write the summary and seal
     * @return false if the record was already sealed
     */
    bool Seal(const JobOutput& output);

    bool IsSealed() const;
    JobOutput Output() const;
    const JobDescriptor& Job() const { return job_; }

private:
    JobDescriptor job_;
    JobOutput output_;
    bool sealed_{false};
    mutable std::mutex mutex_;
};

class PortLeases;

/**
 * @class Orchestrator
 * @brief Job scheduling, supervision and classification
 *
 * **Job pipeline**:
 * ```
 * load definition ──missing──> SETUP_ERROR
 *   │
 * sandbox + kernel ──fails──> ORCHESTRATOR_ERROR
 *   │
 * setup steps, body ──throws──> TASK_EXECUTION_ERROR
 *   │
 * evaluation ──> COMPLETED (score, or -1.0 without evaluator)
 *
 * deadline passed at any point ──> TIMED_OUT
 * ```
 *
 * **Usage Example**:
 * @code
 * RunnerConfig config;
 * config.concurrency = 4;
 *
 * Orchestrator orchestrator(config, std::make_shared<core::DefaultBackends>());
 * auto stats = orchestrator.RunAll([](JobContext& ctx) {
 *     auto run = ctx.code.RunCode("final_answer(42)", true);
 *     return JobBodyResult{"success", *run.result, {}, {}, {}};
 * });
 * @endcode
 */
class Orchestrator {
public:
    Orchestrator(RunnerConfig config,
                 std::shared_ptr<core::SandboxBackends> backends,
                 StepRegistry registry = StepRegistry::WithBuiltins());

    /**
     * @brief Run one job under the configured deadline
     * @param index Zero-based position (for logging)
     * @param total Number of jobs (for logging)
     * @param tool Tool group
     * @param uid Job id
     * @param ports Host port block for the sandbox
     * @param body Task phase
     * @return Final job outcome (also written to summary.json)
     */
    JobOutput RunJob(int index, int total, const std::string& tool, const std::string& uid,
                     const PortBlock& ports, const JobBody& body);

    /**
     * @brief Run every job of the index file
     * @param body Task phase shared by all jobs
     * @param only Restrict to one "tool/uid"
     */
    RunStatistics RunAll(const JobBody& body, const std::optional<std::string>& only = std::nullopt);

    /**
     * @brief Read {tool: [uid, ...]} into (tool, uid) pairs
     * @throws core::JobDefinitionError if the file is missing or malformed
     */
    static std::vector<std::pair<std::string, std::string>> LoadIndex(
        const std::filesystem::path& index_file);

    const RunnerConfig& Config() const { return env_->config; }

    /// State shared with job workers, which may outlive a RunJob call
    struct Environment {
        RunnerConfig config;
        std::shared_ptr<core::SandboxBackends> backends;
        StepRegistry registry;
    };

private:
    std::shared_ptr<const Environment> env_;
    std::shared_ptr<PortLeases> leases_;  ///< Port blocks of detached workers
};

} // namespace orchestrator
} // namespace vmbench
