/**
 * @file job_context.hpp
 * @brief What setup steps, evaluators and job bodies get to work with
 *
 * @date 2025
 */

#pragma once

#include "vmbench/core/code_execution_channel.hpp"
#include "vmbench/core/errors.hpp"
#include "vmbench/core/sandbox_manager.hpp"
#include "vmbench/orchestrator/job.hpp"

#include <atomic>

namespace vmbench {
namespace orchestrator {

/**
 * @class CancellationToken
 * @brief Cooperative cancellation flag shared between supervisor and worker
 */
class CancellationToken {
public:
    void Cancel() { cancelled_ = true; }
    bool IsCancelled() const { return cancelled_; }

    /// @throws core::JobCancelledError once cancelled
    void ThrowIfCancelled() const {
        if (cancelled_) {
            throw core::JobCancelledError("Job cancelled");
        }
    }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @struct JobContext
 * @brief Running job: definition, sandbox, kernel session, cancellation
 */
struct JobContext {
    const JobDescriptor& job;
    core::SandboxManager& sandbox;
    core::CodeExecutionChannel& code;
    const CancellationToken& cancel;

    core::ShellChannel& Shell() { return sandbox.Shell(); }
};

} // namespace orchestrator
} // namespace vmbench
