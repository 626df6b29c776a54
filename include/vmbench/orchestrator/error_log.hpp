/**
 * @file error_log.hpp
 * @brief Per-job error log files
 *
 * Written to `<result_dir>/logs/<uid>_<TYPE>_error_<YYYYmmdd_HHMMSS>.log`:
 * ```
 * Error Type: <TYPE>
 * Timestamp: <ISO-8601>
 * Task UID: <uid>
 * Exception: <what>
 *
 * Traceback:
 * <nested exception chain, outermost first>
 * ```
 *
 * @date 2025
 */

#pragma once

#include <exception>
#include <filesystem>
#include <string>

namespace vmbench {
namespace orchestrator {

/// Error log categories
namespace error_types {
inline constexpr const char* kTaskDefinition = "TASK_DEFINITION_ERROR";
inline constexpr const char* kOrchestratorSetup = "ORCHESTRATOR_SETUP_ERROR";
inline constexpr const char* kTaskExecution = "TASK_EXECUTION_ERROR";
inline constexpr const char* kEvaluation = "EVALUATION_ERROR";
inline constexpr const char* kTimeout = "TIMEOUT";
} // namespace error_types

/**
 * @brief Describe an exception and its nested causes, one per line
 *
 * ExecutionError and RemoteCommandError details (traceback, stderr) are
 * appended after their level.
 */
std::string DescribeException(const std::exception& e);

/**
 * @brief Write an error log
 * @return Path relative to result_dir
 */
std::string WriteErrorLog(const std::filesystem::path& result_dir, const std::string& uid,
                          const std::string& error_type, const std::exception& error);

/// Overload for failures without an exception object (timeouts)
std::string WriteErrorLog(const std::filesystem::path& result_dir, const std::string& uid,
                          const std::string& error_type, const std::string& message,
                          const std::string& details);

} // namespace orchestrator
} // namespace vmbench
