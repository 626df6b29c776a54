/**
 * @file errors.cpp
 * @brief Message formatting for remote command errors
 *
 * @date 2025
 */

#include "vmbench/core/errors.hpp"

#include <sstream>
#include <utility>

namespace vmbench {
namespace core {

namespace {

std::string FormatCommandMessage(const std::string& command, int status,
                                 const std::string& stderr_output) {
    std::string message = "Command '" + command + "' failed with status " +
                          std::to_string(status) + ".";
    if (!stderr_output.empty()) {
        message += "\nStderr:\n" + stderr_output;
    }
    return message;
}

std::string FormatTimeoutMessage(const std::string& command, double timeout_seconds,
                                 const std::string& partial_stdout,
                                 const std::string& partial_stderr) {
    constexpr std::size_t kExcerpt = 200;
    std::ostringstream oss;
    oss << "Command '" << command << "' timed out after " << timeout_seconds << "s."
        << "\nPartial stdout: " << partial_stdout.substr(0, kExcerpt)
        << "\nPartial stderr: " << partial_stderr.substr(0, kExcerpt);
    return oss.str();
}

} // anonymous namespace

RemoteCommandError::RemoteCommandError(std::string command, int status,
                                       std::string stdout_output,
                                       std::string stderr_output)
    : VmbenchError(FormatCommandMessage(command, status, stderr_output))
    , command_(std::move(command))
    , status_(status)
    , stdout_(std::move(stdout_output))
    , stderr_(std::move(stderr_output)) {}

RemoteCommandError::RemoteCommandError(const std::string& message,
                                       const std::string& command, int status,
                                       const std::string& stdout_output,
                                       const std::string& stderr_output)
    : VmbenchError(message)
    , command_(command)
    , status_(status)
    , stdout_(stdout_output)
    , stderr_(stderr_output) {}

CommandTimeoutError::CommandTimeoutError(const std::string& command,
                                         double timeout_seconds,
                                         const std::string& partial_stdout,
                                         const std::string& partial_stderr)
    : RemoteCommandError(FormatTimeoutMessage(command, timeout_seconds,
                                              partial_stdout, partial_stderr),
                         command, -1, partial_stdout, partial_stderr) {}

} // namespace core
} // namespace vmbench
