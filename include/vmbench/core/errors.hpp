/**
 * @file errors.hpp
 * @brief Typed error hierarchy for sandbox provisioning, channels and jobs
 *
 * Every failure raised by the library derives from VmbenchError so callers
 * can catch the whole family at once, while the job orchestrator dispatches
 * on the concrete type to classify a failure (provisioning, connectivity,
 * command, execution, job-level).
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace vmbench {
namespace core {

/**
 * @class VmbenchError
 * @brief Root of all library errors
 */
class VmbenchError : public std::runtime_error {
public:
    explicit VmbenchError(const std::string& message)
        : std::runtime_error(message) {}
};

/***************************************************************************
 * Provisioning / control plane
 ***************************************************************************/

/// Missing base image, invalid port map, resource-creation failure
class SandboxCreationError : public VmbenchError {
public:
    using VmbenchError::VmbenchError;
};

/// Container control plane (docker daemon) could not be reached or refused a request
class ControlPlaneError : public VmbenchError {
public:
    using VmbenchError::VmbenchError;
};

/***************************************************************************
 * Connectivity
 ***************************************************************************/

/// Sandbox did not answer the readiness probe inside the wait window
class SandboxUnreachableError : public VmbenchError {
public:
    using VmbenchError::VmbenchError;
};

/// SSH handshake or authentication failure
class ShellConnectionError : public VmbenchError {
public:
    using VmbenchError::VmbenchError;
};

/// HTTP connection, write or read failed at the transport level
class HttpTransportError : public VmbenchError {
public:
    using VmbenchError::VmbenchError;
};

/// In-sandbox HTTP service never reported healthy, or a request failed
class ServiceUnavailableError : public VmbenchError {
public:
    using VmbenchError::VmbenchError;
};

/// Kernel creation or channel connection failed after all retries
class KernelSetupError : public VmbenchError {
public:
    using VmbenchError::VmbenchError;
};

/***************************************************************************
 * Per-call errors
 ***************************************************************************/

/**
 * @class RemoteCommandError
 * @brief A remote shell command failed
 *
 * Carries the effective command text, the exit status (-1 when the command
 * never produced one, e.g. missing sudo password or timeout) and both
 * captured streams.
 *
 * Message format:
 * @code
 * Command '<command>' failed with status <N>.
 * Stderr:
 * <stderr>
 * @endcode
 * The stderr block is omitted when stderr is empty.
 */
class RemoteCommandError : public VmbenchError {
public:
    RemoteCommandError(std::string command, int status,
                       std::string stdout_output, std::string stderr_output);

    const std::string& Command() const { return command_; }
    int Status() const { return status_; }
    const std::string& Stdout() const { return stdout_; }
    const std::string& Stderr() const { return stderr_; }

protected:
    RemoteCommandError(const std::string& message, const std::string& command,
                       int status, const std::string& stdout_output,
                       const std::string& stderr_output);

private:
    std::string command_;
    int status_;
    std::string stdout_;
    std::string stderr_;
};

/**
 * @class CommandTimeoutError
 * @brief Command exceeded its wall-clock timeout
 *
 * Status is always -1. Stdout()/Stderr() hold everything captured before the
 * deadline; the message quotes the first 200 characters of each.
 */
class CommandTimeoutError : public RemoteCommandError {
public:
    CommandTimeoutError(const std::string& command, double timeout_seconds,
                        const std::string& partial_stdout,
                        const std::string& partial_stderr);
};

/// SFTP transfer refused or failed
class FileTransferError : public VmbenchError {
public:
    using VmbenchError::VmbenchError;
};

/// Remote path exists but is not the expected kind (file vs directory)
class RemotePathTypeError : public FileTransferError {
public:
    using FileTransferError::FileTransferError;
};

/**
 * @class ExecutionError
 * @brief Code fragment raised inside the kernel
 */
class ExecutionError : public VmbenchError {
public:
    ExecutionError(const std::string& message, std::string traceback)
        : VmbenchError(message), traceback_(std::move(traceback)) {}

    const std::string& Traceback() const { return traceback_; }

private:
    std::string traceback_;
};

/***************************************************************************
 * Job level
 ***************************************************************************/

/// Job definition file missing or malformed
class JobDefinitionError : public VmbenchError {
public:
    using VmbenchError::VmbenchError;
};

/// Setup or evaluation step name not present in the registry
class UnknownStepError : public VmbenchError {
public:
    using VmbenchError::VmbenchError;
};

/// Raised by cooperative job bodies once the job deadline has passed
class JobCancelledError : public VmbenchError {
public:
    using VmbenchError::VmbenchError;
};

} // namespace core
} // namespace vmbench
