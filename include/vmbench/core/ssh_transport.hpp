/**
 * @file ssh_transport.hpp
 * @brief libssh implementation of the shell transport
 *
 * @date 2025
 */

#pragma once

#include "vmbench/core/shell_transport.hpp"

struct ssh_session_struct;

namespace vmbench {
namespace core {

/**
 * @class LibsshTransport
 * @brief SSH session, exec channels and SFTP through libssh
 *
 * Host keys are accepted without verification: sandboxes are created fresh
 * for every job and regenerate their keys on first boot.
 *
 * **Thread Safety**: NOT thread-safe. ShellChannel serializes all access.
 */
class LibsshTransport : public ShellTransport {
public:
    LibsshTransport() = default;
    ~LibsshTransport() override;

    LibsshTransport(const LibsshTransport&) = delete;
    LibsshTransport& operator=(const LibsshTransport&) = delete;

    void Connect(const ShellConfig& config) override;
    bool IsActive() const override;
    std::unique_ptr<ExecStream> OpenExecStream() override;
    std::unique_ptr<RemoteFileSystem> OpenFileSystem() override;
    void SendKeepAlive() override;
    void Disconnect() override;

private:
    ssh_session_struct* session_{nullptr};  ///< libssh session handle
};

} // namespace core
} // namespace vmbench
