/**
 * @file sandbox_backends.hpp
 * @brief Factory for the transports a sandbox needs
 *
 * SandboxManager and the job orchestrator never construct a transport
 * directly; they ask a SandboxBackends. DefaultBackends wires the docker CLI,
 * libssh and Boost.Beast implementations.
 *
 * @date 2025
 */

#pragma once

#include "vmbench/core/kernel_gateway.hpp"
#include "vmbench/core/shell_transport.hpp"
#include "vmbench/utils/container_utils.hpp"
#include "vmbench/utils/http_client.hpp"

#include <memory>
#include <string>

namespace vmbench {
namespace core {

/**
 * @class SandboxBackends
 * @brief Creates control-plane, shell, HTTP and kernel transports
 */
class SandboxBackends {
public:
    virtual ~SandboxBackends() = default;

    /// Shared control-plane backend
    virtual std::shared_ptr<utils::ContainerBackend> Containers() = 0;

    /// New, unconnected shell transport
    virtual std::unique_ptr<ShellTransport> NewShellTransport() = 0;

    /// HTTP transport bound to host:port
    virtual std::unique_ptr<utils::HttpTransport> NewHttpTransport(const std::string& host,
                                                                   int port) = 0;

    /// Kernel gateway reachable at host:port
    virtual std::unique_ptr<KernelGateway> NewKernelGateway(const std::string& host, int port) = 0;
};

/**
 * @class DefaultBackends
 * @brief DockerCli + LibsshTransport + BeastHttpTransport + BeastKernelGateway
 */
class DefaultBackends : public SandboxBackends {
public:
    explicit DefaultBackends(std::string docker_binary = "docker");

    std::shared_ptr<utils::ContainerBackend> Containers() override;
    std::unique_ptr<ShellTransport> NewShellTransport() override;
    std::unique_ptr<utils::HttpTransport> NewHttpTransport(const std::string& host,
                                                           int port) override;
    std::unique_ptr<KernelGateway> NewKernelGateway(const std::string& host, int port) override;

private:
    std::shared_ptr<utils::ContainerBackend> containers_;
};

} // namespace core
} // namespace vmbench
