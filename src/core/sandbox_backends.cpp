/**
 * @file sandbox_backends.cpp
 * @brief Production transport factory
 *
 * @date 2025
 */

#include "vmbench/core/sandbox_backends.hpp"
#include "vmbench/core/ssh_transport.hpp"

#include <utility>

namespace vmbench {
namespace core {

DefaultBackends::DefaultBackends(std::string docker_binary)
    : containers_(std::make_shared<utils::DockerCli>(std::move(docker_binary))) {}

std::shared_ptr<utils::ContainerBackend> DefaultBackends::Containers() {
    return containers_;
}

std::unique_ptr<ShellTransport> DefaultBackends::NewShellTransport() {
    return std::make_unique<LibsshTransport>();
}

std::unique_ptr<utils::HttpTransport> DefaultBackends::NewHttpTransport(const std::string& host,
                                                                        int port) {
    return std::make_unique<utils::BeastHttpTransport>(host, port);
}

std::unique_ptr<KernelGateway> DefaultBackends::NewKernelGateway(const std::string& host, int port) {
    return std::make_unique<BeastKernelGateway>(NewHttpTransport(host, port));
}

} // namespace core
} // namespace vmbench
