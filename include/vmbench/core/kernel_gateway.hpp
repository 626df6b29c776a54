/**
 * @file kernel_gateway.hpp
 * @brief Jupyter kernel gateway access: REST kernel management and WebSocket channels
 *
 * KernelGateway and KernelSocket are the seams used by CodeExecutionChannel.
 * BeastKernelGateway talks to a real gateway through an HttpTransport for the
 * REST side and a Boost.Beast websocket for `/api/kernels/<id>/channels`.
 *
 * @date 2025
 */

#pragma once

#include "vmbench/utils/http_client.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace vmbench {
namespace core {

/**
 * @class KernelSocket
 * @brief Bidirectional text channel to one kernel
 */
class KernelSocket {
public:
    virtual ~KernelSocket() = default;

    /// Send one text frame
    virtual void Send(const std::string& text) = 0;

    /**
     * @brief Block until the next text frame arrives
     * @throws KernelSetupError if the connection is closed or broken
     */
    virtual std::string Receive() = 0;

    /// Close the channel (no-op if already closed)
    virtual void Close() = 0;
};

/**
 * @class KernelGateway
 * @brief Kernel management on a gateway
 */
class KernelGateway {
public:
    virtual ~KernelGateway() = default;

    /**
     * @brief Ids of the running kernels
     * @throws HttpTransportError, ServiceUnavailableError
     */
    virtual std::vector<std::string> ListKernels() = 0;

    /**
     * @brief Start a new kernel
     * @return Kernel id
     * @throws ServiceUnavailableError unless the gateway answers 201
     */
    virtual std::string CreateKernel() = 0;

    /// Shut down a kernel
    virtual void DeleteKernel(const std::string& kernel_id) = 0;

    /**
     * @brief Connect to the kernel's channels endpoint
     * @throws KernelSetupError on handshake failure
     */
    virtual std::unique_ptr<KernelSocket> OpenChannel(const std::string& kernel_id) = 0;
};

/**
 * @class BeastKernelGateway
 * @brief KernelGateway over HTTP + Boost.Beast websocket
 *
 * **Usage Example**:
 * @code
 * BeastKernelGateway gateway(
 *     std::make_unique<utils::BeastHttpTransport>("localhost", 60003));
 * auto id = gateway.CreateKernel();
 * auto socket = gateway.OpenChannel(id);
 * @endcode
 */
class BeastKernelGateway : public KernelGateway {
public:
    explicit BeastKernelGateway(std::unique_ptr<utils::HttpTransport> http);

    std::vector<std::string> ListKernels() override;
    std::string CreateKernel() override;
    void DeleteKernel(const std::string& kernel_id) override;
    std::unique_ptr<KernelSocket> OpenChannel(const std::string& kernel_id) override;

private:
    std::unique_ptr<utils::HttpTransport> http_;   ///< REST transport
};

} // namespace core
} // namespace vmbench
