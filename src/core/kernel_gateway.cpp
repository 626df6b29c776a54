/**
 * @file kernel_gateway.cpp
 * @brief REST and websocket access to a Jupyter kernel gateway
 *
 * @date 2025
 */

#include "vmbench/core/kernel_gateway.hpp"
#include "vmbench/core/errors.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <utility>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace vmbench {
namespace core {

namespace {

/**
 * @class BeastKernelSocket
 * @brief KernelSocket over a synchronous Beast websocket stream
 */
class BeastKernelSocket : public KernelSocket {
public:
    BeastKernelSocket(const std::string& host, int port, const std::string& target)
        : ws_(ioc_) {
        try {
            tcp::resolver resolver(ioc_);
            auto const results = resolver.resolve(host, std::to_string(port));

            beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
            beast::get_lowest_layer(ws_).connect(results);
            beast::get_lowest_layer(ws_).expires_never();

            ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
            ws_.handshake(host + ":" + std::to_string(port), target);
            ws_.text(true);
            open_ = true;
        }
        catch (const boost::system::system_error& e) {
            throw KernelSetupError("WebSocket connect to ws://" + host + ":" +
                                   std::to_string(port) + target + " failed: " + e.what());
        }
    }

    ~BeastKernelSocket() override {
        Close();
    }

    void Send(const std::string& text) override {
        try {
            ws_.write(net::buffer(text));
        }
        catch (const boost::system::system_error& e) {
            throw KernelSetupError(std::string("WebSocket write failed: ") + e.what());
        }
    }

    std::string Receive() override {
        try {
            beast::flat_buffer buffer;
            ws_.read(buffer);
            return beast::buffers_to_string(buffer.data());
        }
        catch (const boost::system::system_error& e) {
            open_ = false;
            throw KernelSetupError(std::string("WebSocket read failed: ") + e.what());
        }
    }

    void Close() override {
        if (!open_) {
            return;
        }
        open_ = false;

        beast::error_code ec;
        ws_.close(websocket::close_code::normal, ec);
        if (ec) {
            spdlog::debug("WebSocket close: {}", ec.message());
        }
    }

private:
    net::io_context ioc_;
    websocket::stream<beast::tcp_stream> ws_;
    bool open_{false};
};

json ParseBody(const utils::HttpResponse& response, const std::string& what) {
    try {
        return json::parse(response.body);
    }
    catch (const json::parse_error& e) {
        throw ServiceUnavailableError(what + " returned invalid JSON: " + e.what());
    }
}

} // namespace

BeastKernelGateway::BeastKernelGateway(std::unique_ptr<utils::HttpTransport> http)
    : http_(std::move(http)) {}

std::vector<std::string> BeastKernelGateway::ListKernels() {
    utils::HttpRequest request;
    request.method = "GET";
    request.target = "/api/kernels";
    request.timeout = std::chrono::seconds(5);

    auto response = http_->Send(request);
    if (response.status != 200) {
        throw ServiceUnavailableError("GET /api/kernels returned HTTP " +
                                      std::to_string(response.status));
    }

    std::vector<std::string> ids;
    for (const auto& kernel : ParseBody(response, "GET /api/kernels")) {
        if (kernel.contains("id")) {
            ids.push_back(kernel["id"].get<std::string>());
        }
    }
    return ids;
}

std::string BeastKernelGateway::CreateKernel() {
    utils::HttpRequest request;
    request.method = "POST";
    request.target = "/api/kernels";
    request.body = "{}";

    auto response = http_->Send(request);
    if (response.status != 201) {
        throw ServiceUnavailableError("POST /api/kernels returned HTTP " +
                                      std::to_string(response.status) + ": " + response.body);
    }
    return ParseBody(response, "POST /api/kernels").at("id").get<std::string>();
}

void BeastKernelGateway::DeleteKernel(const std::string& kernel_id) {
    utils::HttpRequest request;
    request.method = "DELETE";
    request.target = "/api/kernels/" + kernel_id;

    auto response = http_->Send(request);
    if (response.status != 204 && response.status != 200 && response.status != 404) {
        throw ServiceUnavailableError("DELETE /api/kernels/" + kernel_id + " returned HTTP " +
                                      std::to_string(response.status));
    }
}

std::unique_ptr<KernelSocket> BeastKernelGateway::OpenChannel(const std::string& kernel_id) {
    return std::make_unique<BeastKernelSocket>(
        http_->Host(), http_->Port(), "/api/kernels/" + kernel_id + "/channels");
}

} // namespace core
} // namespace vmbench
