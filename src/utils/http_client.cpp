/**
 * @file http_client.cpp
 * @brief Boost.Beast implementation of HttpTransport
 *
 * @date 2025
 */

#include "vmbench/utils/http_client.hpp"
#include "vmbench/core/errors.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace vmbench {
namespace utils {

BeastHttpTransport::BeastHttpTransport(std::string host, int port)
    : host_(std::move(host))
    , port_(port) {}

HttpResponse BeastHttpTransport::Send(const HttpRequest& request) {
    http::verb verb = http::string_to_verb(request.method);
    if (verb == http::verb::unknown) {
        throw core::HttpTransportError("Unsupported HTTP method: " + request.method);
    }

    try {
        net::io_context ioc;
        tcp::resolver resolver(ioc);
        beast::tcp_stream stream(ioc);

        auto const results = resolver.resolve(host_, std::to_string(port_));
        stream.expires_after(request.timeout);
        stream.connect(results);

        http::request<http::string_body> req{verb, request.target, 11};
        req.set(http::field::host, host_ + ":" + std::to_string(port_));
        req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        for (const auto& [name, value] : request.headers) {
            req.set(name, value);
        }
        if (!request.body.empty()) {
            req.set(http::field::content_type, "application/json");
            req.body() = request.body;
        }
        req.prepare_payload();

        stream.expires_after(request.timeout);
        http::write(stream, req);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        http::read(stream, buffer, res);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != beast::errc::not_connected) {
            spdlog::debug("HTTP shutdown: {}", ec.message());
        }

        return HttpResponse{static_cast<int>(res.result_int()), res.body()};
    }
    catch (const boost::system::system_error& e) {
        throw core::HttpTransportError(request.method + " http://" + host_ + ":" +
                                       std::to_string(port_) + request.target +
                                       " failed: " + e.what());
    }
}

} // namespace utils
} // namespace vmbench
