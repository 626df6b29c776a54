/**
 * @file http_client.hpp
 * @brief Minimal synchronous HTTP/1.1 client for in-sandbox services
 *
 * Services inside a sandbox (observation server, kernel gateway) are reached
 * through published host ports with plain HTTP. HttpTransport is the seam;
 * BeastHttpTransport is the Boost.Beast implementation.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <map>
#include <string>

namespace vmbench {
namespace utils {

/**
 * @struct HttpRequest
 * @brief One HTTP request
 */
struct HttpRequest {
    std::string method{"GET"};                      ///< GET, POST, DELETE, ...
    std::string target{"/"};                        ///< Path plus query string
    std::string body;                               ///< JSON body (empty for none)
    std::map<std::string, std::string> headers;     ///< Extra headers
    std::chrono::milliseconds timeout{30000};       ///< Connect + exchange timeout
};

/**
 * @struct HttpResponse
 * @brief Status and body of an HTTP response
 */
struct HttpResponse {
    int status{0};      ///< HTTP status code
    std::string body;   ///< Response body
};

/**
 * @class HttpTransport
 * @brief Sends requests to one host:port
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Perform one request/response exchange
     * @throws core::HttpTransportError on connection or protocol failure
     */
    virtual HttpResponse Send(const HttpRequest& request) = 0;

    virtual std::string Host() const = 0;
    virtual int Port() const = 0;
};

/**
 * @class BeastHttpTransport
 * @brief HttpTransport over Boost.Beast, one connection per request
 */
class BeastHttpTransport : public HttpTransport {
public:
    BeastHttpTransport(std::string host, int port);

    HttpResponse Send(const HttpRequest& request) override;

    std::string Host() const override { return host_; }
    int Port() const override { return port_; }

private:
    std::string host_;  ///< Server host
    int port_;          ///< Server port
};

} // namespace utils
} // namespace vmbench
