#pragma once

#include "stratus/core/result.hpp"
#include "stratus/network/http_types.hpp"

#include <cstdint>
#include <string>

namespace stratus {
namespace network {

/**
 * @brief Blocking HTTP/1.1 client on Boost.Asio
 *
 * Each call opens a connection, writes the request, reads until the server
 * closes, and parses the response. The agent closes after every response, so
 * there is no connection reuse to manage.
 */
class HttpClient {
public:
    HttpClient(std::string host, uint16_t port);

    /**
     * @brief Send a request and wait for the full response
     *
     * Transport failures (resolve, connect, I/O, malformed response) are
     * errors; HTTP error statuses are returned as responses.
     */
    Result<HttpResponse> send(HttpRequest request) const;

    const std::string& host() const noexcept { return host_; }
    uint16_t port() const noexcept { return port_; }

private:
    std::string host_;
    uint16_t port_;
};

} // namespace network
} // namespace stratus
