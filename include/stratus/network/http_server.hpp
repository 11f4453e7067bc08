#pragma once

#include "stratus/network/http_parser.hpp"
#include "stratus/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace stratus {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief Per-connection handler for async HTTP requests
 *
 * One request per connection: the response is written and the socket shut
 * down. enable_shared_from_this keeps the object alive while async
 * operations are pending.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, HttpRequestHandler handler, std::size_t max_body_size);

    void start();

private:
    void do_read();
    void do_write(const HttpResponse& response);
    void handle_error(const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::array<char, 64 * 1024> buffer_;
};

/**
 * @brief Event-driven HTTP server on Boost.Asio
 *
 * The agent runs a single io_context thread, so handlers never run
 * concurrently with each other.
 *
 * ```cpp
 * asio::io_context io_context;
 * HttpServer server(io_context, "0.0.0.0", 5986);
 * server.set_handler([&](const HttpRequest& req) { return router.handle_request(req); });
 * io_context.run();
 * ```
 */
class HttpServer {
public:
    /**
     * @param port 0 binds an ephemeral port, see port()
     */
    HttpServer(asio::io_context& io_context, const std::string& address, uint16_t port,
               std::size_t max_body_size = HttpParser::kDefaultMaxBodySize);

    void set_handler(HttpRequestHandler handler);

    // Actual listening port
    uint16_t port() const { return port_; }

    // Stops accepting; pending connections finish on their own
    void stop();

private:
    void do_accept();

    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    std::size_t max_body_size_;
    uint16_t port_;
};

} // namespace network
} // namespace stratus
