#include "stratus/network/http_client.hpp"
#include "stratus/network/http_parser.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <array>

namespace stratus {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

HttpClient::HttpClient(std::string host, uint16_t port)
    : host_(std::move(host))
    , port_(port) {
}

Result<HttpResponse> HttpClient::send(HttpRequest request) const {
    const std::string target = host_ + ":" + std::to_string(port_);
    if (!request.has_header("Host")) {
        request.set_header("Host", target);
    }
    request.set_header("Connection", "close");

    asio::io_context io_context;
    tcp::resolver resolver(io_context);
    tcp::socket socket(io_context);
    boost::system::error_code ec;

    const auto endpoints = resolver.resolve(host_, std::to_string(port_), ec);
    if (ec) {
        return Err<HttpResponse>("Failed to resolve " + target + ": " + ec.message());
    }

    asio::connect(socket, endpoints, ec);
    if (ec) {
        return Err<HttpResponse>("Failed to connect to " + target + ": " + ec.message());
    }

    const auto wire = request.serialize();
    asio::write(socket, asio::buffer(wire), ec);
    if (ec) {
        return Err<HttpResponse>("Failed to send request to " + target + ": " + ec.message());
    }

    HttpResponseParser parser;
    std::array<char, 16 * 1024> buffer{};
    while (!parser.is_complete()) {
        const std::size_t received = socket.read_some(asio::buffer(buffer), ec);
        if (received > 0) {
            auto parsed = parser.parse(buffer.data(), received);
            if (parsed.is_error()) {
                return Err<HttpResponse>("Malformed response from " + target + ": " + parsed.error());
            }
        }
        if (ec == asio::error::eof) {
            break;
        }
        if (ec) {
            return Err<HttpResponse>("Failed to read response from " + target + ": " + ec.message());
        }
    }

    if (!parser.is_complete()) {
        return Err<HttpResponse>("Connection to " + target + " closed before the response was complete");
    }

    boost::system::error_code shutdown_ec;
    socket.shutdown(tcp::socket::shutdown_both, shutdown_ec);

    spdlog::trace("{} {} -> {}", HttpMethodUtils::to_string(request.method), request.url,
                  parser.message().status_code);
    return Ok(parser.message());
}

} // namespace network
} // namespace stratus
