#pragma once

#include "relay/network/http_parser.hpp"
#include "relay/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <functional>
#include <memory>
#include <string>

namespace relay {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/// Status a handler returns to close the connection without answering.
inline constexpr int kCloseWithoutResponse = 0;

/**
 * @brief Per-connection handler for async HTTP requests
 *
 * Each accepted connection gets its own HttpConnection, kept alive by the
 * shared_ptr captured in its pending async operations. One request is
 * served per connection, then the socket is shut down.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, HttpRequestHandler handler);

    void start();

private:
    void do_read();
    void do_write(const HttpResponse& response);
    void handle_error(const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::array<char, 65536> buffer_;
};

/**
 * @brief Event-driven HTTP server using Boost.Asio
 *
 * Thread safety:
 * - Run io_context.run() in one or more threads
 * - The handler is called from io_context thread(s)
 *
 * Usage:
 * ```cpp
 * asio::io_context io_context;
 * HttpServerAsio server(io_context, 0, "127.0.0.1");   // 0 picks a free port
 * server.set_handler([](const HttpRequest& req) {
 *     return HttpResponse(HttpStatus::OK);
 * });
 * io_context.run();
 * ```
 */
class HttpServerAsio {
public:
    /**
     * @param io_context Event loop (must outlive this server)
     * @param port Port to listen on, 0 for an ephemeral port
     * @param address Local address to bind
     */
    HttpServerAsio(asio::io_context& io_context, uint16_t port, const std::string& address = "0.0.0.0");

    void set_handler(HttpRequestHandler handler);

    /// Actual listening port, resolved when 0 was requested.
    uint16_t get_port() const { return port_; }

    /// Stop accepting; connections in flight finish on their own.
    void stop();

private:
    void do_accept();

    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    uint16_t port_;
};

} // namespace network
} // namespace relay
