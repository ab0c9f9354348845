#include "relay/network/http_client.hpp"

#include "relay/network/http_parser.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <functional>
#include <optional>

namespace relay {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

constexpr std::chrono::milliseconds kPollInterval{20};

} // namespace

const char* to_string(ClientError::Kind kind) noexcept {
    switch (kind) {
        case ClientError::Kind::Resolve: return "resolve";
        case ClientError::Kind::Connect: return "connect";
        case ClientError::Kind::Send: return "send";
        case ClientError::Kind::Receive: return "receive";
        case ClientError::Kind::Timeout: return "timeout";
        case ClientError::Kind::Cancelled: return "cancelled";
        case ClientError::Kind::Protocol: return "protocol";
    }
    return "unknown";
}

HttpClient::HttpClient(std::string host, uint16_t port)
    : host_(std::move(host)), port_(port) {
}

relay::Result<HttpResponse, ClientError> HttpClient::send(HttpRequest request,
                                                          std::chrono::milliseconds timeout,
                                                          const relay::CancellationToken& cancel) const {
    request.set_header("Host", host_ + ":" + std::to_string(port_));
    request.set_header("Connection", "close");
    const std::vector<uint8_t> wire = request.serialize();

    asio::io_context io;
    tcp::resolver resolver(io);
    tcp::socket socket(io);
    HttpParser parser(MessageKind::Response);
    std::array<char, 16384> buffer{};

    bool done = false;
    bool request_sent = false;
    std::optional<ClientError> failure;

    // Handlers run on this thread only, inside io.run_for().
    auto fail = [&](ClientError::Kind kind, std::string message) {
        if (done) {
            return;
        }
        done = true;
        failure = ClientError{kind, std::move(message), request_sent};
        boost::system::error_code ignored;
        socket.close(ignored);
    };

    std::function<void()> do_read = [&]() {
        socket.async_read_some(asio::buffer(buffer), [&](boost::system::error_code ec, size_t n) {
            if (done) {
                return;
            }
            if (ec == asio::error::eof) {
                auto finished = parser.finish();
                if (finished.is_error()) {
                    fail(ClientError::Kind::Receive, finished.error());
                } else {
                    done = true;
                }
                return;
            }
            if (ec) {
                fail(ClientError::Kind::Receive, ec.message());
                return;
            }
            auto parsed = parser.parse(buffer.data(), n);
            if (parsed.is_error()) {
                fail(ClientError::Kind::Protocol, parsed.error());
                return;
            }
            if (parsed.value()) {
                done = true;
                return;
            }
            do_read();
        });
    };

    resolver.async_resolve(host_, std::to_string(port_),
        [&](boost::system::error_code ec, tcp::resolver::results_type endpoints) {
            if (done) {
                return;
            }
            if (ec) {
                fail(ClientError::Kind::Resolve, "Resolving " + host_ + ": " + ec.message());
                return;
            }
            asio::async_connect(socket, endpoints, [&](boost::system::error_code ec, const tcp::endpoint&) {
                if (done) {
                    return;
                }
                if (ec) {
                    fail(ClientError::Kind::Connect, "Connecting to " + host_ + ": " + ec.message());
                    return;
                }
                asio::async_write(socket, asio::buffer(wire), [&](boost::system::error_code ec, size_t) {
                    if (done) {
                        return;
                    }
                    if (ec) {
                        fail(ClientError::Kind::Send, ec.message());
                        return;
                    }
                    request_sent = true;
                    do_read();
                });
            });
        });

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done) {
        if (cancel.is_cancelled()) {
            fail(ClientError::Kind::Cancelled, "Request cancelled");
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            fail(ClientError::Kind::Timeout, "No response within " + std::to_string(timeout.count()) + "ms");
            break;
        }
        io.run_for(kPollInterval);
        if (io.stopped() && !done) {
            fail(ClientError::Kind::Protocol, "Exchange ended without a response");
        }
    }

    // Let aborted handlers run before the locals they reference go away.
    resolver.cancel();
    boost::system::error_code ignored;
    socket.close(ignored);
    io.restart();
    io.run();

    if (failure) {
        spdlog::debug("{} {}: {} failure: {}", HttpMethodUtils::to_string(request.method), request.url,
                      to_string(failure->kind), failure->message);
        return relay::Err(std::move(*failure));
    }
    return relay::Ok(parser.get_response());
}

} // namespace network
} // namespace relay
