#pragma once

#include "relay/core/cancellation.hpp"
#include "relay/core/result.hpp"
#include "relay/network/http_types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace relay {
namespace network {

/**
 * @brief Transport-level failure of one HTTP exchange
 *
 * `request_sent` is true once the whole request reached the socket. A
 * failure after that point leaves the outcome unknown: the server may have
 * acted on the request without the response making it back.
 */
struct ClientError {
    enum class Kind {
        Resolve,
        Connect,
        Send,
        Receive,
        Timeout,
        Cancelled,
        Protocol
    };

    Kind kind = Kind::Connect;
    std::string message;
    bool request_sent = false;
};

const char* to_string(ClientError::Kind kind) noexcept;

/**
 * @brief Minimal blocking HTTP/1.1 client on Boost.Asio
 *
 * Opens one connection per request and sends `Connection: close`, so
 * concurrent calls from different threads share nothing. Each call drives
 * its own io_context in short slices, checking the deadline and the
 * cancellation token between slices.
 *
 * Plain HTTP only.
 */
class HttpClient {
public:
    HttpClient(std::string host, uint16_t port);

    relay::Result<HttpResponse, ClientError> send(HttpRequest request,
                                                  std::chrono::milliseconds timeout,
                                                  const relay::CancellationToken& cancel) const;

    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] uint16_t port() const noexcept { return port_; }

private:
    std::string host_;
    uint16_t port_;
};

} // namespace network
} // namespace relay
