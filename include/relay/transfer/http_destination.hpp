#pragma once

#include "relay/network/http_client.hpp"
#include "relay/network/http_types.hpp"
#include "relay/transfer/destination.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace relay::transfer {

struct HttpDestinationOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 80;
    std::string upload_path = "/upload/drive/v3/files";
    std::string api_path = "/drive/v3";
    std::string access_token;   ///< Sent as a Bearer token when non-empty
};

/**
 * @brief Destination speaking the Drive v3 resumable upload protocol
 *
 * PROTOCOL:
 * - create_session: POST {upload_path}?uploadType=resumable with the object
 *   metadata as JSON; the Location header names the session
 * - push_chunk: PUT {session} with Content-Range: bytes a-b/total.
 *   308 + Range: bytes=0-N confirms N+1 bytes, 200/201 completes the upload
 * - query_session / finalize: PUT {session} with Content-Range: bytes * /total
 *   and an empty body
 * - publish: POST {api_path}/files/{id}/permissions {"role":"reader","type":"anyone"}
 * - retrieve_link: GET {api_path}/files/{id}?fields=id,webViewLink
 *
 * A transport failure after the request was fully written is reported as an
 * ambiguous (lost acknowledgement) error.
 */
class HttpDestination : public Destination {
public:
    explicit HttpDestination(HttpDestinationOptions options);

    relay::Result<SessionHandle, Error> create_session(const SessionRequest& request,
                                                       const CallOptions& options) override;

    relay::Result<std::uint64_t, Error> push_chunk(const SessionHandle& session,
                                                   std::uint64_t offset,
                                                   const std::vector<std::uint8_t>& payload,
                                                   std::uint64_t total_size,
                                                   const CallOptions& options) override;

    relay::Result<std::uint64_t, Error> query_session(const SessionHandle& session,
                                                      std::uint64_t total_size,
                                                      const CallOptions& options) override;

    relay::Result<RemoteObject, Error> finalize(const SessionHandle& session,
                                                std::uint64_t total_size,
                                                const CallOptions& options) override;

    relay::Result<void, Error> publish(const std::string& object_id, const CallOptions& options) override;

    relay::Result<std::string, Error> retrieve_link(const std::string& object_id,
                                                    const CallOptions& options) override;

    void abandon_session(const SessionHandle& session) override;

    /// Sessions whose completed object is held until finalize() collects it.
    [[nodiscard]] std::size_t pending_completions();

    [[nodiscard]] const HttpDestinationOptions& options() const noexcept { return options_; }

private:
    relay::Result<network::HttpResponse, Error> exchange(network::HttpRequest request,
                                                         const CallOptions& options,
                                                         const char* operation) const;

    /// Handles a PUT answer: 308 -> confirmed offset, 200/201 -> total (object cached).
    relay::Result<std::uint64_t, Error> interpret_upload_status(const SessionHandle& session,
                                                                const network::HttpResponse& response,
                                                                std::uint64_t total_size,
                                                                const char* operation);

    std::optional<RemoteObject> take_completed(const std::string& session_token);

    HttpDestinationOptions options_;
    network::HttpClient client_;

    // Upload responses that already carried the finished object, by session.
    std::mutex completed_mutex_;
    std::unordered_map<std::string, RemoteObject> completed_;
};

/// Request target of a session URI; absolute URIs are reduced to path and query.
std::string session_target(const std::string& location);

/// Confirmed byte count from a "bytes=0-N" Range header, 0 when absent.
std::optional<std::uint64_t> parse_confirmed_range(const std::string& range_header);

} // namespace relay::transfer
