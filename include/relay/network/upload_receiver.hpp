#pragma once

#include "relay/network/http_server_asio.hpp"
#include "relay/network/http_types.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace relay {
namespace network {

/**
 * @brief In-memory server side of the resumable upload protocol
 *
 * Answers the same requests HttpDestination sends, keeping sessions and
 * finished objects in memory. Used by the HTTP integration tests and the
 * relay_receiver development tool.
 *
 * Faults are queued and consumed by upload PUTs in arrival order.
 */
class ResumableUploadReceiver {
public:
    struct Options {
        std::string upload_path = "/upload/drive/v3/files";
        std::string api_path = "/drive/v3";
        std::string access_token;                           ///< Required Bearer token, empty to accept any
        std::string link_base = "https://drive.local/file/d/";
    };

    struct PutFault {
        enum class Kind {
            Status,          ///< Answer `status` without storing anything
            DropResponse,    ///< Store the bytes, then close without answering
            PartialAccept    ///< Store only the first `accept_bytes` new bytes
        };

        Kind kind = Kind::Status;
        int status = 503;
        std::string reason;                 ///< Drive error reason, e.g. "rateLimitExceeded"
        std::uint64_t accept_bytes = 0;
    };

    ResumableUploadReceiver(asio::io_context& io_context,
                            uint16_t port,
                            Options options,
                            const std::string& address = "127.0.0.1");

    ResumableUploadReceiver(asio::io_context& io_context, uint16_t port)
        : ResumableUploadReceiver(io_context, port, Options{}) {}

    ResumableUploadReceiver(const ResumableUploadReceiver&) = delete;
    ResumableUploadReceiver& operator=(const ResumableUploadReceiver&) = delete;

    /// Route one request. Public so the protocol can be exercised without sockets.
    HttpResponse handle(const HttpRequest& request);

    void inject_put_fault(PutFault fault);

    uint16_t port() const { return server_.get_port(); }
    void stop() { server_.stop(); }

    std::optional<std::vector<uint8_t>> content(const std::string& object_id) const;
    std::vector<std::string> object_ids() const;
    bool is_published(const std::string& object_id) const;
    std::size_t put_count() const;
    std::size_t session_count() const;

private:
    struct Session {
        std::string name;
        std::string mime_type;
        std::vector<std::string> parents;
        std::optional<std::uint64_t> declared_total;
        bool include_link = false;
        std::vector<uint8_t> bytes;
        std::optional<std::string> object_id;
    };

    struct StoredObject {
        std::string name;
        std::string mime_type;
        std::vector<uint8_t> bytes;
        bool published = false;
    };

    HttpResponse create_session(const HttpRequest& request);
    HttpResponse upload(const HttpRequest& request);
    HttpResponse create_permission(const std::string& object_id);
    HttpResponse get_file(const std::string& object_id);

    // Caller holds mutex_.
    HttpResponse complete(Session& session);
    HttpResponse resume_incomplete(const Session& session) const;

    bool authorized(const HttpRequest& request) const;

    Options options_;
    HttpServerAsio server_;

    mutable std::mutex mutex_;
    std::map<std::string, Session> sessions_;
    std::map<std::string, StoredObject> objects_;
    std::deque<PutFault> put_faults_;
    std::size_t put_count_ = 0;
    std::uint64_t next_id_ = 0;
};

} // namespace network
} // namespace relay
