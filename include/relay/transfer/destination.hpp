#pragma once

#include "relay/core/cancellation.hpp"
#include "relay/core/error.hpp"
#include "relay/core/result.hpp"
#include "relay/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace relay::transfer {

/**
 * @brief Per-call limits passed to every destination operation
 *
 * The timeout bounds one call (one chunk push), never a whole transfer.
 */
struct CallOptions {
    std::chrono::milliseconds timeout{60000};
    relay::CancellationToken cancel;
};

struct SessionRequest {
    std::string name;
    std::string mime_type;
    std::string folder_id;
    std::optional<std::uint64_t> total_size;
};

/**
 * @brief Opaque handle for one resumable upload session
 *
 * For HTTP destinations the token is the session URI.
 */
struct SessionHandle {
    std::string token;
};

/**
 * @brief Resumable upload protocol consumed by the chunk uploader
 *
 * All offsets are absolute. push_chunk() and query_session() answer with
 * the destination's confirmed offset: the number of leading bytes it has
 * durably accepted. Re-sending bytes below that offset must not append them
 * twice.
 *
 * Implementations must allow independent sessions to be driven from
 * different threads at the same time.
 */
class Destination {
public:
    using Error = relay::DestinationError;

    virtual ~Destination() = default;

    virtual relay::Result<SessionHandle, Error> create_session(const SessionRequest& request,
                                                               const CallOptions& options) = 0;

    virtual relay::Result<std::uint64_t, Error> push_chunk(const SessionHandle& session,
                                                           std::uint64_t offset,
                                                           const std::vector<std::uint8_t>& payload,
                                                           std::uint64_t total_size,
                                                           const CallOptions& options) = 0;

    virtual relay::Result<std::uint64_t, Error> query_session(const SessionHandle& session,
                                                              std::uint64_t total_size,
                                                              const CallOptions& options) = 0;

    /// Complete the session and describe the object it produced.
    virtual relay::Result<RemoteObject, Error> finalize(const SessionHandle& session,
                                                        std::uint64_t total_size,
                                                        const CallOptions& options) = 0;

    /// Make the object readable by anyone holding its link.
    virtual relay::Result<void, Error> publish(const std::string& object_id,
                                               const CallOptions& options) = 0;

    virtual relay::Result<std::string, Error> retrieve_link(const std::string& object_id,
                                                            const CallOptions& options) = 0;

    /// The uploader gave up on `session`; drop any local state kept for it.
    virtual void abandon_session(const SessionHandle& session) { (void)session; }
};

} // namespace relay::transfer
