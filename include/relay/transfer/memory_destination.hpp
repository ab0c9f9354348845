#pragma once

#include "relay/transfer/destination.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace relay::transfer {

/**
 * @brief In-process Destination keeping every object in memory
 *
 * Implements the resumable protocol faithfully: a push may start at or
 * below the confirmed offset (bytes already held are skipped), a push that
 * starts beyond it is rejected. Used for dry runs and tests.
 *
 * FAULT INJECTION:
 * Faults are queued per call kind and consumed one per call, in order.
 *
 * EXAMPLE:
 * MemoryDestination dest;
 * dest.inject_fault(MemoryDestination::CallKind::PushChunk,
 *                   MemoryDestination::Fault::transient(503));
 * // The next push fails with HTTP 503, the one after succeeds.
 *
 * THREAD SAFETY: all methods may be called concurrently.
 */
class MemoryDestination : public Destination {
public:
    enum class CallKind {
        CreateSession,
        PushChunk,
        QuerySession,
        Finalize,
        Publish,
        RetrieveLink,
        AbandonSession
    };

    enum class FaultKind {
        TransientStatus,   ///< Fail without applying anything
        PermanentStatus,   ///< Fail without applying anything, not retryable
        AckLost,           ///< Apply the call, then report an ambiguous failure
        PartialAccept      ///< Push only: keep the first accept_bytes new bytes
    };

    struct Fault {
        FaultKind kind = FaultKind::TransientStatus;
        int status_code = 503;
        std::uint64_t accept_bytes = 0;

        static Fault transient(int status = 503) { return {FaultKind::TransientStatus, status, 0}; }
        static Fault permanent(int status = 400) { return {FaultKind::PermanentStatus, status, 0}; }
        static Fault ack_lost() { return {FaultKind::AckLost, 0, 0}; }
        static Fault partial_accept(std::uint64_t bytes) { return {FaultKind::PartialAccept, 0, bytes}; }
    };

    struct CallRecord {
        CallKind kind = CallKind::CreateSession;
        std::string target;            ///< Session token or object id
        std::uint64_t offset = 0;      ///< Push only
        std::uint64_t length = 0;      ///< Push only
        bool succeeded = false;
    };

    using PushHook = std::function<void(std::uint64_t offset, std::size_t length)>;

    MemoryDestination() = default;

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

    // ════════════════════════════════════════════════════════
    // Test hooks
    // ════════════════════════════════════════════════════════

    void inject_fault(CallKind kind, Fault fault);
    void clear_faults();

    /// Called at the start of every push, outside the internal lock.
    void set_push_hook(PushHook hook);

    std::vector<CallRecord> calls() const;
    std::size_t count_calls(CallKind kind) const;

    /// Lengths of all push_chunk calls in call order, failed ones included.
    std::vector<std::uint64_t> push_lengths() const;

    std::uint64_t accepted_bytes(const SessionHandle& session) const;
    std::optional<std::vector<std::uint8_t>> content(const std::string& object_id) const;
    bool is_published(const std::string& object_id) const;
    std::size_t object_count() const;

    static std::string link_for(const std::string& object_id) { return "memory://objects/" + object_id; }

private:
    struct Session {
        SessionRequest request;
        std::vector<std::uint8_t> bytes;
        std::optional<std::string> object_id;   ///< Set once finalized
    };

    struct StoredObject {
        RemoteObject object;
        std::vector<std::uint8_t> bytes;
    };

    // Caller holds mutex_.
    std::optional<Fault> take_fault(CallKind kind);
    void record(CallKind kind, std::string target, std::uint64_t offset, std::uint64_t length, bool succeeded);

    static Error fault_error(const Fault& fault, const char* operation);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Session> sessions_;
    std::map<std::string, StoredObject> objects_;
    std::map<CallKind, std::deque<Fault>> faults_;
    std::vector<CallRecord> calls_;
    PushHook push_hook_;
    std::uint64_t next_session_ = 0;
    std::uint64_t next_object_ = 0;
};

} // namespace relay::transfer
