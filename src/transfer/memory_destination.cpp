#include "relay/transfer/memory_destination.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace relay::transfer {

using relay::DestinationError;

relay::Result<SessionHandle, DestinationError> MemoryDestination::create_session(const SessionRequest& request,
                                                                                 const CallOptions& options) {
    if (options.cancel.is_cancelled()) {
        return relay::Err(DestinationError::cancellation());
    }

    std::lock_guard lock(mutex_);
    auto fault = take_fault(CallKind::CreateSession);
    if (fault && fault->kind != FaultKind::AckLost) {
        record(CallKind::CreateSession, {}, 0, 0, false);
        return relay::Err(fault_error(*fault, "create-session"));
    }

    SessionHandle handle{"mem-session-" + std::to_string(++next_session_)};
    sessions_.emplace(handle.token, Session{request, {}, std::nullopt});
    record(CallKind::CreateSession, handle.token, 0, 0, !fault);

    if (fault) {
        return relay::Err(fault_error(*fault, "create-session"));
    }
    return relay::Ok(std::move(handle));
}

relay::Result<std::uint64_t, DestinationError> MemoryDestination::push_chunk(const SessionHandle& session,
                                                                             std::uint64_t offset,
                                                                             const std::vector<std::uint8_t>& payload,
                                                                             std::uint64_t total_size,
                                                                             const CallOptions& options) {
    PushHook hook;
    {
        std::lock_guard lock(mutex_);
        hook = push_hook_;
    }
    if (hook) {
        hook(offset, payload.size());
    }

    if (options.cancel.is_cancelled()) {
        return relay::Err(DestinationError::cancellation());
    }

    std::lock_guard lock(mutex_);
    auto it = sessions_.find(session.token);
    if (it == sessions_.end()) {
        record(CallKind::PushChunk, session.token, offset, payload.size(), false);
        return relay::Err(DestinationError::permanent("Unknown upload session: " + session.token, 404));
    }

    auto& bytes = it->second.bytes;
    const std::uint64_t persisted = bytes.size();

    if (offset > persisted) {
        record(CallKind::PushChunk, session.token, offset, payload.size(), false);
        return relay::Err(DestinationError::permanent(
            "Chunk at offset " + std::to_string(offset) + " leaves a gap after " + std::to_string(persisted), 400));
    }
    if (offset + payload.size() > total_size) {
        record(CallKind::PushChunk, session.token, offset, payload.size(), false);
        return relay::Err(DestinationError::permanent("Chunk extends beyond the declared total", 400));
    }

    auto fault = take_fault(CallKind::PushChunk);
    if (fault && (fault->kind == FaultKind::TransientStatus || fault->kind == FaultKind::PermanentStatus)) {
        record(CallKind::PushChunk, session.token, offset, payload.size(), false);
        return relay::Err(fault_error(*fault, "push"));
    }

    // Bytes below the persisted offset are already held.
    const std::uint64_t end = offset + payload.size();
    if (end > persisted) {
        std::uint64_t fresh = end - persisted;
        if (fault && fault->kind == FaultKind::PartialAccept) {
            fresh = std::min(fresh, fault->accept_bytes);
        }
        const auto first = payload.begin() + static_cast<std::ptrdiff_t>(persisted - offset);
        bytes.insert(bytes.end(), first, first + static_cast<std::ptrdiff_t>(fresh));
    }

    const bool acknowledged = !fault || fault->kind != FaultKind::AckLost;
    record(CallKind::PushChunk, session.token, offset, payload.size(), acknowledged);
    if (!acknowledged) {
        spdlog::debug("MemoryDestination: dropping acknowledgement for {} at offset {}", session.token, offset);
        return relay::Err(fault_error(*fault, "push"));
    }
    return relay::Ok(static_cast<std::uint64_t>(bytes.size()));
}

relay::Result<std::uint64_t, DestinationError> MemoryDestination::query_session(const SessionHandle& session,
                                                                                std::uint64_t /*total_size*/,
                                                                                const CallOptions& options) {
    if (options.cancel.is_cancelled()) {
        return relay::Err(DestinationError::cancellation());
    }

    std::lock_guard lock(mutex_);
    auto fault = take_fault(CallKind::QuerySession);
    if (fault && fault->kind != FaultKind::AckLost) {
        record(CallKind::QuerySession, session.token, 0, 0, false);
        return relay::Err(fault_error(*fault, "query"));
    }

    auto it = sessions_.find(session.token);
    if (it == sessions_.end()) {
        record(CallKind::QuerySession, session.token, 0, 0, false);
        return relay::Err(DestinationError::permanent("Unknown upload session: " + session.token, 404));
    }

    record(CallKind::QuerySession, session.token, 0, 0, !fault);
    if (fault) {
        return relay::Err(fault_error(*fault, "query"));
    }
    return relay::Ok(static_cast<std::uint64_t>(it->second.bytes.size()));
}

relay::Result<RemoteObject, DestinationError> MemoryDestination::finalize(const SessionHandle& session,
                                                                          std::uint64_t total_size,
                                                                          const CallOptions& options) {
    if (options.cancel.is_cancelled()) {
        return relay::Err(DestinationError::cancellation());
    }

    std::lock_guard lock(mutex_);
    auto fault = take_fault(CallKind::Finalize);
    if (fault && fault->kind != FaultKind::AckLost) {
        record(CallKind::Finalize, session.token, 0, 0, false);
        return relay::Err(fault_error(*fault, "finalize"));
    }

    auto it = sessions_.find(session.token);
    if (it == sessions_.end()) {
        record(CallKind::Finalize, session.token, 0, 0, false);
        return relay::Err(DestinationError::permanent("Unknown upload session: " + session.token, 404));
    }

    auto& state = it->second;
    if (state.bytes.size() != total_size) {
        record(CallKind::Finalize, session.token, 0, 0, false);
        return relay::Err(DestinationError::permanent(
            "Session holds " + std::to_string(state.bytes.size()) + " of " + std::to_string(total_size) + " bytes",
            400));
    }

    // Finalizing twice returns the same object.
    if (!state.object_id) {
        const std::string id = "mem-object-" + std::to_string(++next_object_);
        RemoteObject object;
        object.id = id;
        object.name = state.request.name;
        object.mime_type = state.request.mime_type;
        object.size = total_size;
        objects_.emplace(id, StoredObject{object, state.bytes});
        state.object_id = id;
    }

    record(CallKind::Finalize, session.token, 0, 0, !fault);
    if (fault) {
        return relay::Err(fault_error(*fault, "finalize"));
    }
    return relay::Ok(objects_.at(*state.object_id).object);
}

relay::Result<void, DestinationError> MemoryDestination::publish(const std::string& object_id,
                                                                 const CallOptions& options) {
    if (options.cancel.is_cancelled()) {
        return relay::Err(DestinationError::cancellation());
    }

    std::lock_guard lock(mutex_);
    auto fault = take_fault(CallKind::Publish);
    if (fault && fault->kind != FaultKind::AckLost) {
        record(CallKind::Publish, object_id, 0, 0, false);
        return relay::Err(fault_error(*fault, "publish"));
    }

    auto it = objects_.find(object_id);
    if (it == objects_.end()) {
        record(CallKind::Publish, object_id, 0, 0, false);
        return relay::Err(DestinationError::permanent("Unknown object: " + object_id, 404));
    }

    it->second.object.published = true;
    record(CallKind::Publish, object_id, 0, 0, !fault);
    if (fault) {
        return relay::Err(fault_error(*fault, "publish"));
    }
    return relay::Ok();
}

relay::Result<std::string, DestinationError> MemoryDestination::retrieve_link(const std::string& object_id,
                                                                              const CallOptions& options) {
    if (options.cancel.is_cancelled()) {
        return relay::Err(DestinationError::cancellation());
    }

    std::lock_guard lock(mutex_);
    auto fault = take_fault(CallKind::RetrieveLink);
    if (fault && fault->kind != FaultKind::AckLost) {
        record(CallKind::RetrieveLink, object_id, 0, 0, false);
        return relay::Err(fault_error(*fault, "retrieve-link"));
    }

    if (objects_.count(object_id) == 0) {
        record(CallKind::RetrieveLink, object_id, 0, 0, false);
        return relay::Err(DestinationError::permanent("Unknown object: " + object_id, 404));
    }

    record(CallKind::RetrieveLink, object_id, 0, 0, !fault);
    if (fault) {
        return relay::Err(fault_error(*fault, "retrieve-link"));
    }
    return relay::Ok(link_for(object_id));
}

void MemoryDestination::abandon_session(const SessionHandle& session) {
    std::lock_guard lock(mutex_);
    record(CallKind::AbandonSession, session.token, 0, 0, true);
}

void MemoryDestination::inject_fault(CallKind kind, Fault fault) {
    std::lock_guard lock(mutex_);
    faults_[kind].push_back(fault);
}

void MemoryDestination::clear_faults() {
    std::lock_guard lock(mutex_);
    faults_.clear();
}

void MemoryDestination::set_push_hook(PushHook hook) {
    std::lock_guard lock(mutex_);
    push_hook_ = std::move(hook);
}

std::vector<MemoryDestination::CallRecord> MemoryDestination::calls() const {
    std::lock_guard lock(mutex_);
    return calls_;
}

std::size_t MemoryDestination::count_calls(CallKind kind) const {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(std::count_if(calls_.begin(), calls_.end(),
                                                  [kind](const CallRecord& call) { return call.kind == kind; }));
}

std::vector<std::uint64_t> MemoryDestination::push_lengths() const {
    std::lock_guard lock(mutex_);
    std::vector<std::uint64_t> lengths;
    for (const auto& call : calls_) {
        if (call.kind == CallKind::PushChunk) {
            lengths.push_back(call.length);
        }
    }
    return lengths;
}

std::uint64_t MemoryDestination::accepted_bytes(const SessionHandle& session) const {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(session.token);
    return it == sessions_.end() ? 0 : it->second.bytes.size();
}

std::optional<std::vector<std::uint8_t>> MemoryDestination::content(const std::string& object_id) const {
    std::lock_guard lock(mutex_);
    auto it = objects_.find(object_id);
    if (it == objects_.end()) {
        return std::nullopt;
    }
    return it->second.bytes;
}

bool MemoryDestination::is_published(const std::string& object_id) const {
    std::lock_guard lock(mutex_);
    auto it = objects_.find(object_id);
    return it != objects_.end() && it->second.object.published;
}

std::size_t MemoryDestination::object_count() const {
    std::lock_guard lock(mutex_);
    return objects_.size();
}

std::optional<MemoryDestination::Fault> MemoryDestination::take_fault(CallKind kind) {
    auto it = faults_.find(kind);
    if (it == faults_.end() || it->second.empty()) {
        return std::nullopt;
    }
    Fault fault = it->second.front();
    it->second.pop_front();
    return fault;
}

void MemoryDestination::record(CallKind kind, std::string target, std::uint64_t offset,
                               std::uint64_t length, bool succeeded) {
    calls_.push_back(CallRecord{kind, std::move(target), offset, length, succeeded});
}

DestinationError MemoryDestination::fault_error(const Fault& fault, const char* operation) {
    const std::string prefix = std::string("Injected ") + operation + " fault";
    switch (fault.kind) {
        case FaultKind::TransientStatus:
            return DestinationError::transient(prefix + ": HTTP " + std::to_string(fault.status_code),
                                               fault.status_code);
        case FaultKind::PermanentStatus:
            return DestinationError::permanent(prefix + ": HTTP " + std::to_string(fault.status_code),
                                               fault.status_code);
        case FaultKind::AckLost:
        case FaultKind::PartialAccept:
            break;
    }
    return DestinationError::lost_acknowledgement(prefix + ": acknowledgement lost");
}

} // namespace relay::transfer
