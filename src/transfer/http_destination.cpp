#include "relay/transfer/http_destination.hpp"

#include "relay/transfer/retry.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>

namespace relay::transfer {

using json = nlohmann::json;
using relay::DestinationError;
using relay::network::ClientError;
using relay::network::HttpMethod;
using relay::network::HttpRequest;
using relay::network::HttpResponse;

namespace {

DestinationError from_client_error(const ClientError& error, const char* operation) {
    const std::string message = std::string(operation) + ": " + error.message;
    if (error.kind == ClientError::Kind::Cancelled) {
        return DestinationError::cancellation(message);
    }
    if (error.request_sent) {
        return DestinationError::lost_acknowledgement(message);
    }
    return DestinationError::transient(message);
}

// Empty when the key is absent or not a string.
std::string string_field(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

// Drive error bodies: {"error": {"code": 403, "message": "...", "errors": [{"reason": "..."}]}}
DestinationError from_response(const HttpResponse& response, const char* operation) {
    std::string reason;
    std::string detail = response.reason_phrase;

    auto body = json::parse(response.body_as_string(), nullptr, false);
    if (!body.is_discarded() && body.is_object() && body.contains("error") && body["error"].is_object()) {
        const auto& error = body["error"];
        if (error.contains("message") && error["message"].is_string()) {
            detail = error["message"].get<std::string>();
        }
        if (error.contains("errors") && error["errors"].is_array() && !error["errors"].empty() &&
            error["errors"][0].is_object()) {
            reason = string_field(error["errors"][0], "reason");
        }
    }

    std::string message = std::string(operation) + ": HTTP " + std::to_string(response.status_code);
    if (!detail.empty()) {
        message += " " + detail;
    }
    if (!reason.empty()) {
        message += " (" + reason + ")";
    }

    if (classify_http_status(response.status_code, reason) == relay::Retryability::Transient) {
        return DestinationError::transient(message, response.status_code);
    }
    return DestinationError::permanent(message, response.status_code);
}

relay::Result<RemoteObject, DestinationError> object_from_json(const HttpResponse& response, const char* operation) {
    auto body = json::parse(response.body_as_string(), nullptr, false);
    if (body.is_discarded() || !body.is_object() || !body.contains("id") || !body["id"].is_string()) {
        return relay::Err(DestinationError::permanent(std::string(operation) + ": response carries no object id",
                                                      response.status_code));
    }

    RemoteObject object;
    object.id = body["id"].get<std::string>();
    object.name = string_field(body, "name");
    object.mime_type = string_field(body, "mimeType");
    object.link = string_field(body, "webViewLink");

    // Drive encodes int64 fields as strings.
    if (body.contains("size")) {
        const auto& size = body["size"];
        if (size.is_number_unsigned()) {
            object.size = size.get<std::uint64_t>();
        } else if (size.is_string()) {
            object.size = std::strtoull(size.get<std::string>().c_str(), nullptr, 10);
        }
    }
    return relay::Ok(std::move(object));
}

std::string content_range(std::uint64_t offset, std::size_t length, std::uint64_t total) {
    if (length == 0) {
        return "bytes */" + std::to_string(total);
    }
    return "bytes " + std::to_string(offset) + "-" + std::to_string(offset + length - 1) + "/" +
           std::to_string(total);
}

} // namespace

std::string session_target(const std::string& location) {
    const auto scheme = location.find("://");
    if (scheme == std::string::npos) {
        return location;
    }
    const auto path = location.find('/', scheme + 3);
    return path == std::string::npos ? "/" : location.substr(path);
}

std::optional<std::uint64_t> parse_confirmed_range(const std::string& range_header) {
    if (range_header.empty()) {
        return std::uint64_t{0};
    }
    const std::string prefix = "bytes=0-";
    if (range_header.compare(0, prefix.size(), prefix) != 0 || range_header.size() == prefix.size()) {
        return std::nullopt;
    }
    const std::string last = range_header.substr(prefix.size());
    for (char c : last) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    return std::strtoull(last.c_str(), nullptr, 10) + 1;
}

HttpDestination::HttpDestination(HttpDestinationOptions options)
    : options_(std::move(options)),
      client_(options_.host, options_.port) {
}

relay::Result<SessionHandle, DestinationError> HttpDestination::create_session(const SessionRequest& request,
                                                                               const CallOptions& options) {
    json metadata;
    metadata["name"] = request.name;
    metadata["mimeType"] = request.mime_type;
    if (!request.folder_id.empty()) {
        metadata["parents"] = json::array({request.folder_id});
    }

    HttpRequest http;
    http.method = HttpMethod::POST;
    http.url = options_.upload_path + "?uploadType=resumable&fields=id,name,mimeType,size,webViewLink";
    http.set_header("Content-Type", "application/json; charset=UTF-8");
    http.set_header("X-Upload-Content-Type", request.mime_type);
    if (request.total_size) {
        http.set_header("X-Upload-Content-Length", std::to_string(*request.total_size));
    }
    const std::string text = metadata.dump();
    http.body.assign(text.begin(), text.end());

    auto response = exchange(std::move(http), options, "create-session");
    if (response.is_error()) {
        return relay::Err(response.error());
    }
    if (!response.value().is_success()) {
        return relay::Err(from_response(response.value(), "create-session"));
    }

    const std::string location = response.value().get_header("Location");
    if (location.empty()) {
        return relay::Err(DestinationError::permanent("create-session: response has no Location header",
                                                      response.value().status_code));
    }

    spdlog::debug("Opened resumable session {}", location);
    return relay::Ok(SessionHandle{session_target(location)});
}

relay::Result<std::uint64_t, DestinationError> HttpDestination::push_chunk(const SessionHandle& session,
                                                                           std::uint64_t offset,
                                                                           const std::vector<std::uint8_t>& payload,
                                                                           std::uint64_t total_size,
                                                                           const CallOptions& options) {
    HttpRequest http;
    http.method = HttpMethod::PUT;
    http.url = session.token;
    http.set_header("Content-Range", content_range(offset, payload.size(), total_size));
    http.body = payload;

    auto response = exchange(std::move(http), options, "push");
    if (response.is_error()) {
        return relay::Err(response.error());
    }
    return interpret_upload_status(session, response.value(), total_size, "push");
}

relay::Result<std::uint64_t, DestinationError> HttpDestination::query_session(const SessionHandle& session,
                                                                              std::uint64_t total_size,
                                                                              const CallOptions& options) {
    HttpRequest http;
    http.method = HttpMethod::PUT;
    http.url = session.token;
    http.set_header("Content-Range", content_range(0, 0, total_size));

    auto response = exchange(std::move(http), options, "query");
    if (response.is_error()) {
        return relay::Err(response.error());
    }
    return interpret_upload_status(session, response.value(), total_size, "query");
}

relay::Result<RemoteObject, DestinationError> HttpDestination::finalize(const SessionHandle& session,
                                                                        std::uint64_t total_size,
                                                                        const CallOptions& options) {
    if (auto object = take_completed(session.token)) {
        return relay::Ok(std::move(*object));
    }

    auto confirmed = query_session(session, total_size, options);
    if (confirmed.is_error()) {
        return relay::Err(confirmed.error());
    }
    if (auto object = take_completed(session.token)) {
        return relay::Ok(std::move(*object));
    }
    return relay::Err(DestinationError::permanent("finalize: destination holds " +
                                                  std::to_string(confirmed.value()) + " of " +
                                                  std::to_string(total_size) + " bytes"));
}

relay::Result<void, DestinationError> HttpDestination::publish(const std::string& object_id,
                                                               const CallOptions& options) {
    const std::string text = json{{"role", "reader"}, {"type", "anyone"}}.dump();

    HttpRequest http;
    http.method = HttpMethod::POST;
    http.url = options_.api_path + "/files/" + object_id + "/permissions";
    http.set_header("Content-Type", "application/json; charset=UTF-8");
    http.body.assign(text.begin(), text.end());

    auto response = exchange(std::move(http), options, "publish");
    if (response.is_error()) {
        return relay::Err(response.error());
    }
    if (!response.value().is_success()) {
        return relay::Err(from_response(response.value(), "publish"));
    }
    return relay::Ok();
}

relay::Result<std::string, DestinationError> HttpDestination::retrieve_link(const std::string& object_id,
                                                                            const CallOptions& options) {
    HttpRequest http;
    http.method = HttpMethod::GET;
    http.url = options_.api_path + "/files/" + object_id + "?fields=id,webViewLink";

    auto response = exchange(std::move(http), options, "retrieve-link");
    if (response.is_error()) {
        return relay::Err(response.error());
    }
    if (!response.value().is_success()) {
        return relay::Err(from_response(response.value(), "retrieve-link"));
    }

    auto body = json::parse(response.value().body_as_string(), nullptr, false);
    if (body.is_discarded() || !body.is_object() || !body.contains("webViewLink") ||
        !body["webViewLink"].is_string()) {
        return relay::Err(DestinationError::permanent("retrieve-link: no webViewLink for " + object_id,
                                                      response.value().status_code));
    }
    return relay::Ok(body["webViewLink"].get<std::string>());
}

relay::Result<HttpResponse, DestinationError> HttpDestination::exchange(HttpRequest request,
                                                                        const CallOptions& options,
                                                                        const char* operation) const {
    if (!options_.access_token.empty()) {
        request.set_header("Authorization", "Bearer " + options_.access_token);
    }

    auto response = client_.send(std::move(request), options.timeout, options.cancel);
    if (response.is_error()) {
        return relay::Err(from_client_error(response.error(), operation));
    }
    return relay::Ok(std::move(response.value()));
}

relay::Result<std::uint64_t, DestinationError> HttpDestination::interpret_upload_status(
    const SessionHandle& session,
    const HttpResponse& response,
    std::uint64_t total_size,
    const char* operation) {

    if (response.status_code == static_cast<int>(network::HttpStatus::RESUME_INCOMPLETE)) {
        auto confirmed = parse_confirmed_range(response.get_header("Range"));
        if (!confirmed) {
            return relay::Err(DestinationError::permanent(std::string(operation) + ": malformed Range header '" +
                                                          response.get_header("Range") + "'", 308));
        }
        return relay::Ok(*confirmed);
    }

    if (response.status_code == 200 || response.status_code == 201) {
        auto object = object_from_json(response, operation);
        if (object.is_error()) {
            return relay::Err(object.error());
        }
        std::lock_guard lock(completed_mutex_);
        completed_[session.token] = std::move(object.value());
        return relay::Ok(total_size);
    }

    if (response.status_code == 404 || response.status_code == 410) {
        return relay::Err(DestinationError::permanent(std::string(operation) + ": upload session expired",
                                                      response.status_code));
    }
    return relay::Err(from_response(response, operation));
}

void HttpDestination::abandon_session(const SessionHandle& session) {
    std::lock_guard lock(completed_mutex_);
    completed_.erase(session.token);
}

std::size_t HttpDestination::pending_completions() {
    std::lock_guard lock(completed_mutex_);
    return completed_.size();
}

std::optional<RemoteObject> HttpDestination::take_completed(const std::string& session_token) {
    std::lock_guard lock(completed_mutex_);
    auto it = completed_.find(session_token);
    if (it == completed_.end()) {
        return std::nullopt;
    }
    RemoteObject object = std::move(it->second);
    completed_.erase(it);
    return object;
}

} // namespace relay::transfer
