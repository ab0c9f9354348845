#include "relay/network/upload_receiver.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace relay {
namespace network {

using json = nlohmann::json;

namespace {

HttpResponse make_json_response(HttpStatus status, const json& body) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json; charset=UTF-8");
    response.set_body(body.dump());
    return response;
}

HttpResponse make_error(int status, const std::string& message, const std::string& reason = "") {
    json error;
    error["code"] = status;
    error["message"] = message;
    if (!reason.empty()) {
        error["errors"] = json::array({json{{"reason", reason}, {"message", message}}});
    }

    HttpResponse response;
    response.status_code = status;
    response.reason_phrase = HttpResponse::get_reason_phrase(static_cast<HttpStatus>(status));
    response.set_header("Content-Type", "application/json; charset=UTF-8");
    response.set_body(json{{"error", error}}.dump());
    return response;
}

bool parse_number(const std::string& text, std::uint64_t& value) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    value = std::strtoull(text.c_str(), nullptr, 10);
    return true;
}

struct ContentRange {
    bool status_query = false;   // "bytes */total"
    std::uint64_t first = 0;
    std::uint64_t last = 0;
    std::uint64_t total = 0;
};

std::optional<ContentRange> parse_content_range(const std::string& header) {
    const std::string prefix = "bytes ";
    if (header.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    const std::string range_text = header.substr(prefix.size());
    const auto slash = range_text.find('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }

    ContentRange range;
    if (!parse_number(range_text.substr(slash + 1), range.total)) {
        return std::nullopt;
    }

    const std::string span = range_text.substr(0, slash);
    if (span == "*") {
        range.status_query = true;
        return range;
    }
    const auto dash = span.find('-');
    if (dash == std::string::npos || !parse_number(span.substr(0, dash), range.first) ||
        !parse_number(span.substr(dash + 1), range.last) || range.last < range.first ||
        range.last >= range.total) {
        return std::nullopt;
    }
    return range;
}

// Path segment following `prefix`, e.g. "/drive/v3/files/<id>/permissions" -> "<id>"
std::string segment_after(const std::string& path, const std::string& prefix) {
    if (path.compare(0, prefix.size(), prefix) != 0) {
        return "";
    }
    const auto rest = path.substr(prefix.size());
    return rest.substr(0, rest.find('/'));
}

} // namespace

ResumableUploadReceiver::ResumableUploadReceiver(asio::io_context& io_context,
                                                 uint16_t port,
                                                 Options options,
                                                 const std::string& address)
    : options_(std::move(options))
    , server_(io_context, port, address) {
    server_.set_handler([this](const HttpRequest& request) { return handle(request); });
}

HttpResponse ResumableUploadReceiver::handle(const HttpRequest& request) {
    if (!authorized(request)) {
        return make_error(401, "Request had invalid authentication credentials", "authError");
    }

    const std::string path = request.path();
    const std::string files_prefix = options_.api_path + "/files/";

    if (path == options_.upload_path) {
        if (request.query_param("uploadType") != std::optional<std::string>("resumable")) {
            return make_error(400, "Only resumable uploads are supported", "badRequest");
        }
        if (request.method == HttpMethod::POST && !request.query_param("upload_id")) {
            return create_session(request);
        }
        if (request.method == HttpMethod::PUT) {
            return upload(request);
        }
        return make_error(405, "Method not allowed");
    }

    if (path.compare(0, files_prefix.size(), files_prefix) == 0) {
        const std::string object_id = segment_after(path, files_prefix);
        const std::string suffix = path.substr(files_prefix.size() + object_id.size());
        if (request.method == HttpMethod::POST && suffix == "/permissions") {
            return create_permission(object_id);
        }
        if (request.method == HttpMethod::GET && suffix.empty()) {
            return get_file(object_id);
        }
    }

    return make_error(404, "Not found: " + path, "notFound");
}

HttpResponse ResumableUploadReceiver::create_session(const HttpRequest& request) {
    Session session;

    if (!request.body.empty()) {
        auto metadata = json::parse(request.body_as_string(), nullptr, false);
        if (metadata.is_discarded() || !metadata.is_object()) {
            return make_error(400, "Invalid JSON metadata", "parseError");
        }
        for (const char* key : {"name", "mimeType"}) {
            if (metadata.contains(key) && !metadata[key].is_string()) {
                return make_error(400, std::string("Metadata field '") + key + "' must be a string", "invalid");
            }
        }
        session.name = metadata.value("name", "");
        session.mime_type = metadata.value("mimeType", "");
        if (metadata.contains("parents") && metadata["parents"].is_array()) {
            for (const auto& parent : metadata["parents"]) {
                if (parent.is_string()) {
                    session.parents.push_back(parent.get<std::string>());
                }
            }
        }
    }
    if (session.mime_type.empty()) {
        session.mime_type = request.get_header("X-Upload-Content-Type");
    }

    const std::string declared = request.get_header("X-Upload-Content-Length");
    if (!declared.empty()) {
        std::uint64_t total = 0;
        if (!parse_number(declared, total)) {
            return make_error(400, "Invalid X-Upload-Content-Length", "badContent");
        }
        session.declared_total = total;
    }

    const auto fields = request.query_param("fields");
    session.include_link = fields && fields->find("webViewLink") != std::string::npos;

    std::string upload_id;
    {
        std::lock_guard lock(mutex_);
        upload_id = "upload-" + std::to_string(++next_id_);
        sessions_.emplace(upload_id, std::move(session));
    }

    std::string host = request.get_header("Host");
    if (host.empty()) {
        host = "127.0.0.1:" + std::to_string(port());
    }

    HttpResponse response(HttpStatus::OK);
    response.set_header("Location",
                        "http://" + host + options_.upload_path + "?uploadType=resumable&upload_id=" + upload_id);
    spdlog::info("Receiver: opened session {}", upload_id);
    return response;
}

HttpResponse ResumableUploadReceiver::upload(const HttpRequest& request) {
    const auto upload_id = request.query_param("upload_id");
    if (!upload_id) {
        return make_error(400, "Missing upload_id", "badRequest");
    }

    const auto range = parse_content_range(request.get_header("Content-Range"));
    if (!range) {
        return make_error(400, "Invalid Content-Range '" + request.get_header("Content-Range") + "'", "badContent");
    }

    std::lock_guard lock(mutex_);
    ++put_count_;

    auto it = sessions_.find(*upload_id);
    if (it == sessions_.end()) {
        return make_error(404, "No such upload session", "notFound");
    }
    auto& session = it->second;

    if (session.declared_total && *session.declared_total != range->total) {
        return make_error(400, "Total size does not match X-Upload-Content-Length", "badContent");
    }

    std::optional<PutFault> fault;
    if (!range->status_query && !put_faults_.empty()) {
        fault = put_faults_.front();
        put_faults_.pop_front();
    }
    if (fault && fault->kind == PutFault::Kind::Status) {
        spdlog::info("Receiver: injected HTTP {} for {}", fault->status, *upload_id);
        return make_error(fault->status, "Injected failure", fault->reason);
    }

    if (session.object_id) {
        return complete(session);
    }

    if (!range->status_query) {
        const std::uint64_t persisted = session.bytes.size();
        if (request.body.size() != range->last - range->first + 1) {
            return make_error(400, "Body length does not match Content-Range", "badContent");
        }
        if (range->first > persisted) {
            return make_error(400, "Chunk starts beyond the persisted range", "badContent");
        }

        // Bytes below the persisted offset are already held.
        const std::uint64_t end = range->last + 1;
        if (end > persisted) {
            std::uint64_t fresh = end - persisted;
            if (fault && fault->kind == PutFault::Kind::PartialAccept) {
                fresh = std::min(fresh, fault->accept_bytes);
            }
            const auto first = request.body.begin() + static_cast<std::ptrdiff_t>(persisted - range->first);
            session.bytes.insert(session.bytes.end(), first, first + static_cast<std::ptrdiff_t>(fresh));
        }
    }

    HttpResponse response = session.bytes.size() == range->total ? complete(session) : resume_incomplete(session);
    if (fault && fault->kind == PutFault::Kind::DropResponse) {
        spdlog::info("Receiver: dropping response for {}", *upload_id);
        response = HttpResponse();
        response.status_code = kCloseWithoutResponse;
    }
    return response;
}

HttpResponse ResumableUploadReceiver::create_permission(const std::string& object_id) {
    std::lock_guard lock(mutex_);
    auto it = objects_.find(object_id);
    if (it == objects_.end()) {
        return make_error(404, "File not found: " + object_id, "notFound");
    }
    it->second.published = true;
    return make_json_response(HttpStatus::OK,
                              json{{"kind", "drive#permission"}, {"id", "anyoneWithLink"},
                                   {"type", "anyone"}, {"role", "reader"}});
}

HttpResponse ResumableUploadReceiver::get_file(const std::string& object_id) {
    std::lock_guard lock(mutex_);
    if (objects_.count(object_id) == 0) {
        return make_error(404, "File not found: " + object_id, "notFound");
    }
    return make_json_response(HttpStatus::OK,
                              json{{"id", object_id}, {"webViewLink", options_.link_base + object_id + "/view"}});
}

HttpResponse ResumableUploadReceiver::complete(Session& session) {
    if (!session.object_id) {
        const std::string id = "file-" + std::to_string(++next_id_);
        objects_.emplace(id, StoredObject{session.name, session.mime_type, session.bytes, false});
        session.object_id = id;
        spdlog::info("Receiver: stored {} ({} bytes) as {}", session.name, session.bytes.size(), id);
    }

    const auto& object = objects_.at(*session.object_id);
    json body;
    body["kind"] = "drive#file";
    body["id"] = *session.object_id;
    body["name"] = object.name;
    body["mimeType"] = object.mime_type;
    body["size"] = std::to_string(object.bytes.size());
    if (session.include_link) {
        body["webViewLink"] = options_.link_base + *session.object_id + "/view";
    }
    return make_json_response(HttpStatus::OK, body);
}

HttpResponse ResumableUploadReceiver::resume_incomplete(const Session& session) const {
    HttpResponse response(HttpStatus::RESUME_INCOMPLETE);
    if (!session.bytes.empty()) {
        response.set_header("Range", "bytes=0-" + std::to_string(session.bytes.size() - 1));
    }
    return response;
}

bool ResumableUploadReceiver::authorized(const HttpRequest& request) const {
    return options_.access_token.empty() ||
           request.get_header("Authorization") == "Bearer " + options_.access_token;
}

void ResumableUploadReceiver::inject_put_fault(PutFault fault) {
    std::lock_guard lock(mutex_);
    put_faults_.push_back(std::move(fault));
}

std::optional<std::vector<uint8_t>> ResumableUploadReceiver::content(const std::string& object_id) const {
    std::lock_guard lock(mutex_);
    auto it = objects_.find(object_id);
    if (it == objects_.end()) {
        return std::nullopt;
    }
    return it->second.bytes;
}

std::vector<std::string> ResumableUploadReceiver::object_ids() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, object] : objects_) {
        ids.push_back(id);
    }
    return ids;
}

bool ResumableUploadReceiver::is_published(const std::string& object_id) const {
    std::lock_guard lock(mutex_);
    auto it = objects_.find(object_id);
    return it != objects_.end() && it->second.published;
}

std::size_t ResumableUploadReceiver::put_count() const {
    std::lock_guard lock(mutex_);
    return put_count_;
}

std::size_t ResumableUploadReceiver::session_count() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}

} // namespace network
} // namespace relay
