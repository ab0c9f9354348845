#pragma once

#include <strings.h>

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace relay {
namespace network {

/**
 * @brief HTTP request methods used by the resumable upload protocol
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // Renamed to avoid the DELETE macro on some platforms
    HEAD,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

/**
 * @brief Status codes produced or interpreted by relay
 *
 * 308 is the resumable protocol's "Resume Incomplete": the session exists
 * and the Range header carries the persisted byte range.
 */
enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    RESUME_INCOMPLETE = 308,
    BAD_REQUEST = 400,
    UNAUTHORIZED = 401,
    FORBIDDEN = 403,
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    REQUEST_TIMEOUT = 408,
    TOO_MANY_REQUESTS = 429,
    INTERNAL_SERVER_ERROR = 500,
    NOT_IMPLEMENTED = 501,
    BAD_GATEWAY = 502,
    SERVICE_UNAVAILABLE = 503,
    GATEWAY_TIMEOUT = 504
};

using HttpHeaders = std::unordered_map<std::string, std::string>;

/**
 * @brief Case-insensitive header lookup (RFC 7230 field names)
 *
 * @return Header value if found, empty string otherwise
 */
inline std::string find_header(const HttpHeaders& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return "";
}

inline std::string version_to_string(HttpVersion version) {
    switch (version) {
        case HttpVersion::HTTP_1_0: return "HTTP/1.0";
        case HttpVersion::HTTP_1_1: return "HTTP/1.1";
        default: return "HTTP/1.1";
    }
}

class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        if (method_str == "HEAD") return HttpMethod::HEAD;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
            default: return "UNKNOWN";
        }
    }
};

/**
 * @brief An HTTP/1.1 request, parsed by the receiver or built by the client
 *
 * The body is a byte vector because chunk payloads are binary.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;                      // Request target, path plus optional query
    HttpVersion version = HttpVersion::HTTP_1_1;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::string get_header(const std::string& name) const { return find_header(headers, name); }

    bool has_header(const std::string& name) const { return !get_header(name).empty(); }

    void set_header(const std::string& name, const std::string& value) { headers[name] = value; }

    std::string body_as_string() const { return std::string(body.begin(), body.end()); }

    /// Path component of the target, without the query string.
    std::string path() const {
        const auto query = url.find('?');
        return query == std::string::npos ? url : url.substr(0, query);
    }

    /// Value of a query parameter, if present. No percent-decoding.
    std::optional<std::string> query_param(const std::string& name) const {
        const auto query = url.find('?');
        if (query == std::string::npos) {
            return std::nullopt;
        }
        std::istringstream pairs(url.substr(query + 1));
        std::string pair;
        while (std::getline(pairs, pair, '&')) {
            const auto eq = pair.find('=');
            if (pair.substr(0, eq) == name) {
                return eq == std::string::npos ? std::string() : pair.substr(eq + 1);
            }
        }
        return std::nullopt;
    }

    /**
     * @brief Serialize for transmission
     *
     * Content-Length is always written so an empty PUT is unambiguous.
     */
    std::vector<uint8_t> serialize() const {
        std::ostringstream oss;
        oss << HttpMethodUtils::to_string(method) << " " << url << " " << version_to_string(version) << "\r\n";
        for (const auto& [name, value] : headers) {
            if (strcasecmp(name.c_str(), "Content-Length") != 0) {
                oss << name << ": " << value << "\r\n";
            }
        }
        oss << "Content-Length: " << body.size() << "\r\n\r\n";

        std::string head = oss.str();
        std::vector<uint8_t> result(head.begin(), head.end());
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }
};

/**
 * @brief An HTTP/1.1 response
 *
 * Example:
 * HTTP/1.1 308 Resume Incomplete
 * Range: bytes=0-8388607
 * Content-Length: 0
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 200;
    std::string reason_phrase;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(get_reason_phrase(status)) {
        headers["Content-Length"] = "0";
    }

    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_body(const std::vector<uint8_t>& data) {
        body = data;
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_header(const std::string& name, const std::string& value) { headers[name] = value; }

    std::string get_header(const std::string& name) const { return find_header(headers, name); }

    std::string body_as_string() const { return std::string(body.begin(), body.end()); }

    bool is_success() const { return status_code >= 200 && status_code < 300; }

    std::vector<uint8_t> serialize() const {
        std::ostringstream oss;
        oss << version_to_string(version) << " " << status_code << " " << reason_phrase << "\r\n";
        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        oss << "\r\n";

        std::string head = oss.str();
        std::vector<uint8_t> result(head.begin(), head.end());
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }

    static std::string get_reason_phrase(HttpStatus status) {
        switch (status) {
            case HttpStatus::OK: return "OK";
            case HttpStatus::CREATED: return "Created";
            case HttpStatus::NO_CONTENT: return "No Content";
            case HttpStatus::RESUME_INCOMPLETE: return "Resume Incomplete";
            case HttpStatus::BAD_REQUEST: return "Bad Request";
            case HttpStatus::UNAUTHORIZED: return "Unauthorized";
            case HttpStatus::FORBIDDEN: return "Forbidden";
            case HttpStatus::NOT_FOUND: return "Not Found";
            case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
            case HttpStatus::REQUEST_TIMEOUT: return "Request Timeout";
            case HttpStatus::TOO_MANY_REQUESTS: return "Too Many Requests";
            case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
            case HttpStatus::NOT_IMPLEMENTED: return "Not Implemented";
            case HttpStatus::BAD_GATEWAY: return "Bad Gateway";
            case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
            case HttpStatus::GATEWAY_TIMEOUT: return "Gateway Timeout";
            default: return "Unknown";
        }
    }
};

} // namespace network
} // namespace relay
