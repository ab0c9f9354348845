#include "relay/transfer/mime.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace relay::transfer {
namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

const std::unordered_map<std::string, std::string>& extension_table() {
    static const std::unordered_map<std::string, std::string> table {
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"png", "image/png"},
        {"gif", "image/gif"},
        {"webp", "image/webp"},
        {"bmp", "image/bmp"},
        {"svg", "image/svg+xml"},
        {"pdf", "application/pdf"},
        {"zip", "application/zip"},
        {"gz", "application/gzip"},
        {"tar", "application/x-tar"},
        {"json", "application/json"},
        {"xml", "application/xml"},
        {"doc", "application/msword"},
        {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {"xls", "application/vnd.ms-excel"},
        {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {"ppt", "application/vnd.ms-powerpoint"},
        {"pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {"txt", "text/plain"},
        {"csv", "text/csv"},
        {"html", "text/html"},
        {"htm", "text/html"},
        {"mp4", "video/mp4"},
        {"avi", "video/x-msvideo"},
        {"mov", "video/quicktime"},
        {"mkv", "video/x-matroska"},
        {"webm", "video/webm"},
        {"mp3", "audio/mpeg"},
        {"ogg", "audio/ogg"},
        {"oga", "audio/ogg"},
        {"wav", "audio/wav"},
        {"m4a", "audio/mp4"},
        {"flac", "audio/flac"},
    };
    return table;
}

} // namespace

std::string mime_type_for(const std::string& file_name) {
    const auto dot = file_name.find_last_of('.');
    if (dot == std::string::npos || dot + 1 >= file_name.size()) {
        return kDefaultMimeType;
    }
    if (file_name.find_first_of("/\\", dot) != std::string::npos) {
        return kDefaultMimeType;
    }

    const auto& table = extension_table();
    const auto it = table.find(to_lower(file_name.substr(dot + 1)));
    return it != table.end() ? it->second : std::string(kDefaultMimeType);
}

std::optional<MediaKind> media_kind_from_string(const std::string& text) {
    const std::string lowered = to_lower(text);
    if (lowered == "document") return MediaKind::Document;
    if (lowered == "photo") return MediaKind::Photo;
    if (lowered == "video") return MediaKind::Video;
    if (lowered == "animation") return MediaKind::Animation;
    if (lowered == "audio") return MediaKind::Audio;
    if (lowered == "voice") return MediaKind::Voice;
    return std::nullopt;
}

std::string default_object_name(MediaKind kind, std::chrono::system_clock::time_point when) {
    const char* stem = "document";
    const char* extension = "";
    switch (kind) {
        case MediaKind::Document: stem = "document"; extension = ""; break;
        case MediaKind::Photo: stem = "photo"; extension = ".jpg"; break;
        case MediaKind::Video: stem = "video"; extension = ".mp4"; break;
        case MediaKind::Animation: stem = "animation"; extension = ".gif"; break;
        case MediaKind::Audio: stem = "audio"; extension = ".mp3"; break;
        case MediaKind::Voice: stem = "voice"; extension = ".ogg"; break;
    }

    const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << stem << "_" << std::put_time(&local, "%Y%m%d_%H%M%S") << extension;
    return oss.str();
}

} // namespace relay::transfer
