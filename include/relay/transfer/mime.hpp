#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace relay::transfer {

inline constexpr const char* kDefaultMimeType = "application/octet-stream";

/// MIME type from the name's extension (case-insensitive), octet-stream when unknown.
std::string mime_type_for(const std::string& file_name);

/**
 * @brief Kinds of inbound media that may arrive without a file name
 */
enum class MediaKind {
    Document,
    Photo,
    Video,
    Animation,
    Audio,
    Voice
};

std::optional<MediaKind> media_kind_from_string(const std::string& text);

/**
 * @brief Timestamped fallback name, e.g. "photo_20240131_142501.jpg"
 *
 * Uses local time. Documents get no extension.
 */
std::string default_object_name(MediaKind kind, std::chrono::system_clock::time_point when);

} // namespace relay::transfer
