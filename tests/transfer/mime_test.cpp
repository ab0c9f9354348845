#include "relay/transfer/mime.hpp"

#include <gtest/gtest.h>

#include <ctime>

using relay::transfer::MediaKind;
using relay::transfer::default_object_name;
using relay::transfer::kDefaultMimeType;
using relay::transfer::media_kind_from_string;
using relay::transfer::mime_type_for;

TEST(MimeTypeTest, KnownExtensions) {
    EXPECT_EQ(mime_type_for("holiday.jpg"), "image/jpeg");
    EXPECT_EQ(mime_type_for("report.PDF"), "application/pdf");
    EXPECT_EQ(mime_type_for("clip.final.mp4"), "video/mp4");
    EXPECT_EQ(mime_type_for("voice.ogg"), "audio/ogg");
    EXPECT_EQ(mime_type_for("data.json"), "application/json");
}

TEST(MimeTypeTest, UnknownOrMissingExtensionFallsBack) {
    EXPECT_EQ(mime_type_for("README"), kDefaultMimeType);
    EXPECT_EQ(mime_type_for("archive.xyz123"), kDefaultMimeType);
    EXPECT_EQ(mime_type_for("trailing."), kDefaultMimeType);
    EXPECT_EQ(mime_type_for("dir.d/file"), kDefaultMimeType);
    EXPECT_EQ(mime_type_for(""), kDefaultMimeType);
}

TEST(MediaKindTest, ParsesCaseInsensitively) {
    EXPECT_EQ(media_kind_from_string("photo"), MediaKind::Photo);
    EXPECT_EQ(media_kind_from_string("VIDEO"), MediaKind::Video);
    EXPECT_EQ(media_kind_from_string("Voice"), MediaKind::Voice);
    EXPECT_FALSE(media_kind_from_string("sticker").has_value());
}

TEST(DefaultObjectNameTest, UsesKindStemTimestampAndExtension) {
    std::tm local{};
    local.tm_year = 2024 - 1900;
    local.tm_mon = 0;
    local.tm_mday = 31;
    local.tm_hour = 14;
    local.tm_min = 25;
    local.tm_sec = 1;
    local.tm_isdst = -1;
    const auto when = std::chrono::system_clock::from_time_t(std::mktime(&local));

    EXPECT_EQ(default_object_name(MediaKind::Photo, when), "photo_20240131_142501.jpg");
    EXPECT_EQ(default_object_name(MediaKind::Video, when), "video_20240131_142501.mp4");
    EXPECT_EQ(default_object_name(MediaKind::Animation, when), "animation_20240131_142501.gif");
    EXPECT_EQ(default_object_name(MediaKind::Audio, when), "audio_20240131_142501.mp3");
    EXPECT_EQ(default_object_name(MediaKind::Voice, when), "voice_20240131_142501.ogg");
    EXPECT_EQ(default_object_name(MediaKind::Document, when), "document_20240131_142501");
}
