#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace jukebox::stream::acquisition {

enum class MediaKind {
    VIDEO,
    AUDIO
};

std::string MediaKindToString(MediaKind kind);

struct MediaAsset {
    std::filesystem::path path;
    MediaKind kind = MediaKind::VIDEO;
    std::string format;      // MIME-style container id, e.g. "audio/mpeg"
    uint64_t size_bytes = 0;
};

// Supported container formats. Anything else is rejected.
std::optional<MediaKind> ClassifyFormat(const std::string& mime);

// Maps a GStreamer caps structure name (plus the fields that disambiguate it)
// to the MIME id used by ClassifyFormat. Unknown names pass through unchanged.
std::string FormatFromCaps(const std::string& caps_name, int mpegversion = 0, const std::string& variant = "");

// Keeps alphanumerics and "._- ", drops everything else. Never returns an
// empty or dot-only name.
std::string SanitizeFileName(const std::string& name);

} // namespace jukebox::stream::acquisition
