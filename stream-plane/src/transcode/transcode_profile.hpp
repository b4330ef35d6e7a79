#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "acquisition/media_types.hpp"

namespace jukebox::stream::transcode {

// File names the segment server relies on
inline constexpr const char* kPlaylistName = "playlist.m3u8";
inline constexpr const char* kSegmentPattern = "segment_%03d.ts";

struct HlsSettings {
    int segment_seconds = 6;
    int list_size = 15;
    int init_time = 4;
};

// Full ffmpeg argv (argv[0] = ffmpeg_path) turning asset into an HLS event
// playlist inside hls_dir.
std::vector<std::string> BuildFfmpegCommand(const std::string& ffmpeg_path,
                                            const acquisition::MediaAsset& asset,
                                            const std::filesystem::path& hls_dir,
                                            const HlsSettings& settings = {});

// True for diagnostic lines worth surfacing: contains "error" or "fail", any case.
bool IsDiagnosticError(const std::string& line);

} // namespace jukebox::stream::transcode
