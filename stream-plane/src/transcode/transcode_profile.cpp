#include "transcode/transcode_profile.hpp"
#include <algorithm>
#include <cctype>

namespace jukebox::stream::transcode {

std::vector<std::string> BuildFfmpegCommand(const std::string& ffmpeg_path,
                                            const acquisition::MediaAsset& asset,
                                            const std::filesystem::path& hls_dir,
                                            const HlsSettings& settings) {
    const bool is_mp3 = asset.kind == acquisition::MediaKind::AUDIO && asset.format == "audio/mpeg";

    std::vector<std::string> cmd = {ffmpeg_path, "-y", "-nostdin"};

    // MP3 streams with large ID3 tags need a longer probe to find the first frame
    if (is_mp3) {
        cmd.insert(cmd.end(), {"-analyzeduration", "10M", "-probesize", "10M"});
    }
    cmd.insert(cmd.end(), {"-i", asset.path.string()});

    if (asset.kind == acquisition::MediaKind::VIDEO) {
        cmd.insert(cmd.end(), {
            "-c:v", "libx264",
            "-preset", "veryfast",
            "-tune", "zerolatency",
            "-profile:v", "main",
            "-level", "3.1",
            "-crf", "23",
            "-bufsize", "8192k",
            "-maxrate", "4096k",
            "-c:a", "aac",
            "-b:a", "128k",
            "-ar", "44100",
        });
    } else if (is_mp3) {
        cmd.insert(cmd.end(), {
            "-vn",
            "-c:a", "aac",
            "-b:a", "192k",
            "-ar", "44100",
            "-af", "aresample=async=1000",
            "-ac", "2",
            "-map", "0:a",
        });
    } else {
        cmd.insert(cmd.end(), {
            "-vn",
            "-c:a", "aac",
            "-b:a", "192k",
            "-ar", "44100",
        });
    }

    cmd.insert(cmd.end(), {
        "-f", "hls",
        "-hls_time", std::to_string(settings.segment_seconds),
        "-hls_list_size", std::to_string(settings.list_size),
        "-hls_flags", "delete_segments+independent_segments+append_list",
        "-hls_segment_type", "mpegts",
        "-hls_init_time", std::to_string(settings.init_time),
        "-hls_playlist_type", "event",
        "-hls_segment_filename", (hls_dir / kSegmentPattern).string(),
        (hls_dir / kPlaylistName).string(),
    });

    return cmd;
}

bool IsDiagnosticError(const std::string& line) {
    std::string lower = line;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("error") != std::string::npos || lower.find("fail") != std::string::npos;
}

} // namespace jukebox::stream::transcode
