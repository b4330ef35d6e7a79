#include "acquisition/media_types.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace jukebox::stream::acquisition {

std::string MediaKindToString(MediaKind kind) {
    switch (kind) {
        case MediaKind::VIDEO: return "video";
        case MediaKind::AUDIO: return "audio";
        default: return "unknown";
    }
}

std::optional<MediaKind> ClassifyFormat(const std::string& mime) {
    static const std::unordered_map<std::string, MediaKind> kSupported = {
        {"video/mp4", MediaKind::VIDEO},
        {"video/mpeg", MediaKind::VIDEO},
        {"video/avi", MediaKind::VIDEO},
        {"video/x-matroska", MediaKind::VIDEO},
        {"video/webm", MediaKind::VIDEO},
        {"video/quicktime", MediaKind::VIDEO},
        {"video/x-flv", MediaKind::VIDEO},
        {"audio/mpeg", MediaKind::AUDIO},
        {"audio/wav", MediaKind::AUDIO},
        {"audio/x-wav", MediaKind::AUDIO},
        {"audio/aac", MediaKind::AUDIO},
        {"audio/ogg", MediaKind::AUDIO},
        {"audio/flac", MediaKind::AUDIO},
        {"audio/x-m4a", MediaKind::AUDIO},
        {"audio/mp4", MediaKind::AUDIO},
    };

    std::string key = mime;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = kSupported.find(key);
    if (it == kSupported.end()) return std::nullopt;
    return it->second;
}

std::string FormatFromCaps(const std::string& caps_name, int mpegversion, const std::string& variant) {
    if (caps_name == "audio/mpeg") {
        // mpegversion 1 layer 1-3 is MP1/2/3; 2 and 4 are raw AAC (ADTS/ADIF)
        if (mpegversion == 2 || mpegversion == 4) return "audio/aac";
        return "audio/mpeg";
    }
    if (caps_name == "video/quicktime") {
        if (variant == "iso" || variant == "iso-fragmented") return "video/mp4";
        return "video/quicktime";
    }
    if (caps_name == "audio/x-m4a") return "audio/x-m4a";
    if (caps_name == "video/x-msvideo") return "video/avi";
    if (caps_name == "video/mpegts" || caps_name == "video/mpeg") return "video/mpeg";
    if (caps_name == "audio/x-flac") return "audio/flac";
    if (caps_name == "audio/x-wav") return "audio/x-wav";
    if (caps_name == "application/ogg" || caps_name == "audio/ogg") return "audio/ogg";
    if (caps_name == "application/x-id3") return "audio/mpeg";
    return caps_name;
}

std::string SanitizeFileName(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '.' || c == '_' || c == '-' || c == ' ') {
            out.push_back(c);
        }
    }

    // Trim surrounding spaces
    size_t begin = out.find_first_not_of(' ');
    size_t end = out.find_last_not_of(' ');
    out = (begin == std::string::npos) ? std::string() : out.substr(begin, end - begin + 1);

    if (out.find_first_not_of('.') == std::string::npos) return "media";
    return out;
}

} // namespace jukebox::stream::acquisition
