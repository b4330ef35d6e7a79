#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include "acquisition/media_acquirer.hpp"

namespace jukebox::stream::utils {
class Metrics;
}

namespace jukebox::stream::acquisition {

struct AcquirerConfig {
    std::filesystem::path media_dir;
    std::chrono::milliseconds download_timeout{300000};
    std::chrono::milliseconds probe_timeout{15000};
};

// Downloads through whatever GStreamer source element handles the URI scheme
// (souphttpsrc, filesrc, ...) into a filesink, then probes the result with
// GstDiscoverer. gst_init() must have been called.
class GstMediaAcquirer : public MediaAcquirer {
public:
    GstMediaAcquirer(const AcquirerConfig& config, utils::Metrics& metrics);

    AcquireResult Acquire(const queue::AttachmentRef& attachment) override;

    // Plain filesystem paths become file:// URIs, anything with a scheme is kept.
    static std::string ToUri(const std::string& location);

private:
    bool Download(const std::string& uri, const std::filesystem::path& dest, std::string& error);
    std::optional<MediaAsset> Probe(const std::filesystem::path& file, std::string& error);
    std::filesystem::path DestinationFor(const queue::AttachmentRef& attachment) const;
    void Discard(const std::filesystem::path& file);

    AcquirerConfig config_;
    utils::Metrics& metrics_;
};

} // namespace jukebox::stream::acquisition
