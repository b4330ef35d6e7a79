#include "acquisition/gst_media_acquirer.hpp"
#include "utils/logger.hpp"
#include "utils/metrics.hpp"
#include <gst/gst.h>
#include <gst/pbutils/pbutils.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace fs = std::filesystem;

namespace jukebox::stream::acquisition {

GstMediaAcquirer::GstMediaAcquirer(const AcquirerConfig& config, utils::Metrics& metrics)
    : config_(config), metrics_(metrics) {
    fs::create_directories(config_.media_dir);
}

std::string GstMediaAcquirer::ToUri(const std::string& location) {
    if (gst_uri_is_valid(location.c_str())) return location;

    GError* err = nullptr;
    gchar* uri = gst_filename_to_uri(location.c_str(), &err);
    if (!uri) {
        std::string msg = err ? err->message : "unknown error";
        g_clear_error(&err);
        throw std::runtime_error("Cannot convert path to URI: " + msg);
    }
    std::string result(uri);
    g_free(uri);
    return result;
}

AcquireResult GstMediaAcquirer::Acquire(const queue::AttachmentRef& attachment) {
    const std::string redacted = utils::Logger::RedactUrl(attachment.url);
    fs::path dest = DestinationFor(attachment);
    fs::path partial = dest;
    partial += ".part";

    spdlog::info("[acquire] Downloading {} -> {}", redacted, dest.string());

    std::string error;
    std::string uri;
    try {
        uri = ToUri(attachment.url);
    } catch (const std::exception& e) {
        metrics_.acquisitions_total("download_failed").Increment();
        return AcquireResult::Failure(e.what());
    }

    if (!Download(uri, partial, error)) {
        spdlog::warn("[acquire] Download of {} failed: {}", redacted, error);
        Discard(partial);
        metrics_.acquisitions_total("download_failed").Increment();
        return AcquireResult::Failure("download failed: " + error);
    }

    std::error_code ec;
    fs::rename(partial, dest, ec);
    if (ec) {
        Discard(partial);
        metrics_.acquisitions_total("download_failed").Increment();
        return AcquireResult::Failure("cannot move download into place: " + ec.message());
    }

    auto asset = Probe(dest, error);
    if (!asset) {
        spdlog::warn("[acquire] Rejecting {}: {}", dest.filename().string(), error);
        Discard(dest);
        metrics_.acquisitions_total("rejected").Increment();
        return AcquireResult::Failure(error);
    }

    spdlog::info("[acquire] Ready: {} ({} {}, {} bytes)", asset->path.filename().string(),
                 MediaKindToString(asset->kind), asset->format, asset->size_bytes);
    metrics_.acquisitions_total("ok").Increment();
    return AcquireResult::Success(std::move(*asset));
}

fs::path GstMediaAcquirer::DestinationFor(const queue::AttachmentRef& attachment) const {
    std::string name = attachment.name;
    if (name.empty()) {
        // Fall back to the last path segment of the URL, without query
        std::string url = attachment.url.substr(0, attachment.url.find_first_of("?#"));
        auto slash = url.find_last_of('/');
        name = (slash == std::string::npos) ? url : url.substr(slash + 1);
    }
    return config_.media_dir / SanitizeFileName(name);
}

bool GstMediaAcquirer::Download(const std::string& uri, const fs::path& dest, std::string& error) {
    GError* err = nullptr;
    GstElement* source = gst_element_make_from_uri(GST_URI_SRC, uri.c_str(), "src", &err);
    if (!source) {
        error = err ? err->message : "no source element for URI";
        g_clear_error(&err);
        return false;
    }

    GstElement* sink = gst_element_factory_make("filesink", "sink");
    if (!sink) {
        gst_object_unref(source);
        error = "filesink element unavailable";
        return false;
    }
    g_object_set(sink, "location", dest.c_str(), NULL);

    GstElement* pipeline = gst_pipeline_new("acquire_pipeline");
    gst_bin_add_many(GST_BIN(pipeline), source, sink, NULL);

    bool ok = false;
    if (!gst_element_link(source, sink)) {
        error = "failed to link source to filesink";
    } else if (gst_element_set_state(pipeline, GST_STATE_PLAYING) == GST_STATE_CHANGE_FAILURE) {
        error = "failed to set pipeline to PLAYING";
    } else {
        GstBus* bus = gst_element_get_bus(pipeline);
        auto timeout = static_cast<GstClockTime>(config_.download_timeout.count()) * GST_MSECOND;
        GstMessage* msg = gst_bus_timed_pop_filtered(
            bus, timeout, static_cast<GstMessageType>(GST_MESSAGE_ERROR | GST_MESSAGE_EOS));

        if (!msg) {
            error = "timed out after " + std::to_string(config_.download_timeout.count()) + " ms";
        } else if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_ERROR) {
            GError* gerr = nullptr;
            gchar* debug = nullptr;
            gst_message_parse_error(msg, &gerr, &debug);
            error = gerr ? gerr->message : "pipeline error";
            if (debug) spdlog::debug("[acquire] GStreamer debug: {}", debug);
            g_clear_error(&gerr);
            g_free(debug);
        } else {
            ok = true;
        }

        if (msg) gst_message_unref(msg);
        gst_object_unref(bus);
    }

    gst_element_set_state(pipeline, GST_STATE_NULL);
    gst_object_unref(pipeline);
    return ok;
}

std::optional<MediaAsset> GstMediaAcquirer::Probe(const fs::path& file, std::string& error) {
    std::error_code ec;
    uint64_t size = fs::file_size(file, ec);
    if (ec || size == 0) {
        error = "downloaded file is empty";
        return std::nullopt;
    }

    std::string uri = ToUri(fs::absolute(file).string());

    GError* err = nullptr;
    auto timeout = static_cast<GstClockTime>(config_.probe_timeout.count()) * GST_MSECOND;
    GstDiscoverer* discoverer = gst_discoverer_new(timeout, &err);
    if (!discoverer) {
        error = std::string("cannot create discoverer: ") + (err ? err->message : "unknown");
        g_clear_error(&err);
        return std::nullopt;
    }

    GstDiscovererInfo* info = gst_discoverer_discover_uri(discoverer, uri.c_str(), &err);
    g_clear_error(&err);

    std::optional<MediaAsset> asset;
    if (!info || gst_discoverer_info_get_result(info) != GST_DISCOVERER_OK) {
        error = "not a decodable media file";
    } else {
        bool has_video = false;
        GList* video = gst_discoverer_info_get_video_streams(info);
        for (GList* l = video; l != nullptr; l = l->next) {
            if (!gst_discoverer_video_info_is_image(GST_DISCOVERER_VIDEO_INFO(l->data))) has_video = true;
        }
        gst_discoverer_stream_info_list_free(video);

        GList* audio = gst_discoverer_info_get_audio_streams(info);
        bool has_audio = audio != nullptr;
        gst_discoverer_stream_info_list_free(audio);

        std::string format;
        GstDiscovererStreamInfo* top = gst_discoverer_info_get_stream_info(info);
        if (top) {
            GstCaps* caps = gst_discoverer_stream_info_get_caps(top);
            if (caps && gst_caps_get_size(caps) > 0) {
                const GstStructure* s = gst_caps_get_structure(caps, 0);
                int mpegversion = 0;
                gst_structure_get_int(s, "mpegversion", &mpegversion);
                const gchar* variant = gst_structure_get_string(s, "variant");
                format = FormatFromCaps(gst_structure_get_name(s), mpegversion, variant ? variant : "");
            }
            if (caps) gst_caps_unref(caps);
            gst_discoverer_stream_info_unref(top);
        }

        if (!has_video && !has_audio) {
            error = "no audio or video streams";
        } else if (!ClassifyFormat(format)) {
            error = "unsupported format '" + format + "'";
        } else {
            MediaKind kind = has_video ? MediaKind::VIDEO : MediaKind::AUDIO;
            if (kind == MediaKind::AUDIO && format == "video/mp4") format = "audio/mp4";
            asset = MediaAsset{file, kind, format, size};
        }
    }

    if (info) gst_discoverer_info_unref(info);
    g_object_unref(discoverer);
    return asset;
}

void GstMediaAcquirer::Discard(const fs::path& file) {
    std::error_code ec;
    fs::remove(file, ec);
    if (ec) {
        spdlog::warn("[acquire] Failed to delete {}: {}", file.string(), ec.message());
    }
}

} // namespace jukebox::stream::acquisition
