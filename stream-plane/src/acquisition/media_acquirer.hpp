#pragma once
#include <optional>
#include <string>
#include "acquisition/media_types.hpp"
#include "queue/queue_item.hpp"

namespace jukebox::stream::acquisition {

struct AcquireResult {
    std::optional<MediaAsset> asset;
    std::string reason; // set when asset is empty

    bool ok() const { return asset.has_value(); }

    static AcquireResult Success(MediaAsset a) { return AcquireResult{std::move(a), ""}; }
    static AcquireResult Failure(std::string why) { return AcquireResult{std::nullopt, std::move(why)}; }
};

// Fetches an attachment into the media directory and validates it.
class MediaAcquirer {
public:
    virtual ~MediaAcquirer() = default;
    virtual AcquireResult Acquire(const queue::AttachmentRef& attachment) = 0;
};

} // namespace jukebox::stream::acquisition
