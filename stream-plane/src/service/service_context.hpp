#pragma once
#include <memory>
#include "service/config.hpp"

namespace jukebox::stream::utils { class Metrics; }
namespace jukebox::stream::storage { class ActiveAssetRegistry; }
namespace jukebox::stream::queue { class QueueSource; }
namespace jukebox::stream::acquisition { class MediaAcquirer; }

namespace jukebox::stream::service {

/*
  Shared handles built once in main and passed down explicitly.
*/
struct ServiceContext {
    Config config;
    std::shared_ptr<utils::Metrics> metrics;
    std::shared_ptr<storage::ActiveAssetRegistry> active_asset;
    std::shared_ptr<queue::QueueSource> queue_source;
    std::shared_ptr<acquisition::MediaAcquirer> acquirer;
};

} // namespace jukebox::stream::service
