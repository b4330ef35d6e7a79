#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace jukebox::stream::utils {
class Metrics;
}

namespace jukebox::stream::storage {

class ActiveAssetRegistry;

struct ReclaimConfig {
    std::filesystem::path media_dir;
    uint64_t max_bytes = 5000ULL * 1024 * 1024; // 5000 MB
    std::chrono::hours retention{0};              // 0 disables PurgeExpired
};

struct ReclaimReport {
    uint64_t bytes_before = 0;
    uint64_t bytes_after = 0;
    uint32_t files_deleted = 0;
    uint32_t delete_failures = 0;
    bool skipped_protected = false;
    bool over_budget = false;
};

// Keeps the media directory under its byte budget by deleting the oldest
// files first. The pinned asset is never deleted. Only regular files directly
// inside media_dir are considered.
class StorageReclaimer {
public:
    StorageReclaimer(const ReclaimConfig& config, const ActiveAssetRegistry& registry, utils::Metrics& metrics);

    ReclaimReport Reclaim();

    // Deletes files whose mtime is older than the retention window.
    ReclaimReport PurgeExpired();

    uint64_t MeasureUsage() const;

    const ReclaimConfig& config() const { return config_; }

private:
    ReclaimConfig config_;
    const ActiveAssetRegistry& registry_;
    utils::Metrics& metrics_;
};

} // namespace jukebox::stream::storage
