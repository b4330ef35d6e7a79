#include "storage/storage_reclaimer.hpp"
#include "storage/active_asset_registry.hpp"
#include "utils/metrics.hpp"
#include <algorithm>
#include <optional>
#include <vector>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace jukebox::stream::storage {

namespace {

struct FileInfo {
    fs::path path;
    uint64_t size_bytes;
    fs::file_time_type last_write_time;
};

// Regular files directly under dir. Entries that vanish or cannot be
// stat'ed mid-scan are skipped.
std::vector<FileInfo> ScanFiles(const fs::path& dir, uint64_t& total) {
    std::vector<FileInfo> files;
    total = 0;

    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec) || entry_ec) continue;

        uint64_t size = it->file_size(entry_ec);
        if (entry_ec) continue;
        auto mtime = it->last_write_time(entry_ec);
        if (entry_ec) continue;

        files.push_back({it->path(), size, mtime});
        total += size;
    }
    if (ec) {
        spdlog::warn("[storage] Cannot list {}: {}", dir.string(), ec.message());
    }
    return files;
}

bool IsPinned(const std::optional<fs::path>& pinned, const fs::path& candidate) {
    return pinned && *pinned == ActiveAssetRegistry::Normalize(candidate);
}

} // namespace

StorageReclaimer::StorageReclaimer(const ReclaimConfig& config, const ActiveAssetRegistry& registry,
                                   utils::Metrics& metrics)
    : config_(config), registry_(registry), metrics_(metrics) {}

ReclaimReport StorageReclaimer::Reclaim() {
    // Holding the registry lock for the whole pass keeps the pin stable
    return registry_.WithCurrent([this](const std::optional<fs::path>& pinned) {
        ReclaimReport report;
        auto files = ScanFiles(config_.media_dir, report.bytes_before);
        uint64_t total = report.bytes_before;

        if (total > config_.max_bytes) {
            spdlog::info("[storage] Usage {} MB exceeds budget {} MB, reclaiming",
                         total / 1024 / 1024, config_.max_bytes / 1024 / 1024);

            // Oldest first; path order breaks mtime ties so passes are repeatable
            std::stable_sort(files.begin(), files.end(), [](const FileInfo& a, const FileInfo& b) {
                if (a.last_write_time != b.last_write_time) return a.last_write_time < b.last_write_time;
                return a.path < b.path;
            });

            for (const auto& file : files) {
                if (total <= config_.max_bytes) break;

                if (IsPinned(pinned, file.path)) {
                    report.skipped_protected = true;
                    continue;
                }

                std::error_code ec;
                fs::remove(file.path, ec);
                if (ec) {
                    spdlog::warn("[storage] Failed to delete {}: {}", file.path.string(), ec.message());
                    metrics_.reclaim_failures_total().Increment();
                    report.delete_failures++;
                    continue;
                }

                total -= file.size_bytes;
                report.files_deleted++;
                metrics_.reclaim_bytes_total().Increment(static_cast<double>(file.size_bytes));
                spdlog::info("[storage] Deleted {} ({} bytes) for quota", file.path.filename().string(),
                             file.size_bytes);
            }

            if (total > config_.max_bytes) {
                report.over_budget = true;
                metrics_.reclaim_over_budget_total().Increment();
                spdlog::warn("[storage] Still over budget after reclaim: {} MB of {} MB",
                             total / 1024 / 1024, config_.max_bytes / 1024 / 1024);
            }
        }

        report.bytes_after = total;
        metrics_.media_storage_bytes().Set(static_cast<double>(total));
        return report;
    });
}

ReclaimReport StorageReclaimer::PurgeExpired() {
    return registry_.WithCurrent([this](const std::optional<fs::path>& pinned) {
        ReclaimReport report;
        auto files = ScanFiles(config_.media_dir, report.bytes_before);
        uint64_t total = report.bytes_before;

        if (config_.retention.count() > 0) {
            auto cutoff = fs::file_time_type::clock::now() - config_.retention;
            for (const auto& file : files) {
                if (file.last_write_time >= cutoff) continue;

                if (IsPinned(pinned, file.path)) {
                    report.skipped_protected = true;
                    continue;
                }

                std::error_code ec;
                fs::remove(file.path, ec);
                if (ec) {
                    spdlog::warn("[storage] Failed to delete {}: {}", file.path.string(), ec.message());
                    metrics_.reclaim_failures_total().Increment();
                    report.delete_failures++;
                    continue;
                }

                total -= file.size_bytes;
                report.files_deleted++;
                metrics_.reclaim_bytes_total().Increment(static_cast<double>(file.size_bytes));
                spdlog::info("[storage] Deleted expired file: {}", file.path.filename().string());
            }
        }

        report.bytes_after = total;
        metrics_.media_storage_bytes().Set(static_cast<double>(total));
        return report;
    });
}

uint64_t StorageReclaimer::MeasureUsage() const {
    uint64_t total = 0;
    ScanFiles(config_.media_dir, total);
    return total;
}

} // namespace jukebox::stream::storage
