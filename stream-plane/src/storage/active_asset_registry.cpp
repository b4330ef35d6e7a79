#include "storage/active_asset_registry.hpp"

namespace fs = std::filesystem;

namespace jukebox::stream::storage {

fs::path ActiveAssetRegistry::Normalize(const fs::path& path) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(path, ec);
    if (ec) return path.lexically_normal();
    return canonical;
}

void ActiveAssetRegistry::Pin(const fs::path& path) {
    fs::path normalized = Normalize(path);
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(normalized);
}

void ActiveAssetRegistry::Release() {
    std::lock_guard<std::mutex> lock(mutex_);
    current_.reset();
}

std::optional<fs::path> ActiveAssetRegistry::Current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

bool ActiveAssetRegistry::IsProtected(const fs::path& path) const {
    fs::path normalized = Normalize(path);
    std::lock_guard<std::mutex> lock(mutex_);
    return current_ && *current_ == normalized;
}

} // namespace jukebox::stream::storage
