#pragma once
#include <filesystem>
#include <mutex>
#include <optional>

namespace jukebox::stream::storage {

// The media file currently selected for playback. Reclamation must never
// delete it; WithCurrent() lets a reclaim pass hold the lock throughout so
// the pin cannot move while files are being deleted.
class ActiveAssetRegistry {
public:
    void Pin(const std::filesystem::path& path);
    void Release();
    std::optional<std::filesystem::path> Current() const;

    bool IsProtected(const std::filesystem::path& path) const;

    template <typename Fn>
    auto WithCurrent(Fn&& fn) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fn(current_);
    }

    static std::filesystem::path Normalize(const std::filesystem::path& path);

private:
    mutable std::mutex mutex_;
    std::optional<std::filesystem::path> current_;
};

} // namespace jukebox::stream::storage
