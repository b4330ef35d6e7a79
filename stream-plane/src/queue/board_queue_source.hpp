#pragma once
#include <filesystem>
#include <mutex>
#include <nlohmann/json_fwd.hpp>
#include "queue/queue_source.hpp"

namespace jukebox::stream::queue {

// Queue source backed by a JSON board file:
//
//   { "lists": { "Queue": [card...], "Now Playing": [...], "Played": [...], "Failed": [...] } }
//   card = { "id": "...", "name": "...", "desc": "...", "attachments": [{"name": "...", "url": "..."}] }
//
// The file is re-read on every call so that cards added by hand or by another
// tool are picked up, and rewritten atomically on every move.
class BoardQueueSource : public QueueSource {
public:
    static constexpr const char* kQueueList = "Queue";
    static constexpr const char* kNowPlayingList = "Now Playing";
    static constexpr const char* kPlayedList = "Played";
    static constexpr const char* kFailedList = "Failed";

    explicit BoardQueueSource(const std::filesystem::path& board_path);

    std::vector<QueueItem> ListEligibleItems() override;
    void ReportState(const QueueItem& item, ItemState state) override;
    std::optional<AttachmentRef> GetAttachment(const QueueItem& item) override;

    // Moves cards stranded in "Now Playing" by an unclean shutdown back to the
    // head of "Queue". Returns the number of cards moved.
    size_t RecoverOrphans();

    static std::string ListForState(ItemState state);

private:
    nlohmann::json Load() const;
    void Save(const nlohmann::json& board) const;
    bool EnsureLists(nlohmann::json& board) const;

    std::filesystem::path path_;
    std::mutex mutex_;
};

} // namespace jukebox::stream::queue
