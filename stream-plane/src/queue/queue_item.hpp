#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace jukebox::stream::queue {

enum class ItemState {
    QUEUED,
    ACQUIRING,
    STREAMING,
    COMPLETED,
    FAILED
};

std::string ItemStateToString(ItemState state);
bool IsTerminal(ItemState state);

struct AttachmentRef {
    std::string name;
    std::string url;
};

struct QueueItem {
    std::string id;
    std::string name;
    std::string description; // free text, may hold a duration override in seconds
    ItemState state = ItemState::QUEUED;
    int attempts = 0;
    std::optional<std::chrono::system_clock::time_point> last_attempt_at;
};

// Positive whole number of seconds, surrounding whitespace ignored.
// Anything else (empty, signs, fractions, words, zero, overflow) means "play to the end".
std::optional<std::chrono::seconds> ParseDurationOverride(const std::string& text);

} // namespace jukebox::stream::queue
