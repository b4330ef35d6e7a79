#include "queue/queue_item.hpp"
#include <cctype>
#include <limits>

namespace jukebox::stream::queue {

std::string ItemStateToString(ItemState state) {
    switch (state) {
        case ItemState::QUEUED: return "QUEUED";
        case ItemState::ACQUIRING: return "ACQUIRING";
        case ItemState::STREAMING: return "STREAMING";
        case ItemState::COMPLETED: return "COMPLETED";
        case ItemState::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

bool IsTerminal(ItemState state) {
    return state == ItemState::COMPLETED || state == ItemState::FAILED;
}

std::optional<std::chrono::seconds> ParseDurationOverride(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    if (begin == end) return std::nullopt;

    // 24h is far beyond any track; larger values are treated as noise.
    constexpr int64_t kMaxSeconds = 24 * 3600;
    int64_t value = 0;
    for (size_t i = begin; i < end; ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(c)) return std::nullopt;
        value = value * 10 + (c - '0');
        if (value > kMaxSeconds) return std::nullopt;
    }

    if (value == 0) return std::nullopt;
    return std::chrono::seconds(value);
}

} // namespace jukebox::stream::queue
