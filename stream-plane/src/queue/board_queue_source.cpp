#include "queue/board_queue_source.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace jukebox::stream::queue {

namespace {

const char* const kAllLists[] = {
    BoardQueueSource::kQueueList,
    BoardQueueSource::kNowPlayingList,
    BoardQueueSource::kPlayedList,
    BoardQueueSource::kFailedList,
};

std::string CardId(const json& card) {
    if (!card.is_object()) return {};
    auto it = card.find("id");
    if (it == card.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

std::string StringField(const json& card, const char* key) {
    auto it = card.find(key);
    if (it == card.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

// Returns {list name, index} of the card, or an empty name if absent.
std::pair<std::string, size_t> FindCard(const json& board, const std::string& id) {
    for (const auto& [list_name, cards] : board["lists"].items()) {
        for (size_t i = 0; i < cards.size(); ++i) {
            if (CardId(cards[i]) == id) return {list_name, i};
        }
    }
    return {"", 0};
}

} // namespace

BoardQueueSource::BoardQueueSource(const fs::path& board_path) : path_(board_path) {
    std::lock_guard<std::mutex> lock(mutex_);

    json board;
    if (fs::exists(path_)) {
        board = Load();
    } else {
        spdlog::info("[board] Creating new board at {}", path_.string());
        if (path_.has_parent_path()) fs::create_directories(path_.parent_path());
        board = json::object();
    }

    if (EnsureLists(board)) {
        Save(board);
    }
}

std::string BoardQueueSource::ListForState(ItemState state) {
    switch (state) {
        case ItemState::QUEUED: return kQueueList;
        case ItemState::ACQUIRING:
        case ItemState::STREAMING: return kNowPlayingList;
        case ItemState::COMPLETED: return kPlayedList;
        case ItemState::FAILED: return kFailedList;
        default: return kQueueList;
    }
}

std::vector<QueueItem> BoardQueueSource::ListEligibleItems() {
    std::lock_guard<std::mutex> lock(mutex_);
    json board = Load();
    EnsureLists(board);

    std::vector<QueueItem> items;
    for (const auto& card : board["lists"][kQueueList]) {
        std::string id = CardId(card);
        if (id.empty()) {
            spdlog::warn("[board] Ignoring card without an id in '{}'", kQueueList);
            continue;
        }
        QueueItem item;
        item.id = id;
        item.name = StringField(card, "name");
        item.description = StringField(card, "desc");
        items.push_back(std::move(item));
    }
    return items;
}

void BoardQueueSource::ReportState(const QueueItem& item, ItemState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    json board = Load();
    bool changed = EnsureLists(board);

    auto [from_list, index] = FindCard(board, item.id);
    if (from_list.empty()) {
        spdlog::warn("[board] Card '{}' ({}) not found, cannot move to {}", item.name, item.id, ItemStateToString(state));
        if (changed) Save(board);
        return;
    }

    const std::string to_list = ListForState(state);
    if (from_list == to_list) {
        if (changed) Save(board);
        return;
    }

    json card = board["lists"][from_list][index];
    board["lists"][from_list].erase(index);
    board["lists"][to_list].push_back(std::move(card));
    Save(board);

    spdlog::info("[board] Moved card '{}' to '{}'", item.name, to_list);
}

std::optional<AttachmentRef> BoardQueueSource::GetAttachment(const QueueItem& item) {
    std::lock_guard<std::mutex> lock(mutex_);
    json board = Load();
    EnsureLists(board);

    auto [list_name, index] = FindCard(board, item.id);
    if (list_name.empty()) return std::nullopt;

    const json& card = board["lists"][list_name][index];
    auto it = card.find("attachments");
    if (it == card.end() || !it->is_array()) return std::nullopt;

    for (const auto& attachment : *it) {
        if (!attachment.is_object()) continue;
        std::string url = StringField(attachment, "url");
        if (url.empty()) continue;
        return AttachmentRef{StringField(attachment, "name"), url};
    }
    return std::nullopt;
}

size_t BoardQueueSource::RecoverOrphans() {
    std::lock_guard<std::mutex> lock(mutex_);
    json board = Load();
    bool changed = EnsureLists(board);

    json& orphans = board["lists"][kNowPlayingList];
    size_t moved = orphans.size();
    if (moved > 0) {
        json recovered = json::array();
        for (auto& card : orphans) recovered.push_back(std::move(card));
        for (auto& card : board["lists"][kQueueList]) recovered.push_back(std::move(card));
        board["lists"][kQueueList] = std::move(recovered);
        orphans = json::array();
        changed = true;
        spdlog::warn("[board] Returned {} card(s) left in '{}' to the head of '{}'", moved, kNowPlayingList, kQueueList);
    }

    if (changed) Save(board);
    return moved;
}

json BoardQueueSource::Load() const {
    std::ifstream in(path_);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open board file " + path_.string());
    }
    try {
        return json::parse(in);
    } catch (const json::exception& e) {
        throw std::runtime_error("Malformed board file " + path_.string() + ": " + e.what());
    }
}

void BoardQueueSource::Save(const json& board) const {
    fs::path tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("Cannot write board file " + tmp.string());
        }
        out << board.dump(2);
        if (!out) {
            throw std::runtime_error("Failed writing board file " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec) {
        throw std::runtime_error("Cannot replace board file " + path_.string() + ": " + ec.message());
    }
}

bool BoardQueueSource::EnsureLists(json& board) const {
    bool changed = false;
    if (!board.is_object()) {
        board = json::object();
        changed = true;
    }
    if (!board.contains("lists") || !board["lists"].is_object()) {
        board["lists"] = json::object();
        changed = true;
    }
    for (const char* name : kAllLists) {
        if (!board["lists"].contains(name) || !board["lists"][name].is_array()) {
            board["lists"][name] = json::array();
            spdlog::info("[board] Created list: {}", name);
            changed = true;
        }
    }
    return changed;
}

} // namespace jukebox::stream::queue
