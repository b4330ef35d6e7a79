#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include "queue/board_queue_source.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace jukebox::stream::queue;

class BoardQueueSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("jukebox_board_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root_);
        fs::create_directories(root_);
        path_ = root_ / "board.json";
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    void WriteBoard(const json& board) {
        std::ofstream(path_) << board.dump();
    }

    json ReadBoard() {
        std::ifstream in(path_);
        return json::parse(in);
    }

    std::vector<std::string> IdsIn(const std::string& list) {
        std::vector<std::string> ids;
        for (const auto& card : ReadBoard()["lists"][list]) ids.push_back(card["id"].get<std::string>());
        return ids;
    }

    static json Card(const std::string& id, const std::string& url = "") {
        json card = {{"id", id}, {"name", "Track " + id}, {"desc", ""}};
        card["attachments"] = json::array();
        if (!url.empty()) card["attachments"].push_back({{"name", id + ".mp3"}, {"url", url}});
        return card;
    }

    fs::path root_;
    fs::path path_;
};

TEST_F(BoardQueueSourceTest, CreatesBoardWithAllLists) {
    BoardQueueSource source(path_);
    ASSERT_TRUE(fs::exists(path_));

    auto board = ReadBoard();
    for (const char* list : {"Queue", "Now Playing", "Played", "Failed"}) {
        EXPECT_TRUE(board["lists"][list].is_array()) << list;
    }
    EXPECT_TRUE(source.ListEligibleItems().empty());
}

TEST_F(BoardQueueSourceTest, ListsQueueInBoardOrder) {
    json bad = {{"name", "no id"}};
    WriteBoard({{"lists", {{"Queue", {Card("a"), bad, Card("b")}}}}});
    BoardQueueSource source(path_);

    auto items = source.ListEligibleItems();
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].id, "a");
    EXPECT_EQ(items[0].name, "Track a");
    EXPECT_EQ(items[0].state, ItemState::QUEUED);
    EXPECT_EQ(items[1].id, "b");
}

TEST_F(BoardQueueSourceTest, ReportStateMovesCards) {
    WriteBoard({{"lists", {{"Queue", {Card("a"), Card("b"), Card("c")}}}}});
    BoardQueueSource source(path_);
    auto items = source.ListEligibleItems();

    source.ReportState(items[0], ItemState::ACQUIRING);
    EXPECT_EQ(IdsIn("Now Playing"), std::vector<std::string>{"a"});

    // Already in Now Playing: no move
    source.ReportState(items[0], ItemState::STREAMING);
    EXPECT_EQ(IdsIn("Now Playing"), std::vector<std::string>{"a"});

    // Requeued cards go to the tail
    source.ReportState(items[0], ItemState::QUEUED);
    EXPECT_EQ(IdsIn("Queue"), (std::vector<std::string>{"b", "c", "a"}));

    source.ReportState(items[1], ItemState::COMPLETED);
    source.ReportState(items[2], ItemState::FAILED);
    EXPECT_EQ(IdsIn("Played"), std::vector<std::string>{"b"});
    EXPECT_EQ(IdsIn("Failed"), std::vector<std::string>{"c"});
    EXPECT_EQ(IdsIn("Queue"), std::vector<std::string>{"a"});
}

TEST_F(BoardQueueSourceTest, ReportStateForUnknownCardIsIgnored) {
    WriteBoard({{"lists", {{"Queue", {Card("a")}}}}});
    BoardQueueSource source(path_);

    QueueItem ghost;
    ghost.id = "ghost";
    EXPECT_NO_THROW(source.ReportState(ghost, ItemState::COMPLETED));
    EXPECT_TRUE(IdsIn("Played").empty());
    EXPECT_EQ(IdsIn("Queue"), std::vector<std::string>{"a"});
}

TEST_F(BoardQueueSourceTest, GetAttachmentReturnsFirstWithUrl) {
    json card = Card("a");
    card["attachments"] = {{{"name", "empty"}}, {{"name", "song.mp3"}, {"url", "https://example.com/song.mp3"}}};
    WriteBoard({{"lists", {{"Queue", {card, Card("b")}}}}});
    BoardQueueSource source(path_);
    auto items = source.ListEligibleItems();

    auto attachment = source.GetAttachment(items[0]);
    ASSERT_TRUE(attachment.has_value());
    EXPECT_EQ(attachment->name, "song.mp3");
    EXPECT_EQ(attachment->url, "https://example.com/song.mp3");

    EXPECT_FALSE(source.GetAttachment(items[1]).has_value());
}

TEST_F(BoardQueueSourceTest, RecoverOrphansReturnsNowPlayingToHead) {
    WriteBoard({{"lists", {{"Queue", {Card("q1")}}, {"Now Playing", {Card("np1"), Card("np2")}}}}});
    BoardQueueSource source(path_);

    EXPECT_EQ(source.RecoverOrphans(), 2u);
    EXPECT_EQ(IdsIn("Queue"), (std::vector<std::string>{"np1", "np2", "q1"}));
    EXPECT_TRUE(IdsIn("Now Playing").empty());

    EXPECT_EQ(source.RecoverOrphans(), 0u);
}

TEST_F(BoardQueueSourceTest, MalformedBoardThrows) {
    std::ofstream(path_) << "{ not json";
    EXPECT_THROW(BoardQueueSource source(path_), std::runtime_error);
}

TEST_F(BoardQueueSourceTest, PicksUpCardsAddedExternally) {
    BoardQueueSource source(path_);
    EXPECT_TRUE(source.ListEligibleItems().empty());

    auto board = ReadBoard();
    board["lists"]["Queue"].push_back(Card("late"));
    WriteBoard(board);

    auto items = source.ListEligibleItems();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].id, "late");
}
