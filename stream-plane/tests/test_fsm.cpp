#include <gtest/gtest.h>
#include "queue/queue_item.hpp"
#include "transcode/session_fsm.hpp"

using namespace jukebox::stream;

TEST(SessionFSMTest, InitialStateIsIdle) {
    transcode::SessionFSM fsm;
    EXPECT_EQ(fsm.GetCurrentState(), transcode::SessionState::IDLE);
    EXPECT_TRUE(fsm.IsIdle());
}

TEST(SessionFSMTest, TransitionWorks) {
    transcode::SessionFSM fsm;
    fsm.TransitionTo(transcode::SessionState::STARTING);
    EXPECT_EQ(fsm.GetCurrentState(), transcode::SessionState::STARTING);
    fsm.TransitionTo(transcode::SessionState::VERIFYING);
    fsm.TransitionTo(transcode::SessionState::ACTIVE);
    EXPECT_EQ(fsm.GetCurrentState(), transcode::SessionState::ACTIVE);
    EXPECT_FALSE(fsm.IsIdle());
}

TEST(SessionFSMTest, StateToString) {
    EXPECT_EQ(transcode::SessionFSM::StateToString(transcode::SessionState::IDLE), "IDLE");
    EXPECT_EQ(transcode::SessionFSM::StateToString(transcode::SessionState::VERIFYING), "VERIFYING");
    EXPECT_EQ(transcode::SessionFSM::StateToString(transcode::SessionState::STOPPING), "STOPPING");
}

TEST(ItemStateTest, TerminalStates) {
    EXPECT_TRUE(queue::IsTerminal(queue::ItemState::COMPLETED));
    EXPECT_TRUE(queue::IsTerminal(queue::ItemState::FAILED));
    EXPECT_FALSE(queue::IsTerminal(queue::ItemState::QUEUED));
    EXPECT_FALSE(queue::IsTerminal(queue::ItemState::ACQUIRING));
    EXPECT_FALSE(queue::IsTerminal(queue::ItemState::STREAMING));
}

TEST(ItemStateTest, StateToString) {
    EXPECT_EQ(queue::ItemStateToString(queue::ItemState::QUEUED), "QUEUED");
    EXPECT_EQ(queue::ItemStateToString(queue::ItemState::STREAMING), "STREAMING");
    EXPECT_EQ(queue::ItemStateToString(queue::ItemState::FAILED), "FAILED");
}
