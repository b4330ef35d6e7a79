#pragma once
#include <string>
#include <atomic>

namespace jukebox::stream::transcode {

enum class SessionState {
    IDLE,
    STARTING,
    VERIFYING,
    ACTIVE,
    STOPPING
};

class SessionFSM {
public:
    SessionFSM();

    void TransitionTo(SessionState next_state);
    SessionState GetCurrentState() const;
    bool IsIdle() const { return GetCurrentState() == SessionState::IDLE; }
    static std::string StateToString(SessionState state);

private:
    std::atomic<SessionState> current_state_;
};

} // namespace jukebox::stream::transcode
