#include "transcode/session_fsm.hpp"
#include <spdlog/spdlog.h>

namespace jukebox::stream::transcode {

SessionFSM::SessionFSM() : current_state_(SessionState::IDLE) {}

void SessionFSM::TransitionTo(SessionState next_state) {
    SessionState prev = current_state_.exchange(next_state);
    if (prev != next_state) {
        spdlog::debug("[transcode] {} -> {}", StateToString(prev), StateToString(next_state));
    }
}

SessionState SessionFSM::GetCurrentState() const {
    return current_state_.load();
}

std::string SessionFSM::StateToString(SessionState state) {
    switch (state) {
        case SessionState::IDLE: return "IDLE";
        case SessionState::STARTING: return "STARTING";
        case SessionState::VERIFYING: return "VERIFYING";
        case SessionState::ACTIVE: return "ACTIVE";
        case SessionState::STOPPING: return "STOPPING";
        default: return "UNKNOWN";
    }
}

} // namespace jukebox::stream::transcode
