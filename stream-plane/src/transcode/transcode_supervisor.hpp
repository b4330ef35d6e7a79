#pragma once
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "acquisition/media_types.hpp"
#include "transcode/process_handle.hpp"
#include "transcode/session_fsm.hpp"
#include "transcode/transcode_profile.hpp"

namespace jukebox::stream::utils {
class Metrics;
}
namespace jukebox::stream::storage {
class ActiveAssetRegistry;
}

namespace jukebox::stream::transcode {

struct SupervisorConfig {
    std::string ffmpeg_path = "ffmpeg";
    std::filesystem::path hls_dir;
    std::chrono::milliseconds verify_delay{2000};
    std::chrono::milliseconds grace_period{5000};
    HlsSettings hls;
};

enum class StartResult {
    STARTED,
    SPAWN_FAILED,
    VERIFY_FAILED,
    CANCELLED
};

enum class SessionOutcome {
    COMPLETED,        // process exited 0
    DURATION_ELAPSED,
    PROCESS_FAILED,   // process exited non-zero or was killed
    STOPPED           // Stop() was called
};

std::string StartResultToString(StartResult result);
std::string SessionOutcomeToString(SessionOutcome outcome);

// Owns at most one transcoder process. Start/Stop are serialized; Stop may be
// called from any thread and always leaves the supervisor IDLE with the
// segment directory cleared.
class TranscodeSupervisor {
public:
    TranscodeSupervisor(const SupervisorConfig& config, ProcessFactory& factory,
                        storage::ActiveAssetRegistry& registry, utils::Metrics& metrics);
    ~TranscodeSupervisor();

    TranscodeSupervisor(const TranscodeSupervisor&) = delete;
    TranscodeSupervisor& operator=(const TranscodeSupervisor&) = delete;

    // Preempts any running session. Blocks through the verification delay.
    StartResult Start(const acquisition::MediaAsset& asset, std::optional<std::chrono::seconds> duration);

    // Blocks until the current session ends and tears it down.
    SessionOutcome WaitForCompletion();

    void Stop();

    SessionState GetState() const { return fsm_.GetCurrentState(); }
    std::optional<std::filesystem::path> CurrentMediaPath() const;
    uint64_t generation() const;

    bool VerifyOutput() const;
    void ClearOutput() const;

private:
    void StopInternal();
    void WatchDiagnostics(ProcessHandle* process, uint64_t generation);

    SupervisorConfig config_;
    ProcessFactory& factory_;
    storage::ActiveAssetRegistry& registry_;
    utils::Metrics& metrics_;

    std::mutex op_mutex_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    uint64_t generation_ = 0;
    bool stop_requested_ = false;
    bool exited_ = false;
    std::optional<int> exit_code_;
    std::optional<acquisition::MediaAsset> asset_;
    std::optional<std::chrono::seconds> duration_;
    std::chrono::steady_clock::time_point started_at_;

    std::unique_ptr<ProcessHandle> process_;
    std::thread watcher_;
    SessionFSM fsm_;
};

} // namespace jukebox::stream::transcode
