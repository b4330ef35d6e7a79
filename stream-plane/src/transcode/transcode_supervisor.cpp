#include "transcode/transcode_supervisor.hpp"
#include "storage/active_asset_registry.hpp"
#include "utils/metrics.hpp"
#include <csignal>
#include <fstream>
#include <vector>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace jukebox::stream::transcode {

namespace {
// Reaping after stderr EOF or SIGKILL is bounded by these, not by the stop grace period
constexpr std::chrono::milliseconds kReapPollInterval{100};
constexpr std::chrono::milliseconds kKillReapTimeout{5000};
}

std::string StartResultToString(StartResult result) {
    switch (result) {
        case StartResult::STARTED: return "STARTED";
        case StartResult::SPAWN_FAILED: return "SPAWN_FAILED";
        case StartResult::VERIFY_FAILED: return "VERIFY_FAILED";
        case StartResult::CANCELLED: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

std::string SessionOutcomeToString(SessionOutcome outcome) {
    switch (outcome) {
        case SessionOutcome::COMPLETED: return "COMPLETED";
        case SessionOutcome::DURATION_ELAPSED: return "DURATION_ELAPSED";
        case SessionOutcome::PROCESS_FAILED: return "PROCESS_FAILED";
        case SessionOutcome::STOPPED: return "STOPPED";
        default: return "UNKNOWN";
    }
}

TranscodeSupervisor::TranscodeSupervisor(const SupervisorConfig& config, ProcessFactory& factory,
                                         storage::ActiveAssetRegistry& registry, utils::Metrics& metrics)
    : config_(config), factory_(factory), registry_(registry), metrics_(metrics) {
    fs::create_directories(config_.hls_dir);
    // Leftovers from a previous run would be served as if live
    ClearOutput();
}

TranscodeSupervisor::~TranscodeSupervisor() {
    Stop();
}

StartResult TranscodeSupervisor::Start(const acquisition::MediaAsset& asset,
                                       std::optional<std::chrono::seconds> duration) {
    std::lock_guard<std::mutex> op_lock(op_mutex_);

    if (!fsm_.IsIdle()) {
        spdlog::warn("[transcode] Preempting active session for {}", asset.path.filename().string());
        StopInternal();
    }

    ClearOutput();

    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation = ++generation_;
        stop_requested_ = false;
        exited_ = false;
        exit_code_.reset();
        asset_ = asset;
        duration_ = duration;
        started_at_ = std::chrono::steady_clock::now();
    }

    registry_.Pin(asset.path);
    fsm_.TransitionTo(SessionState::STARTING);

    auto cmd = BuildFfmpegCommand(config_.ffmpeg_path, asset, config_.hls_dir, config_.hls);
    spdlog::info("[transcode] Session {} starting: {} ({} {}), duration {}", generation,
                 asset.path.filename().string(), acquisition::MediaKindToString(asset.kind), asset.format,
                 duration ? std::to_string(duration->count()) + "s" : std::string("unbounded"));

    process_ = factory_.Create();
    try {
        process_->Start(cmd);
    } catch (const std::exception& e) {
        spdlog::error("[transcode] Session {} failed to spawn: {}", generation, e.what());
        metrics_.session_start_failures_total("spawn").Increment();
        process_.reset();
        registry_.Release();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            asset_.reset();
            duration_.reset();
        }
        fsm_.TransitionTo(SessionState::IDLE);
        return StartResult::SPAWN_FAILED;
    }

    watcher_ = std::thread(&TranscodeSupervisor::WatchDiagnostics, this, process_.get(), generation);
    fsm_.TransitionTo(SessionState::VERIFYING);

    bool cancelled;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, config_.verify_delay, [this] { return stop_requested_ || exited_; });
        cancelled = stop_requested_;
    }

    if (cancelled) {
        spdlog::info("[transcode] Session {} cancelled during verification", generation);
        StopInternal();
        return StartResult::CANCELLED;
    }

    if (!VerifyOutput()) {
        spdlog::error("[transcode] Session {} produced no playable output after {} ms", generation,
                      config_.verify_delay.count());
        metrics_.session_start_failures_total("verify").Increment();
        StopInternal();
        return StartResult::VERIFY_FAILED;
    }

    fsm_.TransitionTo(SessionState::ACTIVE);
    metrics_.sessions_active().Set(1);
    metrics_.sessions_started_total().Increment();
    spdlog::info("[transcode] Session {} active", generation);
    return StartResult::STARTED;
}

SessionOutcome TranscodeSupervisor::WaitForCompletion() {
    SessionOutcome outcome;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (fsm_.IsIdle()) return SessionOutcome::STOPPED;

        uint64_t generation = generation_;
        auto finished = [this, generation] {
            return stop_requested_ || exited_ || generation_ != generation;
        };

        bool ended;
        if (duration_) {
            ended = cv_.wait_until(lock, started_at_ + *duration_, finished);
        } else {
            cv_.wait(lock, finished);
            ended = true;
        }

        if (!ended) {
            outcome = SessionOutcome::DURATION_ELAPSED;
        } else if (stop_requested_ || generation_ != generation) {
            outcome = SessionOutcome::STOPPED;
        } else if (exit_code_ && *exit_code_ == 0) {
            outcome = SessionOutcome::COMPLETED;
        } else {
            outcome = SessionOutcome::PROCESS_FAILED;
        }

        if (outcome == SessionOutcome::PROCESS_FAILED) {
            spdlog::warn("[transcode] Session {} transcoder exited with code {}", generation,
                         exit_code_ ? *exit_code_ : -1);
        } else {
            spdlog::info("[transcode] Session {} ended: {}", generation, SessionOutcomeToString(outcome));
        }
    }

    Stop();
    return outcome;
}

void TranscodeSupervisor::Stop() {
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation = generation_;
        stop_requested_ = true;
    }
    cv_.notify_all();

    std::lock_guard<std::mutex> op_lock(op_mutex_);
    {
        // A newer session started while we waited; it is not ours to stop
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation_ != generation) return;
    }
    StopInternal();
}

void TranscodeSupervisor::StopInternal() {
    if (fsm_.IsIdle()) return;

    fsm_.TransitionTo(SessionState::STOPPING);
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
        generation = generation_;
    }
    cv_.notify_all();

    if (process_) {
        process_->Signal(SIGTERM);
        auto code = process_->Wait(config_.grace_period);
        if (!code) {
            spdlog::warn("[transcode] Session {} did not exit within {} ms, sending SIGKILL", generation,
                         config_.grace_period.count());
            metrics_.forced_kills_total().Increment();
            process_->Signal(SIGKILL);
            code = process_->Wait(kKillReapTimeout);
            if (!code) {
                spdlog::error("[transcode] Session {} process still not reaped after SIGKILL", generation);
            }
        }
    }

    if (watcher_.joinable()) watcher_.join();
    process_.reset();

    ClearOutput();
    registry_.Release();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        asset_.reset();
        duration_.reset();
    }

    metrics_.sessions_active().Set(0);
    fsm_.TransitionTo(SessionState::IDLE);
    spdlog::info("[transcode] Session {} stopped", generation);
}

void TranscodeSupervisor::WatchDiagnostics(ProcessHandle* process, uint64_t generation) {
    std::string line;
    while (process->ReadDiagnosticLine(line)) {
        if (IsDiagnosticError(line)) {
            spdlog::warn("[transcode] ffmpeg: {}", line);
            metrics_.transcode_diagnostic_errors_total().Increment();
        } else {
            spdlog::trace("[transcode] ffmpeg: {}", line);
        }
    }

    // stderr closed: the process is gone or about to be. Poll until it is
    // reaped, or until a stop takes over the teardown.
    std::optional<int> code;
    bool warned = false;
    while (!(code = process->Wait(kReapPollInterval))) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_requested_ || generation_ != generation) return;
        }
        if (!warned) {
            spdlog::warn("[transcode] Session {} closed its diagnostic stream but is still running", generation);
            warned = true;
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation_ == generation) {
            exited_ = true;
            exit_code_ = code;
        }
    }
    cv_.notify_all();
}

std::optional<fs::path> TranscodeSupervisor::CurrentMediaPath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!asset_) return std::nullopt;
    return asset_->path;
}

uint64_t TranscodeSupervisor::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

bool TranscodeSupervisor::VerifyOutput() const {
    std::ifstream playlist(config_.hls_dir / kPlaylistName);
    if (!playlist.is_open()) {
        spdlog::warn("[transcode] Playlist {} not created", kPlaylistName);
        return false;
    }

    std::string first_line;
    std::getline(playlist, first_line);
    if (first_line.rfind("#EXTM3U", 0) != 0) {
        spdlog::warn("[transcode] Playlist {} has no #EXTM3U header", kPlaylistName);
        return false;
    }

    std::error_code ec;
    for (fs::directory_iterator it(config_.hls_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().extension() == ".ts" && it->is_regular_file(ec)) return true;
    }
    spdlog::warn("[transcode] No segments written to {}", config_.hls_dir.string());
    return false;
}

void TranscodeSupervisor::ClearOutput() const {
    std::error_code ec;
    std::vector<fs::path> doomed;
    for (fs::directory_iterator it(config_.hls_dir, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::path& p = it->path();
        const std::string name = p.filename().string();
        // Includes the muxer's playlist.m3u8.tmp
        if (p.extension() == ".ts" || p.extension() == ".m3u8" || name.rfind("playlist", 0) == 0) {
            doomed.push_back(p);
        }
    }
    if (ec) {
        spdlog::warn("[transcode] Cannot list {}: {}", config_.hls_dir.string(), ec.message());
    }

    for (const auto& p : doomed) {
        std::error_code rm_ec;
        fs::remove(p, rm_ec);
        if (rm_ec) {
            spdlog::warn("[transcode] Failed to remove {}: {}", p.string(), rm_ec.message());
        }
    }
}

} // namespace jukebox::stream::transcode
