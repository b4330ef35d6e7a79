#include "coordinator/queue_coordinator.hpp"
#include "acquisition/media_acquirer.hpp"
#include "storage/active_asset_registry.hpp"
#include "transcode/transcode_supervisor.hpp"
#include "utils/metrics.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace jukebox::stream::coordinator {

std::string ItemOutcomeToString(ItemOutcome outcome) {
    switch (outcome) {
        case ItemOutcome::COMPLETED: return "COMPLETED";
        case ItemOutcome::FAILED: return "FAILED";
        case ItemOutcome::REQUEUED: return "REQUEUED";
        case ItemOutcome::INTERRUPTED: return "INTERRUPTED";
        default: return "UNKNOWN";
    }
}

QueueCoordinator::QueueCoordinator(const CoordinatorConfig& config,
                                   queue::QueueSource& source,
                                   acquisition::MediaAcquirer& acquirer,
                                   transcode::TranscodeSupervisor& supervisor,
                                   storage::StorageReclaimer& reclaimer,
                                   storage::ActiveAssetRegistry& registry,
                                   utils::Metrics& metrics)
    : config_(config), source_(source), acquirer_(acquirer), supervisor_(supervisor),
      reclaimer_(reclaimer), registry_(registry), metrics_(metrics) {}

QueueCoordinator::~QueueCoordinator() {
    Stop();
    std::lock_guard<std::mutex> lock(join_mutex_);
    if (loop_thread_.joinable()) loop_thread_.join();
}

void QueueCoordinator::Start() {
    std::lock_guard<std::mutex> lock(loop_mutex_);
    if (running_ || loop_thread_.joinable()) return;
    running_ = true;
    stopping_ = false;
    loop_exited_ = false;
    loop_thread_ = std::thread(&QueueCoordinator::RunLoop, this);
    spdlog::info("[coordinator] Started. Poll: {} ms, max attempts: {}", config_.poll_interval.count(),
                 config_.max_attempts);
}

void QueueCoordinator::Stop() {
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        if (!running_ && !loop_thread_.joinable()) return;
        running_ = false;
        stopping_ = true;
    }
    loop_cv_.notify_all();

    // Unblocks a ProcessItem waiting on the session
    supervisor_.Stop();

    bool exited;
    {
        std::unique_lock<std::mutex> lock(loop_mutex_);
        exited = loop_cv_.wait_for(lock, config_.stop_timeout, [this] { return loop_exited_; });
    }

    if (!exited) {
        spdlog::warn("[coordinator] Loop did not exit within {} ms, detaching wait to destructor",
                     config_.stop_timeout.count());
        return;
    }

    std::lock_guard<std::mutex> lock(join_mutex_);
    if (loop_thread_.joinable()) loop_thread_.join();
    spdlog::info("[coordinator] Stopped");
}

bool QueueCoordinator::SkipCurrent() {
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        if (!current_) return false;
        spdlog::info("[{}] Skip requested for '{}'", current_->id, current_->name);
    }
    skip_requested_ = true;
    supervisor_.Stop();
    return true;
}

CoordinatorStatus QueueCoordinator::GetStatus() const {
    CoordinatorStatus status;
    status.running = running_;
    status.session_state = supervisor_.GetState();
    status.media_path = supervisor_.CurrentMediaPath();

    std::lock_guard<std::mutex> lock(status_mutex_);
    status.current = current_;
    status.last_reclaim = last_reclaim_;
    status.queue_depth = queue_depth_;
    return status;
}

int QueueCoordinator::AttemptsFor(const std::string& item_id) const {
    std::lock_guard<std::mutex> lock(attempts_mutex_);
    auto it = attempts_.find(item_id);
    return it == attempts_.end() ? 0 : it->second;
}

storage::ReclaimReport QueueCoordinator::ReclaimNow() {
    std::lock_guard<std::mutex> media_lock(media_mutex_);
    auto report = reclaimer_.Reclaim();
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        last_reclaim_ = report;
    }
    return report;
}

void QueueCoordinator::RunLoop() {
    while (running_) {
        try {
            RunOnce();
        } catch (const std::exception& e) {
            spdlog::error("[coordinator] Loop iteration failed: {}", e.what());
            metrics_.errors_total("loop").Increment();
            if (!SleepFor(config_.error_backoff)) break;
            continue;
        }

        if (!SleepFor(config_.poll_interval)) break;
    }

    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        loop_exited_ = true;
    }
    loop_cv_.notify_all();
}

bool QueueCoordinator::SleepFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(loop_mutex_);
    loop_cv_.wait_for(lock, duration, [this] { return !running_; });
    return running_;
}

bool QueueCoordinator::RunOnce() {
    auto items = source_.ListEligibleItems();
    metrics_.queue_depth().Set(static_cast<double>(items.size()));
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        queue_depth_ = items.size();
    }

    if (items.empty()) {
        MaybeReclaim(true);
        return false;
    }

    try {
        ProcessItem(items.front());
    } catch (const std::exception&) {
        // A queue source fault mid-item; the card stays where the source left it
        {
            std::lock_guard<std::mutex> lock(status_mutex_);
            current_.reset();
        }
        if (supervisor_.GetState() == transcode::SessionState::IDLE) registry_.Release();
        throw;
    }

    MaybeReclaim(false);
    return true;
}

ItemOutcome QueueCoordinator::ProcessItem(queue::QueueItem item) {
    std::lock_guard<std::mutex> process_lock(process_mutex_);
    skip_requested_ = false;

    item.attempts = AttemptsFor(item.id);
    item.last_attempt_at = std::chrono::system_clock::now();
    spdlog::info("[{}] Processing '{}' (attempt {} of {})", item.id, item.name, item.attempts + 1,
                 config_.max_attempts);

    Transition(item, queue::ItemState::ACQUIRING);

    auto attachment = source_.GetAttachment(item);
    if (!attachment) {
        spdlog::warn("[{}] No attachment, marking failed", item.id);
        {
            std::lock_guard<std::mutex> lock(attempts_mutex_);
            attempts_.erase(item.id);
        }
        metrics_.errors_total("no_attachment").Increment();
        metrics_.items_total("failed").Increment();
        Transition(item, queue::ItemState::FAILED);
        return ItemOutcome::FAILED;
    }

    acquisition::AcquireResult acquired;
    {
        // Reclaim passes wait until the fresh download is pinned
        std::lock_guard<std::mutex> media_lock(media_mutex_);
        try {
            acquired = acquirer_.Acquire(*attachment);
        } catch (const std::exception& e) {
            return HandleFailure(item, std::string("acquisition error: ") + e.what());
        }
        if (!acquired.ok()) {
            return HandleFailure(item, "acquisition failed: " + acquired.reason);
        }

        if (stopping_) return Interrupt(item);
        if (skip_requested_) {
            spdlog::info("[{}] Skipped before streaming", item.id);
            return Complete(item);
        }

        registry_.Pin(acquired.asset->path);
    }

    const acquisition::MediaAsset& asset = *acquired.asset;
    Transition(item, queue::ItemState::STREAMING);

    auto duration = queue::ParseDurationOverride(item.description);

    transcode::StartResult started;
    try {
        started = supervisor_.Start(asset, duration);
    } catch (const std::exception& e) {
        supervisor_.Stop();
        registry_.Release();
        return HandleFailure(item, std::string("transcode error: ") + e.what());
    }

    if (started == transcode::StartResult::CANCELLED) {
        registry_.Release();
        if (stopping_) return Interrupt(item);
        return Complete(item);
    }
    if (started != transcode::StartResult::STARTED) {
        registry_.Release();
        return HandleFailure(item, "transcode start failed: " + transcode::StartResultToString(started));
    }

    // Stop() or SkipCurrent() may have run just before the session existed
    if (stopping_) {
        supervisor_.Stop();
        return Interrupt(item);
    }
    if (skip_requested_) {
        supervisor_.Stop();
    }

    PublishStatus();
    auto outcome = supervisor_.WaitForCompletion();

    switch (outcome) {
        case transcode::SessionOutcome::COMPLETED:
        case transcode::SessionOutcome::DURATION_ELAPSED:
            return Complete(item);
        case transcode::SessionOutcome::PROCESS_FAILED:
            return HandleFailure(item, "transcoder exited abnormally");
        case transcode::SessionOutcome::STOPPED:
        default:
            if (stopping_ && !skip_requested_) return Interrupt(item);
            if (skip_requested_) spdlog::info("[{}] Skipped", item.id);
            return Complete(item);
    }
}

ItemOutcome QueueCoordinator::Complete(queue::QueueItem& item) {
    {
        std::lock_guard<std::mutex> lock(attempts_mutex_);
        attempts_.erase(item.id);
    }
    metrics_.items_total("completed").Increment();
    Transition(item, queue::ItemState::COMPLETED);
    spdlog::info("[{}] Completed '{}'", item.id, item.name);
    return ItemOutcome::COMPLETED;
}

ItemOutcome QueueCoordinator::HandleFailure(queue::QueueItem& item, const std::string& reason) {
    int attempts;
    {
        std::lock_guard<std::mutex> lock(attempts_mutex_);
        attempts = ++attempts_[item.id];
        if (attempts >= config_.max_attempts) attempts_.erase(item.id);
    }
    item.attempts = attempts;

    if (attempts >= config_.max_attempts) {
        spdlog::error("[{}] '{}' failed permanently after {} attempts: {}", item.id, item.name, attempts, reason);
        metrics_.items_total("failed").Increment();
        Transition(item, queue::ItemState::FAILED);
        return ItemOutcome::FAILED;
    }

    spdlog::warn("[{}] Attempt {} of {} failed, requeueing: {}", item.id, attempts, config_.max_attempts, reason);
    metrics_.item_retries_total().Increment();
    Transition(item, queue::ItemState::QUEUED);
    return ItemOutcome::REQUEUED;
}

ItemOutcome QueueCoordinator::Interrupt(queue::QueueItem& item) {
    spdlog::info("[{}] Interrupted by shutdown, returning to queue", item.id);
    registry_.Release();
    Transition(item, queue::ItemState::QUEUED);
    return ItemOutcome::INTERRUPTED;
}

void QueueCoordinator::Transition(queue::QueueItem& item, queue::ItemState state) {
    item.state = state;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        if (state == queue::ItemState::ACQUIRING || state == queue::ItemState::STREAMING) {
            current_ = item;
        } else {
            current_.reset();
        }
    }

    source_.ReportState(item, state);
    PublishStatus();
}

void QueueCoordinator::MaybeReclaim(bool queue_idle) {
    auto now = std::chrono::steady_clock::now();
    if (last_cleanup_ != std::chrono::steady_clock::time_point{} && now - last_cleanup_ < config_.cleanup_interval) {
        return;
    }
    last_cleanup_ = now;

    auto report = ReclaimNow();
    spdlog::info("[coordinator] Reclaim pass: {} MB -> {} MB, {} file(s) deleted", report.bytes_before / 1024 / 1024,
                 report.bytes_after / 1024 / 1024, report.files_deleted);

    if (queue_idle && reclaimer_.config().retention.count() > 0) {
        auto purged = reclaimer_.PurgeExpired();
        if (purged.files_deleted > 0) {
            spdlog::info("[coordinator] Retention purge deleted {} file(s)", purged.files_deleted);
        }
    }
}

void QueueCoordinator::PublishStatus() {
    if (config_.status_file.empty()) return;

    auto status = GetStatus();
    json doc;
    doc["running"] = status.running;
    doc["session_state"] = transcode::SessionFSM::StateToString(status.session_state);
    doc["queue_depth"] = status.queue_depth;
    doc["updated_at_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    if (status.current) {
        doc["item"] = {
            {"id", status.current->id},
            {"name", status.current->name},
            {"state", queue::ItemStateToString(status.current->state)},
            {"attempts", status.current->attempts},
        };
    } else {
        doc["item"] = nullptr;
    }
    doc["media_file"] = status.media_path ? json(status.media_path->filename().string()) : json(nullptr);

    fs::path tmp = config_.status_file;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            spdlog::warn("[coordinator] Cannot write status file {}", tmp.string());
            return;
        }
        out << doc.dump(2);
    }

    std::error_code ec;
    fs::rename(tmp, config_.status_file, ec);
    if (ec) {
        spdlog::warn("[coordinator] Cannot publish status file: {}", ec.message());
    }
}

} // namespace jukebox::stream::coordinator
