#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include "queue/queue_source.hpp"
#include "storage/storage_reclaimer.hpp"
#include "transcode/session_fsm.hpp"

namespace jukebox::stream::utils {
class Metrics;
}
namespace jukebox::stream::acquisition {
class MediaAcquirer;
}
namespace jukebox::stream::transcode {
class TranscodeSupervisor;
}
namespace jukebox::stream::storage {
class ActiveAssetRegistry;
}

namespace jukebox::stream::coordinator {

struct CoordinatorConfig {
    std::chrono::milliseconds poll_interval{1000};
    std::chrono::milliseconds error_backoff{5000};
    std::chrono::milliseconds cleanup_interval{std::chrono::hours(24)};
    std::chrono::milliseconds stop_timeout{10000};
    int max_attempts = 3;
    std::filesystem::path status_file; // empty disables status.json
};

enum class ItemOutcome {
    COMPLETED,
    FAILED,
    REQUEUED,
    INTERRUPTED // shutdown; returned to the queue without using an attempt
};

std::string ItemOutcomeToString(ItemOutcome outcome);

struct CoordinatorStatus {
    bool running = false;
    std::optional<queue::QueueItem> current;
    transcode::SessionState session_state = transcode::SessionState::IDLE;
    std::optional<std::filesystem::path> media_path;
    std::optional<storage::ReclaimReport> last_reclaim;
    size_t queue_depth = 0;
};

// Pulls items off the queue source one at a time and drives each through
// acquisition and transcoding. Only this class retries.
class QueueCoordinator {
public:
    QueueCoordinator(const CoordinatorConfig& config,
                     queue::QueueSource& source,
                     acquisition::MediaAcquirer& acquirer,
                     transcode::TranscodeSupervisor& supervisor,
                     storage::StorageReclaimer& reclaimer,
                     storage::ActiveAssetRegistry& registry,
                     utils::Metrics& metrics);
    ~QueueCoordinator();

    QueueCoordinator(const QueueCoordinator&) = delete;
    QueueCoordinator& operator=(const QueueCoordinator&) = delete;

    void Start();
    void Stop();

    // Ends the current item early; it is reported as completed.
    // Returns false when nothing is in flight.
    bool SkipCurrent();

    CoordinatorStatus GetStatus() const;

    // One loop iteration. Returns true if an item was processed.
    bool RunOnce();

    ItemOutcome ProcessItem(queue::QueueItem item);

    storage::ReclaimReport ReclaimNow();

    int AttemptsFor(const std::string& item_id) const;

private:
    void RunLoop();
    void MaybeReclaim(bool queue_idle);
    bool SleepFor(std::chrono::milliseconds duration);

    ItemOutcome Complete(queue::QueueItem& item);
    ItemOutcome HandleFailure(queue::QueueItem& item, const std::string& reason);
    ItemOutcome Interrupt(queue::QueueItem& item);
    void Transition(queue::QueueItem& item, queue::ItemState state);
    void PublishStatus();

    CoordinatorConfig config_;
    queue::QueueSource& source_;
    acquisition::MediaAcquirer& acquirer_;
    transcode::TranscodeSupervisor& supervisor_;
    storage::StorageReclaimer& reclaimer_;
    storage::ActiveAssetRegistry& registry_;
    utils::Metrics& metrics_;

    // Single-flight item processing
    std::mutex process_mutex_;
    // Held from download until pin, and by every reclaim pass
    std::mutex media_mutex_;

    mutable std::mutex attempts_mutex_;
    std::unordered_map<std::string, int> attempts_;

    mutable std::mutex status_mutex_;
    std::optional<queue::QueueItem> current_;
    std::optional<storage::ReclaimReport> last_reclaim_;
    size_t queue_depth_ = 0;

    std::atomic<bool> skip_requested_{false};
    std::atomic<bool> stopping_{false};
    std::chrono::steady_clock::time_point last_cleanup_{};

    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    std::atomic<bool> running_{false};
    bool loop_exited_ = false;
    std::mutex join_mutex_;
    std::thread loop_thread_;
};

} // namespace jukebox::stream::coordinator
