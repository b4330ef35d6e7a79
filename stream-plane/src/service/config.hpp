#pragma once
#include <cstdint>
#include <string>
#include "acquisition/gst_media_acquirer.hpp"
#include "coordinator/queue_coordinator.hpp"
#include "storage/storage_reclaimer.hpp"
#include "transcode/transcode_supervisor.hpp"

namespace jukebox::stream::service {

// Defaults, then JUKEBOX_* environment variables, then --flags. Every setting
// is reachable both ways: --media-dir <-> JUKEBOX_MEDIA_DIR.
struct Config {
    std::string board_path = "board.json";
    std::string media_dir = "media";
    std::string hls_dir = "hls";
    std::string status_file; // empty: <hls_dir>/status.json

    uint64_t max_storage_mb = 5000;
    int cleanup_interval_hours = 24;
    int retention_hours = 0;

    int poll_interval_ms = 1000;
    int error_backoff_ms = 5000;
    int verify_delay_ms = 2000;
    int grace_period_ms = 5000;
    int stop_timeout_ms = 10000;
    int max_attempts = 3;
    int download_timeout_s = 300;

    std::string ffmpeg_path = "ffmpeg";

    std::string grpc_addr = "0.0.0.0:50061";
    std::string metrics_addr = "0.0.0.0:9092";
    std::string log_level = "info";
    std::string log_file = "stream_processor.log";

    bool help = false;

    static Config LoadFromEnv();

    // Throws std::invalid_argument on unknown flags or bad values.
    void ApplyArgs(int argc, char** argv);

    // Sets one option by its flag name (without the leading dashes).
    // Returns false if the name is unknown.
    bool Set(const std::string& name, const std::string& value);

    static std::string Usage();

    std::string StatusFilePath() const;
    coordinator::CoordinatorConfig ToCoordinatorConfig() const;
    transcode::SupervisorConfig ToSupervisorConfig() const;
    storage::ReclaimConfig ToReclaimConfig() const;
    acquisition::AcquirerConfig ToAcquirerConfig() const;
};

} // namespace jukebox::stream::service
