#include "service/config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace jukebox::stream::service {

namespace {

const char* const kOptionNames[] = {
    "board-path", "media-dir", "hls-dir", "status-file",
    "max-storage-mb", "cleanup-interval-hours", "retention-hours",
    "poll-interval-ms", "error-backoff-ms", "verify-delay-ms", "grace-period-ms",
    "stop-timeout-ms", "max-attempts", "download-timeout-s",
    "ffmpeg-path", "grpc-addr", "metrics-addr", "log-level", "log-file",
};

std::string EnvName(const std::string& option) {
    std::string env = "JUKEBOX_";
    for (char c : option) {
        env.push_back(c == '-' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return env;
}

int64_t ParseNumber(const std::string& name, const std::string& value, int64_t min, int64_t max) {
    size_t pos = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid value for " + name + ": '" + value + "'");
    }
    if (pos != value.size() || parsed < min || parsed > max) {
        throw std::invalid_argument("invalid value for " + name + ": '" + value + "' (expected " +
                                    std::to_string(min) + ".." + std::to_string(max) + ")");
    }
    return parsed;
}

int ParseInt(const std::string& name, const std::string& value, int min) {
    return static_cast<int>(ParseNumber(name, value, min, std::numeric_limits<int>::max()));
}

std::string RequireNonEmpty(const std::string& name, const std::string& value) {
    if (value.empty()) throw std::invalid_argument(name + " must not be empty");
    return value;
}

} // namespace

Config Config::LoadFromEnv() {
    Config c;
    for (const char* name : kOptionNames) {
        if (const char* env = std::getenv(EnvName(name).c_str())) {
            c.Set(name, env);
        }
    }
    return c;
}

void Config::ApplyArgs(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            help = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0) {
            throw std::invalid_argument("unexpected argument: " + arg);
        }

        std::string name = arg.substr(2);
        std::string value;
        auto eq = name.find('=');
        if (eq != std::string::npos) {
            value = name.substr(eq + 1);
            name = name.substr(0, eq);
        } else if (i + 1 < argc) {
            value = argv[++i];
        } else {
            throw std::invalid_argument("missing value for --" + name);
        }

        if (!Set(name, value)) {
            throw std::invalid_argument("unknown option: --" + name);
        }
    }
}

bool Config::Set(const std::string& name, const std::string& value) {
    if (name == "board-path") board_path = RequireNonEmpty(name, value);
    else if (name == "media-dir") media_dir = RequireNonEmpty(name, value);
    else if (name == "hls-dir") hls_dir = RequireNonEmpty(name, value);
    else if (name == "status-file") status_file = value;
    else if (name == "max-storage-mb") max_storage_mb = static_cast<uint64_t>(ParseNumber(name, value, 1, 1LL << 40));
    else if (name == "cleanup-interval-hours") cleanup_interval_hours = ParseInt(name, value, 1);
    else if (name == "retention-hours") retention_hours = ParseInt(name, value, 0);
    else if (name == "poll-interval-ms") poll_interval_ms = ParseInt(name, value, 1);
    else if (name == "error-backoff-ms") error_backoff_ms = ParseInt(name, value, 0);
    else if (name == "verify-delay-ms") verify_delay_ms = ParseInt(name, value, 0);
    else if (name == "grace-period-ms") grace_period_ms = ParseInt(name, value, 1);
    else if (name == "stop-timeout-ms") stop_timeout_ms = ParseInt(name, value, 0);
    else if (name == "max-attempts") max_attempts = ParseInt(name, value, 1);
    else if (name == "download-timeout-s") download_timeout_s = ParseInt(name, value, 1);
    else if (name == "ffmpeg-path") ffmpeg_path = RequireNonEmpty(name, value);
    else if (name == "grpc-addr") grpc_addr = RequireNonEmpty(name, value);
    else if (name == "metrics-addr") metrics_addr = value;
    else if (name == "log-level") log_level = RequireNonEmpty(name, value);
    else if (name == "log-file") log_file = value;
    else return false;
    return true;
}

std::string Config::Usage() {
    std::string usage = "Usage: jukebox-stream [--option value]...\n\nOptions (environment variable in brackets):\n";
    for (const char* name : kOptionNames) {
        usage += "  --" + std::string(name) + " [" + EnvName(name) + "]\n";
    }
    usage += "  --help\n";
    return usage;
}

std::string Config::StatusFilePath() const {
    if (!status_file.empty()) return status_file;
    return (std::filesystem::path(hls_dir) / "status.json").string();
}

coordinator::CoordinatorConfig Config::ToCoordinatorConfig() const {
    coordinator::CoordinatorConfig c;
    c.poll_interval = std::chrono::milliseconds(poll_interval_ms);
    c.error_backoff = std::chrono::milliseconds(error_backoff_ms);
    c.cleanup_interval = std::chrono::hours(cleanup_interval_hours);
    c.stop_timeout = std::chrono::milliseconds(stop_timeout_ms);
    c.max_attempts = max_attempts;
    c.status_file = StatusFilePath();
    return c;
}

transcode::SupervisorConfig Config::ToSupervisorConfig() const {
    transcode::SupervisorConfig c;
    c.ffmpeg_path = ffmpeg_path;
    c.hls_dir = hls_dir;
    c.verify_delay = std::chrono::milliseconds(verify_delay_ms);
    c.grace_period = std::chrono::milliseconds(grace_period_ms);
    return c;
}

storage::ReclaimConfig Config::ToReclaimConfig() const {
    storage::ReclaimConfig c;
    c.media_dir = media_dir;
    c.max_bytes = max_storage_mb * 1024 * 1024;
    c.retention = std::chrono::hours(retention_hours);
    return c;
}

acquisition::AcquirerConfig Config::ToAcquirerConfig() const {
    acquisition::AcquirerConfig c;
    c.media_dir = media_dir;
    c.download_timeout = std::chrono::seconds(download_timeout_s);
    return c;
}

} // namespace jukebox::stream::service
