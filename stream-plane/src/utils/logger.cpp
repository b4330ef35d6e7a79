#include "logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <vector>

namespace jukebox::stream::utils {

void Logger::Init(const std::string& log_level, const std::string& log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file));
    }

    auto logger = std::make_shared<spdlog::logger>("jukebox", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    if (log_level == "trace") spdlog::set_level(spdlog::level::trace);
    else if (log_level == "debug") spdlog::set_level(spdlog::level::debug);
    else if (log_level == "info") spdlog::set_level(spdlog::level::info);
    else if (log_level == "warn") spdlog::set_level(spdlog::level::warn);
    else if (log_level == "error") spdlog::set_level(spdlog::level::err);
    else spdlog::set_level(spdlog::level::info);

    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::flush_on(spdlog::level::warn);
}

namespace {

// Masks the value of a query parameter such as "token=abc" -> "token=***".
std::string MaskQueryParam(std::string url, const std::string& name) {
    size_t pos = 0;
    const std::string needle = name + "=";
    while ((pos = url.find(needle, pos)) != std::string::npos) {
        if (pos == 0 || (url[pos - 1] != '?' && url[pos - 1] != '&')) {
            pos += needle.size();
            continue;
        }
        size_t value_start = pos + needle.size();
        size_t value_end = url.find_first_of("&#", value_start);
        if (value_end == std::string::npos) value_end = url.size();
        url.replace(value_start, value_end - value_start, "***");
        pos = value_start + 3;
    }
    return url;
}

} // namespace

std::string Logger::RedactUrl(const std::string& url) {
    auto pos_prot = url.find("://");
    if (pos_prot == std::string::npos) return url;

    std::string prot = url.substr(0, pos_prot);
    if (prot != "http" && prot != "https" && prot != "rtsp" && prot != "rtsps") return url;

    std::string result = url;
    auto authority_end = result.find_first_of("/?#", pos_prot + 3);
    auto pos_at = result.find('@', pos_prot + 3);
    if (pos_at != std::string::npos && (authority_end == std::string::npos || pos_at < authority_end)) {
        result = prot + "://***:***" + result.substr(pos_at);
    }

    result = MaskQueryParam(result, "key");
    result = MaskQueryParam(result, "token");
    return result;
}

} // namespace jukebox::stream::utils
