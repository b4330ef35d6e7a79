#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace jukebox::stream::utils {

class Logger {
public:
    static void Init(const std::string& log_level, const std::string& log_file = "");
    static std::string RedactUrl(const std::string& url);
};

} // namespace jukebox::stream::utils
