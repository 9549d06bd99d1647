#include "Logging.hpp"
#include <algorithm>
#include <cctype>

spdlog::level::level_enum parseLogLevel(std::string level_str) {
    std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (level_str == "trace") {
        return spdlog::level::trace;
    } else if (level_str == "debug") {
        return spdlog::level::debug;
    } else if (level_str == "info") {
        return spdlog::level::info;
    } else if (level_str == "warn") {
        return spdlog::level::warn;
    } else if (level_str == "error") {
        return spdlog::level::err;
    } else if (level_str == "off" || level_str == "none") {
        return spdlog::level::off;
    }
    return spdlog::level::info;
}

void configureLogging(const std::string& level, const std::string& pattern) {
    spdlog::set_pattern(pattern);
    spdlog::set_level(parseLogLevel(level));
}

LogTap::LogTap(std::string prefix, spdlog::level::level_enum level)
    : prefix_(std::move(prefix)), level_(level) {}

bool LogTap::enabled(spdlog::level::level_enum level) const {
    auto threshold = level_.load();
    return threshold != spdlog::level::off && level >= threshold;
}

void LogTap::debug(const std::string& message) const {
    if (enabled(spdlog::level::debug)) {
        write(spdlog::level::debug, message);
    }
}

void LogTap::info(const std::string& message) const {
    if (enabled(spdlog::level::info)) {
        write(spdlog::level::info, message);
    }
}

void LogTap::write(spdlog::level::level_enum level, const std::string& message) const {
    spdlog::log(level, "{} {}", prefix_, message);
}
