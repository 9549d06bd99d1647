#pragma once

#include <spdlog/spdlog.h>
#include <atomic>
#include <functional>
#include <string>
#include <utility>

spdlog::level::level_enum parseLogLevel(std::string level_str);

void configureLogging(const std::string& level, const std::string& pattern);

// Prefix-tagged logger with its own level gate. A tap refers back to its
// LogTap, which must outlive the subscription.
class LogTap {
public:
    explicit LogTap(std::string prefix, spdlog::level::level_enum level = spdlog::level::info);

    void setLevel(spdlog::level::level_enum level) { level_.store(level); }
    spdlog::level::level_enum level() const { return level_.load(); }

    bool enabled(spdlog::level::level_enum level) const;

    void debug(const std::string& message) const;
    void info(const std::string& message) const;

    template <typename T, typename Describe>
    std::function<void(const T&)> tap(Describe describe, spdlog::level::level_enum at = spdlog::level::debug) const {
        const LogTap* self = this;
        return [self, describe, at](const T& value) {
            if (self->enabled(at)) {
                self->write(at, describe(value));
            }
        };
    }

private:
    void write(spdlog::level::level_enum level, const std::string& message) const;

    std::string prefix_;
    std::atomic<spdlog::level::level_enum> level_;
};
