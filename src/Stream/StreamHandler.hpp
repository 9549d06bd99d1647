#pragma once

#include "../Broadcast/Broadcaster.hpp"
#include "../Clock/Clock.hpp"
#include "../Errors/Errors.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

template <typename T, typename P = std::string>
class StreamHandler {
public:
    using Handler = std::function<void(std::exception_ptr, T)>;
    using Query = std::function<void(const P&, Handler)>;
    using Stream = Broadcaster<T>;

    StreamHandler(std::string key, Query query_once,
                  std::chrono::milliseconds throttle_window, Clock clock)
        : key_(std::move(key)),
          query_once_(std::move(query_once)),
          throttle_window_(throttle_window),
          clock_(std::move(clock)),
          stream_(Stream::create(true)) {}

    StreamHandler(const StreamHandler&) = delete;
    StreamHandler& operator=(const StreamHandler&) = delete;

    // Returns whether the query ran.
    bool update(const P& payload) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cleared_) {
                return false;
            }
            auto now = clock_();
            if (window_start_ && now - *window_start_ < throttle_window_) {
                spdlog::debug("[StreamHandler] Dropped throttled update for key: {}", key_);
                return false;
            }
            window_start_ = now;
        }
        runQuery(payload);
        return true;
    }

    void clear() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cleared_) {
                return;
            }
            cleared_ = true;
        }
        stream_->complete();
    }

    bool cleared() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cleared_;
    }

    const std::string& key() const { return key_; }
    std::chrono::milliseconds throttleWindow() const { return throttle_window_; }
    std::shared_ptr<Stream> stream() const { return stream_; }

private:
    void runQuery(const P& payload) {
        auto stream = stream_;
        auto key = key_;
        auto settled = std::make_shared<std::atomic<bool>>(false);

        Handler on_done = [stream, key, settled](std::exception_ptr error, T value) {
            if (settled->exchange(true)) {
                return;
            }
            if (error) {
                FetchError failure(key, error);
                spdlog::debug("[StreamHandler] Ignoring failed refresh: {}", failure.what());
                return;
            }
            if (!stream->emit(value)) {
                spdlog::debug("[StreamHandler] Discarded result for cleared stream: {}", key);
            }
        };

        try {
            query_once_(payload, on_done);
        } catch (...) {
            on_done(std::current_exception(), T{});
        }
    }

    const std::string key_;
    const Query query_once_;
    const std::chrono::milliseconds throttle_window_;
    const Clock clock_;
    const std::shared_ptr<Stream> stream_;

    mutable std::mutex mutex_;
    std::optional<TimePoint> window_start_;
    bool cleared_ = false;
};
