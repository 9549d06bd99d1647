#pragma once

#include "Subscription.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

// Subscribers are invoked in subscription order, outside the state lock.
template <typename T>
class Broadcaster : public std::enable_shared_from_this<Broadcaster<T>> {
public:
    using ValueCallback = std::function<void(const T&)>;
    using ErrorCallback = std::function<void(std::exception_ptr)>;
    using CompleteCallback = std::function<void()>;

    enum class State {
        OPEN,
        COMPLETED,
        FAILED
    };

    static std::shared_ptr<Broadcaster> create(bool replay_last = true) {
        return std::shared_ptr<Broadcaster>(new Broadcaster(replay_last));
    }

    Broadcaster(const Broadcaster&) = delete;
    Broadcaster& operator=(const Broadcaster&) = delete;

    Subscription subscribe(ValueCallback on_value,
                           ErrorCallback on_error = {},
                           CompleteCallback on_complete = {}) {
        std::lock_guard<std::recursive_mutex> delivery(delivery_mutex_);

        auto alive = std::make_shared<std::atomic<bool>>(true);
        std::optional<T> replay;
        State state;
        std::exception_ptr error;
        std::uint64_t id = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            replay = last_value_;
            state = state_;
            error = error_;
            if (state_ == State::OPEN) {
                id = next_id_++;
                subscribers_.emplace(id, Subscriber{on_value, on_error, on_complete, alive});
            }
        }

        if (replay && on_value) {
            deliver([&] { on_value(*replay); });
        }

        if (state != State::OPEN) {
            alive->store(false);
            if (state == State::FAILED && on_error) {
                deliver([&] { on_error(error); });
            } else if (state == State::COMPLETED && on_complete) {
                deliver([&] { on_complete(); });
            }
            return Subscription(alive, {});
        }

        std::weak_ptr<Broadcaster> weak = this->shared_from_this();
        return Subscription(alive, [weak, id] {
            if (auto self = weak.lock()) {
                self->remove(id);
            }
        });
    }

    // Returns false when the broadcaster is already terminated.
    bool emit(const T& value) {
        std::lock_guard<std::recursive_mutex> delivery(delivery_mutex_);

        std::vector<Subscriber> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != State::OPEN) {
                return false;
            }
            if (replay_last_) {
                last_value_ = value;
            }
            targets.reserve(subscribers_.size());
            for (const auto& entry : subscribers_) {
                targets.push_back(entry.second);
            }
        }

        for (auto& subscriber : targets) {
            if (!subscriber.alive->load() || !subscriber.on_value) {
                continue;
            }
            deliver([&] { subscriber.on_value(value); });
        }
        return true;
    }

    bool fail(std::exception_ptr error) {
        std::lock_guard<std::recursive_mutex> delivery(delivery_mutex_);

        auto targets = terminate(State::FAILED, error);
        if (!targets) {
            return false;
        }
        for (auto& subscriber : *targets) {
            if (subscriber.on_error) {
                deliver([&] { subscriber.on_error(error); });
            }
        }
        return true;
    }

    bool complete() {
        std::lock_guard<std::recursive_mutex> delivery(delivery_mutex_);

        auto targets = terminate(State::COMPLETED, nullptr);
        if (!targets) {
            return false;
        }
        for (auto& subscriber : *targets) {
            if (subscriber.on_complete) {
                deliver([&] { subscriber.on_complete(); });
            }
        }
        return true;
    }

    std::optional<T> lastValue() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_value_;
    }

    std::size_t subscriberCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscribers_.size();
    }

    State state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    bool closed() const { return state() != State::OPEN; }

private:
    struct Subscriber {
        ValueCallback on_value;
        ErrorCallback on_error;
        CompleteCallback on_complete;
        std::shared_ptr<std::atomic<bool>> alive;
    };

    explicit Broadcaster(bool replay_last) : replay_last_(replay_last) {}

    void remove(std::uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex_);
        subscribers_.erase(id);
    }

    std::optional<std::vector<Subscriber>> terminate(State state, std::exception_ptr error) {
        std::vector<Subscriber> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != State::OPEN) {
                return std::nullopt;
            }
            state_ = state;
            error_ = error;
            targets.reserve(subscribers_.size());
            for (auto& entry : subscribers_) {
                targets.push_back(std::move(entry.second));
            }
            subscribers_.clear();
        }
        std::vector<Subscriber> live;
        for (auto& subscriber : targets) {
            if (subscriber.alive->exchange(false)) {
                live.push_back(std::move(subscriber));
            }
        }
        return live;
    }

    template <typename Fn>
    static void deliver(Fn&& fn) {
        try {
            fn();
        } catch (const std::exception& e) {
            spdlog::error("[Broadcaster] Subscriber callback error: {}", e.what());
        } catch (...) {
            spdlog::error("[Broadcaster] Subscriber callback error: unknown exception");
        }
    }

    const bool replay_last_;

    mutable std::mutex mutex_;
    std::recursive_mutex delivery_mutex_;
    State state_ = State::OPEN;
    std::optional<T> last_value_;
    std::exception_ptr error_;
    std::map<std::uint64_t, Subscriber> subscribers_;
    std::uint64_t next_id_ = 1;
};
