#pragma once

#include "StreamHandler.hpp"
#include "../Clock/Clock.hpp"
#include "../Errors/Errors.hpp"
#include <boost/asio.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class UpdateOutcome {
    UPDATED,
    NOT_UPDATED,
    UNKNOWN_KEY
};

const char* toString(UpdateOutcome outcome);

template <typename T, typename P = std::string>
class StreamRegistry {
public:
    using Handler = typename StreamHandler<T, P>::Handler;
    using Query = typename StreamHandler<T, P>::Query;
    using Stream = Broadcaster<T>;
    using HandlerPtr = std::shared_ptr<StreamHandler<T, P>>;
    using UpdateCallback = std::function<void(UpdateOutcome)>;

    static constexpr std::chrono::milliseconds DEFAULT_THROTTLE{1000};
    static constexpr std::chrono::milliseconds GRACE_DELAY{1};

    explicit StreamRegistry(boost::asio::io_context& io_context, Clock clock = steadyClock())
        : io_context_(io_context), clock_(std::move(clock)) {}

    ~StreamRegistry() { clearAll(); }

    StreamRegistry(const StreamRegistry&) = delete;
    StreamRegistry& operator=(const StreamRegistry&) = delete;

    std::shared_ptr<Stream> registerStream(const std::string& key, Query query_once,
                                           std::chrono::milliseconds throttle_window = DEFAULT_THROTTLE) {
        auto handler = std::make_shared<StreamHandler<T, P>>(key, std::move(query_once), throttle_window, clock_);
        {
            std::lock_guard<std::mutex> lock(streams_mutex_);
            if (streams_.count(key) != 0) {
                throw DuplicateKeyError(key);
            }
            streams_.emplace(key, handler);
        }
        spdlog::info("[StreamRegistry] Registered stream: {} (throttle {} ms)", key, throttle_window.count());
        return handler->stream();
    }

    HandlerPtr getHandler(const std::string& key) const {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        auto it = streams_.find(key);
        return it != streams_.end() ? it->second : nullptr;
    }

    std::shared_ptr<Stream> getStream(const std::string& key) const {
        auto handler = getHandler(key);
        return handler ? handler->stream() : nullptr;
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        return streams_.count(key) != 0;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        return streams_.size();
    }

    void clear(const std::string& key) {
        HandlerPtr handler;
        {
            std::lock_guard<std::mutex> lock(streams_mutex_);
            auto it = streams_.find(key);
            if (it == streams_.end()) {
                return;
            }
            handler = std::move(it->second);
            streams_.erase(it);
        }
        handler->clear();
        spdlog::info("[StreamRegistry] Cleared stream: {}", key);
    }

    void clearAll() {
        std::vector<HandlerPtr> handlers;
        {
            std::lock_guard<std::mutex> lock(streams_mutex_);
            handlers.reserve(streams_.size());
            for (auto& entry : streams_) {
                handlers.push_back(std::move(entry.second));
            }
            streams_.clear();
        }
        for (auto& handler : handlers) {
            handler->clear();
        }
        if (!handlers.empty()) {
            spdlog::info("[StreamRegistry] Cleared {} streams", handlers.size());
        }
    }

    void applyUpdate(const std::string& key, const P& payload = P{}) {
        auto handler = getHandler(key);
        if (handler) {
            handler->update(payload);
        }
    }

    // Values delivered within GRACE_DELAY of the call, such as the replay of
    // an older value, do not count. The query is not cancelled on timeout.
    void applyUpdateAndWait(const std::string& key, const P& payload,
                            std::chrono::milliseconds wait_for, UpdateCallback callback) {
        auto handler = getHandler(key);
        if (!handler) {
            spdlog::debug("[StreamRegistry] applyUpdateAndWait on unknown key: {}", key);
            callback(UpdateOutcome::UNKNOWN_KEY);
            return;
        }

        auto race = std::make_shared<UpdateRace>(io_context_, std::move(callback));
        race->watch(handler->stream());
        handler->update(payload);
        race->arm(wait_for);
    }

private:
    struct UpdateRace : std::enable_shared_from_this<UpdateRace> {
        UpdateRace(boost::asio::io_context& io_context, UpdateCallback cb)
            : strand(boost::asio::make_strand(io_context)),
              deadline(strand),
              callback(std::move(cb)),
              started(std::chrono::steady_clock::now()) {}

        void watch(const std::shared_ptr<Stream>& stream) {
            std::weak_ptr<UpdateRace> weak = this->shared_from_this();
            auto watching = stream->subscribe(
                [weak](const T&) {
                    auto race = weak.lock();
                    if (race && race->confirms()) {
                        boost::asio::post(race->strand, [race] { race->settle(UpdateOutcome::UPDATED); });
                    }
                },
                {},
                [weak] {
                    if (auto race = weak.lock()) {
                        boost::asio::post(race->strand, [race] { race->settle(UpdateOutcome::NOT_UPDATED); });
                    }
                });

            std::lock_guard<std::mutex> lock(mutex);
            if (settled) {
                watching.unsubscribe();
                return;
            }
            subscription = watching;
            listening.store(true);
        }

        void arm(std::chrono::milliseconds wait_for) {
            auto self = this->shared_from_this();
            std::lock_guard<std::mutex> lock(mutex);
            if (settled) {
                return;
            }
            deadline.expires_at(started + wait_for);
            deadline.async_wait([self](const boost::system::error_code& ec) {
                if (!ec) {
                    self->settle(UpdateOutcome::NOT_UPDATED);
                }
            });
        }

        bool confirms() const {
            return listening.load() && std::chrono::steady_clock::now() - started > GRACE_DELAY;
        }

        void settle(UpdateOutcome outcome) {
            Subscription watching;
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (settled) {
                    return;
                }
                settled = true;
                deadline.cancel();
                watching = subscription;
            }
            watching.unsubscribe();
            callback(outcome);
        }

        boost::asio::strand<boost::asio::io_context::executor_type> strand;
        boost::asio::steady_timer deadline;
        UpdateCallback callback;
        const std::chrono::steady_clock::time_point started;

        std::mutex mutex;
        Subscription subscription;
        std::atomic<bool> listening{false};
        bool settled = false;
    };

    boost::asio::io_context& io_context_;
    Clock clock_;

    std::unordered_map<std::string, HandlerPtr> streams_;
    mutable std::mutex streams_mutex_;
};
