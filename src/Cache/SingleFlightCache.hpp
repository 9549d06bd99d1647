#pragma once

#include "CacheStorage.hpp"
#include "../Clock/Clock.hpp"
#include "../Errors/Errors.hpp"
#include "../SingleFlight/SingleFlight.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// Expired entries stay in storage until collect() or a new fetch replaces them.
template <typename T>
class SingleFlightCache {
public:
    using Handler = std::function<void(std::exception_ptr, T)>;
    using Fallback = std::function<void(Handler)>;

    static constexpr std::chrono::milliseconds DEFAULT_TTL{300000};

    struct Stats {
        size_t hits = 0;
        size_t misses = 0;
        size_t joins = 0;
        size_t fetches = 0;
        size_t failures = 0;
    };

    explicit SingleFlightCache(std::shared_ptr<CacheStorage<T>> storage = std::make_shared<MemoryCacheStorage<T>>(),
                               Clock clock = steadyClock(),
                               std::chrono::milliseconds default_ttl = DEFAULT_TTL)
        : storage_(std::move(storage)),
          clock_(std::move(clock)),
          default_ttl_(default_ttl) {}

    SingleFlightCache(const SingleFlightCache&) = delete;
    SingleFlightCache& operator=(const SingleFlightCache&) = delete;

    void get(const std::string& key, Handler handler, Fallback fallback = {}) {
        get(key, std::move(handler), std::move(fallback), default_ttl_);
    }

    void get(const std::string& key, Handler handler, Fallback fallback, std::chrono::milliseconds ttl) {
        std::optional<T> hit;
        std::shared_ptr<typename SingleFlight<T>::Flight> leading;
        bool joined = false;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto cached = validCachedValue(key, ttl);
            if (cached) {
                ++stats_.hits;
                hit = std::move(cached->value);
            } else {
                ++stats_.misses;
                if (fallback) {
                    auto ticket = flights_.doSingleFlight(key, handler);
                    if (ticket.role == SingleFlight<T>::Result::IS_LEADER) {
                        ++stats_.fetches;
                        leading = ticket.flight;
                    } else {
                        ++stats_.joins;
                    }
                    joined = true;
                } else if (flights_.join(key, handler)) {
                    ++stats_.joins;
                    joined = true;
                }
            }
        }

        if (hit) {
            spdlog::debug("[SingleFlightCache] Cache HIT for key: {}", key);
            handler(nullptr, std::move(*hit));
            return;
        }

        if (!joined) {
            spdlog::debug("[SingleFlightCache] Cache MISS without fallback for key: {}", key);
            handler(std::make_exception_ptr(MissingFallbackError(key)), T{});
            return;
        }

        if (leading) {
            startFetch(key, leading, fallback);
        }
    }

    void set(const std::string& key, T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        storage_->set(key, CacheEntry<T>{std::move(value), clock_()});
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return storage_->has(key);
    }

    void collect(const std::string& key) { collect(key, default_ttl_); }

    // Drops the entry once it is at least `ttl` old.
    void collect(const std::string& key, std::chrono::milliseconds ttl) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto cached = storage_->get(key);
        if (cached && clock_() - cached->stored_at >= ttl) {
            storage_->erase(key);
            spdlog::debug("[SingleFlightCache] Collected key: {}", key);
        }
    }

    bool inFlight(const std::string& key) const { return flights_.inFlight(key); }

    std::chrono::milliseconds defaultTtl() const { return default_ttl_; }

    Stats getStats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

private:
    using Flight = typename SingleFlight<T>::Flight;

    std::optional<CacheEntry<T>> validCachedValue(const std::string& key, std::chrono::milliseconds ttl) const {
        auto cached = storage_->get(key);
        if (cached && clock_() - cached->stored_at < ttl) {
            return cached;
        }
        return std::nullopt;
    }

    void startFetch(const std::string& key, const std::shared_ptr<Flight>& flight, const Fallback& fallback) {
        spdlog::debug("[SingleFlightCache] Calling fallback for key: {}", key);

        auto settled = std::make_shared<std::atomic<bool>>(false);
        Handler on_done = [this, key, flight, settled](std::exception_ptr error, T value) {
            if (settled->exchange(true)) {
                spdlog::warn("[SingleFlightCache] Fallback for key {} completed more than once", key);
                return;
            }
            if (error) {
                onFailure(key, flight, error);
            } else {
                onSuccess(key, flight, std::move(value));
            }
        };

        try {
            fallback(on_done);
        } catch (...) {
            on_done(std::current_exception(), T{});
        }
    }

    void onSuccess(const std::string& key, const std::shared_ptr<Flight>& flight, T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            storage_->set(key, CacheEntry<T>{value, clock_()});
        }
        flights_.notifyResult(key, flight, value);
    }

    void onFailure(const std::string& key, const std::shared_ptr<Flight>& flight, std::exception_ptr error) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.failures;
        }
        auto wrapped = FetchError::wrap(key, error);
        spdlog::debug("[SingleFlightCache] Fetch failed for key {}: {}", key, describeException(error));
        flights_.notifyError(key, flight, wrapped);
    }

    std::shared_ptr<CacheStorage<T>> storage_;
    Clock clock_;
    std::chrono::milliseconds default_ttl_;

    SingleFlight<T> flights_;
    Stats stats_;
    mutable std::mutex mutex_;
};
