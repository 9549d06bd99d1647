#pragma once

#include "../Broadcast/Broadcaster.hpp"
#include <spdlog/spdlog.h>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

template <typename T>
class SingleFlight {
public:
    enum class Result {
        IS_LEADER,
        IS_WAITER
    };

    using Flight = Broadcaster<T>;
    using Handler = std::function<void(std::exception_ptr, T)>;

    struct Ticket {
        Result role;
        std::shared_ptr<Flight> flight;
    };

    SingleFlight() = default;
    ~SingleFlight() = default;

    SingleFlight(const SingleFlight&) = delete;
    SingleFlight& operator=(const SingleFlight&) = delete;

    SingleFlight(SingleFlight&&) = delete;
    SingleFlight& operator=(SingleFlight&&) = delete;

    Ticket doSingleFlight(const std::string& key, Handler on_result) {
        std::shared_ptr<Flight> flight;
        bool is_new_flight = false;

        {
            std::lock_guard<std::mutex> lock(flights_mutex_);
            auto it = flights_.find(key);
            if (it != flights_.end()) {
                flight = it->second;
            } else {
                flight = Flight::create(false);
                flights_[key] = flight;
                is_new_flight = true;
            }
            attach(*flight, std::move(on_result));
        }

        if (!is_new_flight) {
            spdlog::debug("[SingleFlight] Waiting for key: {} ({} waiters)",
                          key, flight->subscriberCount());
            return Ticket{Result::IS_WAITER, flight};
        }

        spdlog::debug("[SingleFlight] Leader for key: {}", key);
        return Ticket{Result::IS_LEADER, flight};
    }

    // Subscribes to an existing flight; returns null when none is outstanding.
    std::shared_ptr<Flight> join(const std::string& key, const Handler& on_result) {
        std::lock_guard<std::mutex> lock(flights_mutex_);
        auto it = flights_.find(key);
        if (it == flights_.end()) {
            return nullptr;
        }
        attach(*it->second, on_result);
        spdlog::debug("[SingleFlight] Waiting for key: {} ({} waiters)",
                      key, it->second->subscriberCount());
        return it->second;
    }

    void notifyResult(const std::string& key, const std::shared_ptr<Flight>& flight, const T& result) {
        release(key, flight);

        std::size_t num_waiters = flight->subscriberCount();
        flight->emit(result);
        flight->complete();

        spdlog::debug("[SingleFlight] Notified {} waiters for key: {}", num_waiters, key);
    }

    void notifyError(const std::string& key, const std::shared_ptr<Flight>& flight, std::exception_ptr error) {
        release(key, flight);

        std::size_t num_waiters = flight->subscriberCount();
        flight->fail(error);

        spdlog::debug("[SingleFlight] Failed {} waiters for key: {}", num_waiters, key);
    }

    bool inFlight(const std::string& key) const {
        std::lock_guard<std::mutex> lock(flights_mutex_);
        return flights_.count(key) != 0;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(flights_mutex_);
        return flights_.size();
    }

private:
    static void attach(Flight& flight, Handler on_result) {
        auto handler = std::make_shared<Handler>(std::move(on_result));
        flight.subscribe(
            [handler](const T& value) { (*handler)(nullptr, value); },
            [handler](std::exception_ptr error) { (*handler)(error, T{}); });
    }

    // Only the flight that owns the map slot removes it.
    void release(const std::string& key, const std::shared_ptr<Flight>& flight) {
        std::lock_guard<std::mutex> lock(flights_mutex_);
        auto it = flights_.find(key);
        if (it == flights_.end()) {
            spdlog::warn("[SingleFlight] No flight found for key: {}", key);
            return;
        }
        if (it->second == flight) {
            flights_.erase(it);
        }
    }

    std::unordered_map<std::string, std::shared_ptr<Flight>> flights_;
    mutable std::mutex flights_mutex_;
};
