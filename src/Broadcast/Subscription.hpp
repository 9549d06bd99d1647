#pragma once

#include <atomic>
#include <functional>
#include <memory>

// Handle returned by Broadcaster::subscribe. Copies share the same
// subscription; dropping every copy does not unsubscribe.
class Subscription {
public:
    Subscription() = default;
    Subscription(std::shared_ptr<std::atomic<bool>> alive, std::function<void()> cancel);

    void unsubscribe();
    bool active() const;

private:
    std::shared_ptr<std::atomic<bool>> alive_;
    std::function<void()> cancel_;
};
