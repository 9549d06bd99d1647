#include "Subscription.hpp"

Subscription::Subscription(std::shared_ptr<std::atomic<bool>> alive, std::function<void()> cancel)
    : alive_(std::move(alive)), cancel_(std::move(cancel)) {}

void Subscription::unsubscribe() {
    if (!alive_ || !alive_->exchange(false)) {
        return;
    }
    if (cancel_) {
        cancel_();
    }
}

bool Subscription::active() const {
    return alive_ && alive_->load();
}
