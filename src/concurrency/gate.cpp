#include "gate.hpp"
#include <utility>

// ── Subscription ──────────────────────────────────────────

Gate::Subscription::~Subscription() {
    reset();
}

Gate::Subscription::Subscription(Subscription&& other) noexcept
    : gate_(other.gate_), id_(other.id_) {
    other.gate_ = nullptr;
    other.id_ = 0;
}

Gate::Subscription& Gate::Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        gate_ = other.gate_;
        id_ = other.id_;
        other.gate_ = nullptr;
        other.id_ = 0;
    }
    return *this;
}

void Gate::Subscription::reset() {
    if (gate_) gate_->unsubscribe(id_);
    gate_ = nullptr;
    id_ = 0;
}

// ── Gate ──────────────────────────────────────────────────

bool Gate::signal() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (signaled_) return false;
    signaled_ = true;

    // Each subscriber fires once; clearing the map makes the later
    // unsubscribe() calls no-ops.
    auto subscribers = std::move(subscribers_);
    subscribers_.clear();
    for (auto& entry : subscribers) {
        entry.second();
    }

    cv_.notify_all();
    return true;
}

bool Gate::is_signaled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return signaled_;
}

void Gate::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return signaled_; });
}

Gate::Subscription Gate::subscribe(Callback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (signaled_) {
        cb();
        return Subscription{};
    }
    uint64_t id = next_id_++;
    subscribers_.emplace(id, std::move(cb));
    return Subscription{this, id};
}

void Gate::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(id);
}
