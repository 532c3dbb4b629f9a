#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

// One-shot broadcast signal.
//
// A Gate starts Pending and moves to Signaled on the first signal().
// Later signals are no-ops. Every waiter wakes, and a wait() that starts
// after the transition returns immediately, so there is no missed wakeup.
//
// subscribe() registers a callback that runs exactly once, on the thread
// that signals the gate, or on the subscribing thread if the gate is
// already signaled. Callbacks run under the gate's lock: they must be
// short and must not call back into the same gate.
class Gate {
public:
    using Callback = std::function<void()>;

    // Unsubscribes on destruction. Once the destructor returns, the
    // callback is neither running nor going to run.
    class Subscription {
    public:
        Subscription() = default;
        ~Subscription();

        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;
        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        void reset();

    private:
        friend class Gate;
        Subscription(Gate* gate, uint64_t id) : gate_(gate), id_(id) {}

        Gate* gate_ = nullptr;
        uint64_t id_ = 0;
    };

    Gate() = default;
    Gate(const Gate&) = delete;
    Gate& operator=(const Gate&) = delete;

    // Returns true only for the call that performed the transition.
    bool signal();
    bool is_signaled() const;
    void wait() const;

    Subscription subscribe(Callback cb);

private:
    void unsubscribe(uint64_t id);

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool signaled_ = false;
    uint64_t next_id_ = 1;
    std::map<uint64_t, Callback> subscribers_;
};
