#include <gtest/gtest.h>
#include <concurrency/gate.hpp>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST(Gate, StartsPending) {
    Gate gate;
    EXPECT_FALSE(gate.is_signaled());
}

TEST(Gate, OnlyFirstSignalTransitions) {
    Gate gate;
    EXPECT_TRUE(gate.signal());
    EXPECT_FALSE(gate.signal());
    EXPECT_TRUE(gate.is_signaled());
}

TEST(Gate, WaitAfterSignalReturnsImmediately) {
    Gate gate;
    gate.signal();
    gate.wait();
    SUCCEED();
}

TEST(Gate, WakesEveryWaiter) {
    Gate gate;
    std::atomic<int> woke{0};
    std::vector<std::thread> waiters;
    for (int i = 0; i < 4; i++) {
        waiters.emplace_back([&] {
            gate.wait();
            woke++;
        });
    }
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(woke.load(), 0);

    gate.signal();
    for (auto& t : waiters) t.join();
    EXPECT_EQ(woke.load(), 4);
}

TEST(Gate, SubscriberFiresOnceOnSignal) {
    Gate gate;
    int calls = 0;
    auto sub = gate.subscribe([&] { calls++; });
    EXPECT_EQ(calls, 0);

    gate.signal();
    gate.signal();
    EXPECT_EQ(calls, 1);
}

TEST(Gate, SubscribeAfterSignalFiresImmediately) {
    Gate gate;
    gate.signal();
    int calls = 0;
    auto sub = gate.subscribe([&] { calls++; });
    EXPECT_EQ(calls, 1);
}

TEST(Gate, DroppedSubscriptionNeverFires) {
    Gate gate;
    int calls = 0;
    {
        auto sub = gate.subscribe([&] { calls++; });
    }
    gate.signal();
    EXPECT_EQ(calls, 0);
}

TEST(Gate, MovedSubscriptionStaysActive) {
    Gate gate;
    int calls = 0;
    Gate::Subscription outer;
    {
        auto inner = gate.subscribe([&] { calls++; });
        outer = std::move(inner);
    }
    gate.signal();
    EXPECT_EQ(calls, 1);
}

TEST(Gate, ResetUnsubscribes) {
    Gate gate;
    int calls = 0;
    auto sub = gate.subscribe([&] { calls++; });
    sub.reset();
    gate.signal();
    EXPECT_EQ(calls, 0);
}
