#include <gtest/gtest.h>
#include <kiln/core/cancellation.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace kiln;

TEST(Cancellation, DefaultTokenIsNeverCancelled) {
    CancellationToken token;
    EXPECT_FALSE(token.isCancelled());
    bool ran = false;
    auto id = token.subscribe([&] { ran = true; });
    token.unsubscribe(id);
    EXPECT_FALSE(ran);
}

TEST(Cancellation, CallbacksRunOnceOnFirstCancel) {
    CancellationSource source;
    int calls = 0;
    source.token().subscribe([&] { ++calls; });

    EXPECT_TRUE(source.cancel());
    EXPECT_FALSE(source.cancel());
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(source.token().isCancelled());
}

TEST(Cancellation, SubscribeAfterCancelRunsImmediately) {
    CancellationSource source;
    source.cancel();
    bool ran = false;
    EXPECT_EQ(source.token().subscribe([&] { ran = true; }), 0u);
    EXPECT_TRUE(ran);
}

TEST(Cancellation, SubscriptionUnregistersOnDestruction) {
    CancellationSource source;
    bool ran = false;
    {
        CancellationSubscription sub(source.token(), [&] { ran = true; });
    }
    source.cancel();
    EXPECT_FALSE(ran);
}

TEST(Cancellation, ConcurrentCancelTriggersExactlyOnce) {
    CancellationSource source;
    std::atomic<int> callbacks{0};
    std::atomic<int> winners{0};
    source.token().subscribe([&] { callbacks++; });

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            if (source.cancel()) {
                winners++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(callbacks.load(), 1);
}

TEST(Cancellation, UnsubscribeWaitsForRunningCallback) {
    CancellationSource source;
    std::atomic<bool> firstStarted{false};
    std::atomic<bool> firstFinished{false};
    CancellationSubscription first(source.token(), [&] {
        firstStarted = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        firstFinished = true;
    });

    std::atomic<bool> secondRan{false};
    std::thread canceller;
    {
        std::vector<int> local{1, 2, 3};
        CancellationSubscription second(source.token(), [&] {
            secondRan = !local.empty();
        });
        canceller = std::thread([&] { source.cancel(); });
        while (!firstStarted) {
            std::this_thread::yield();
        }
    }
    // The second callback was removed before it started, so it never runs.
    canceller.join();
    EXPECT_TRUE(firstFinished);
    EXPECT_FALSE(secondRan);
}

TEST(Cancellation, DestroyingSubscriptionBlocksUntilCallbackReturns) {
    CancellationSource source;
    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};
    auto sub = std::make_unique<CancellationSubscription>(source.token(), [&] {
        started = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        finished = true;
    });

    std::thread canceller([&] { source.cancel(); });
    while (!started) {
        std::this_thread::yield();
    }
    sub.reset();
    EXPECT_TRUE(finished);
    canceller.join();
}

TEST(Cancellation, CallbackMayUnsubscribeItself) {
    CancellationSource source;
    auto token = source.token();
    uint64_t id = 0;
    bool ran = false;
    id = token.subscribe([&] {
        token.unsubscribe(id);
        ran = true;
    });
    source.cancel();
    EXPECT_TRUE(ran);
}
