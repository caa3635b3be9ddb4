#include <gtest/gtest.h>
#include <kiln/cache/file_cache.h>

#include "support/temp_dir_scope.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

using namespace kiln;
using namespace std::chrono_literals;
using kiln::test_support::TempDirScope;

TEST(FileCache, PathIsStableHashOfKeyWithShortExtension) {
    auto dir = TempDirScope::unique_under("kiln_cache_test");
    cache::FileCache fc(dir.path());

    auto iso = fc.pathFor("https://example.com/images/base.iso");
    ASSERT_TRUE(iso);
    EXPECT_EQ(iso.value().parent_path(), dir.path());
    EXPECT_EQ(iso.value().extension(), ".iso");
    EXPECT_EQ(iso.value().stem().string().size(), 64u);
    EXPECT_EQ(iso.value(), fc.pathFor("https://example.com/images/base.iso").value());

    // Dots in directory names and long suffixes are not extensions.
    auto noExt = fc.pathFor("dir.d/file");
    ASSERT_TRUE(noExt);
    EXPECT_EQ(noExt.value().extension(), "");
    EXPECT_EQ(fc.pathFor("archive.verylongext").value().extension(), "");
}

TEST(FileCache, EmptyKeyIsRejected) {
    auto dir = TempDirScope::unique_under("kiln_cache_test");
    cache::FileCache fc(dir.path());
    auto lease = fc.acquire("");
    ASSERT_FALSE(lease);
    EXPECT_EQ(lease.error().code, ErrorCode::InvalidArgument);
}

TEST(FileCache, SecondLeaseWaitsForRelease) {
    auto dir = TempDirScope::unique_under("kiln_cache_test");
    cache::FileCache fc(dir.path());

    auto first = fc.acquire("base.iso");
    ASSERT_TRUE(first);
    EXPECT_TRUE(first.value()->held());

    std::atomic<bool> acquired{false};
    auto waiter = std::async(std::launch::async, [&] {
        auto second = fc.acquire("base.iso");
        acquired = true;
        return second;
    });

    std::this_thread::sleep_for(200ms);
    EXPECT_FALSE(acquired.load());

    first.value()->release();
    first.value()->release(); // idempotent
    EXPECT_FALSE(first.value()->held());

    ASSERT_EQ(waiter.wait_for(5s), std::future_status::ready);
    auto second = waiter.get();
    ASSERT_TRUE(second);
    EXPECT_EQ(second.value()->path(), first.value()->path());
}

TEST(FileCache, DifferentKeysDoNotBlock) {
    auto dir = TempDirScope::unique_under("kiln_cache_test");
    cache::FileCache fc(dir.path());
    auto a = fc.acquire("a.img");
    auto b = fc.acquire("b.img");
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_NE(a.value()->path(), b.value()->path());
}

TEST(FileCache, ConcurrentLeasesOnOneKeyAreExclusive) {
    auto dir = TempDirScope::unique_under("kiln_cache_test");
    cache::FileCache fc(dir.path());
    constexpr int kWorkers = 8;
    std::atomic<int> inside{0};
    std::atomic<int> maxInside{0};
    std::atomic<int> completed{0};

    std::vector<std::thread> workers;
    for (int i = 0; i < kWorkers; ++i) {
        workers.emplace_back([&] {
            auto lease = fc.acquire("shared-key");
            ASSERT_TRUE(lease);
            int now = ++inside;
            int prev = maxInside.load();
            while (now > prev && !maxInside.compare_exchange_weak(prev, now)) {
            }
            std::this_thread::sleep_for(10ms);
            --inside;
            lease.value()->release();
            ++completed;
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    EXPECT_EQ(completed.load(), kWorkers);
    EXPECT_EQ(maxInside.load(), 1);
}

TEST(FileCache, DestroyingLeaseReleasesIt) {
    auto dir = TempDirScope::unique_under("kiln_cache_test");
    cache::FileCache fc(dir.path());
    {
        auto lease = fc.acquire("scoped.bin");
        ASSERT_TRUE(lease);
    }
    auto again = std::async(std::launch::async, [&] { return fc.acquire("scoped.bin"); });
    ASSERT_EQ(again.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(again.get());
}
