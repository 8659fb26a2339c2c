#include "transaction_lock.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

void waitForQueue(const TransactionLock& lock, size_t expected) {
    while (lock.waiting() < expected) {
        std::this_thread::sleep_for(1ms);
    }
}

} // namespace

TEST(TransactionLock, GrantsAndReleases) {
    TransactionLock lock;
    ASSERT_TRUE(lock.acquire());
    lock.release();
    ASSERT_TRUE(lock.acquire(std::chrono::steady_clock::now() + 10ms));
    lock.release();
    EXPECT_EQ(lock.waiting(), 0u);
}

TEST(TransactionLock, GivesUpAtDeadline) {
    TransactionLock lock;
    ASSERT_TRUE(lock.acquire());

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(lock.acquire(start + 30ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 30ms);
    EXPECT_EQ(lock.waiting(), 0u);
    lock.release();
}

TEST(TransactionLock, ServesWaitersInArrivalOrder) {
    TransactionLock lock;
    std::mutex order_mutex;
    std::vector<int> order;
    std::vector<std::thread> waiters;

    ASSERT_TRUE(lock.acquire());
    for (int id = 0; id < 5; ++id) {
        waiters.emplace_back([&, id] {
            lock.acquire();
            {
                std::lock_guard<std::mutex> guard(order_mutex);
                order.push_back(id);
            }
            lock.release();
        });
        waitForQueue(lock, static_cast<size_t>(id) + 1);
    }
    lock.release();

    for (auto& waiter : waiters) {
        waiter.join();
    }
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST(TransactionLock, TimedOutWaiterDoesNotBlockLaterOnes) {
    TransactionLock lock;
    std::atomic<bool> early_gave_up{false};
    std::atomic<bool> late_granted{false};

    ASSERT_TRUE(lock.acquire());
    std::thread early([&] { early_gave_up = !lock.acquire(std::chrono::steady_clock::now() + 20ms); });
    waitForQueue(lock, 1);
    std::thread late([&] {
        late_granted = lock.acquire();
        lock.release();
    });

    early.join();
    EXPECT_TRUE(early_gave_up);
    lock.release();
    late.join();
    EXPECT_TRUE(late_granted);
}

TEST(TransactionLock, GuardReleasesOnScopeExit) {
    TransactionLock lock;
    ASSERT_TRUE(lock.acquire());
    {
        TransactionGuard guard(lock);
    }
    EXPECT_TRUE(lock.acquire(std::chrono::steady_clock::now() + 10ms));
    lock.release();
}
