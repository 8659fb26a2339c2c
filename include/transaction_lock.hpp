#ifndef TRANSACTION_LOCK_H
#define TRANSACTION_LOCK_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

/**
 * @class TransactionLock
 * @brief Mutual exclusion lock granted in arrival order.
 *
 * Waiters queue up and are served first come, first served, so a steady
 * stream of callers cannot starve an earlier one. A waiter that gives up
 * leaves the queue without blocking those behind it.
 */
class TransactionLock {
public:
    using Deadline = std::chrono::steady_clock::time_point;

    /**
     * @brief Waits for the lock.
     * @param deadline Latest time to keep waiting; wait forever when empty.
     * @return True when the lock is held, false if the deadline passed first.
     */
    bool acquire(const std::optional<Deadline>& deadline = std::nullopt);

    void release();

    /// @brief Number of callers currently waiting.
    size_t waiting() const;

private:
    mutable std::mutex queue_mutex;
    std::condition_variable turn_changed;
    std::deque<uint64_t> queue;
    uint64_t next_ticket = 0;
    bool held = false;
};

/**
 * @class TransactionGuard
 * @brief Releases a held TransactionLock when it goes out of scope.
 */
class TransactionGuard {
public:
    explicit TransactionGuard(TransactionLock& lock) : lock(lock) {}
    ~TransactionGuard() { lock.release(); }

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

private:
    TransactionLock& lock;
};

#endif // TRANSACTION_LOCK_H
