#ifndef TRANSACTION_ENGINE_H
#define TRANSACTION_ENGINE_H

#include "read_planner.hpp"
#include "retry_policy.hpp"
#include "transaction_lock.hpp"
#include "transport.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * @struct EngineSettings
 * @brief Transaction settings not covered by the retry policy.
 */
struct EngineSettings {
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds cooldown{0};
    bool atomic_multi_write = true;
    bool reconnect_on_demand = false;
};

/**
 * @class TransactionEngine
 * @brief Owns the single connection and runs every request against it in turn.
 *
 * Each operation waits for the FIFO transaction lock, runs all of its wire
 * requests (including retries with backoff) and releases the lock again, so
 * no two requests are ever in flight at once. When a request exhausts its
 * attempts, or a deadline expires while a request is in flight, the connection
 * is torn down and the engine turns unhealthy: later operations fail with
 * ConnectionUnavailable until reconnect() succeeds, or, with
 * reconnect_on_demand, each later operation tries one fresh connect first.
 */
class TransactionEngine {
public:
    using Clock = std::chrono::steady_clock;
    using Deadline = Clock::time_point;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    /**
     * @param factory Opens connections; called on open() and on every reconnect.
     * @param retry Backoff policy applied to each wire request.
     * @param settings Connect timeout, cooldown and write options.
     * @param sleeper Used for backoff and cooldown pauses; defaults to sleeping the calling thread.
     */
    TransactionEngine(std::shared_ptr<TransportFactory> factory, RetryPolicy retry,
                      EngineSettings settings, Sleeper sleeper = Sleeper());
    ~TransactionEngine();

    TransactionEngine(const TransactionEngine&) = delete;
    TransactionEngine& operator=(const TransactionEngine&) = delete;

    /**
     * @brief Opens the first connection.
     * @throw ConnectionError if it cannot be opened.
     */
    void open();

    /**
     * @brief Replaces the current connection with a fresh one (a single attempt).
     * @throw ConnectionError if connecting fails; the engine stays unhealthy.
     * @throw ConnectionUnavailable if the engine was closed.
     */
    void reconnect();

    /// @brief Closes the connection for good. Safe to call more than once.
    void close();

    bool isHealthy() const { return healthy; }

    /**
     * @brief Executes a whole read plan under one lock acquisition.
     * @param deadline Bound on waiting plus executing; none waits indefinitely.
     * @return The words of every range, in plan order.
     * @throw TransportError if any range fails; no partial result is returned.
     * @throw ConnectionUnavailable if the engine is unhealthy or closed.
     */
    RegisterSnapshot read(int unit_id, const ReadPlan& plan, const std::optional<Deadline>& deadline);

    /**
     * @brief Writes consecutive registers.
     *
     * One word uses a single-register write. Several words use one multi-register
     * write when allowed and supported, otherwise single writes in ascending
     * address order.
     * @param name Register name used in error reports.
     * @throw PartialWriteFailure if a sequential write stops after confirming some registers.
     * @throw PermissionDenied if the device refuses the write; it is not retried.
     * @throw TransportError, ConnectionUnavailable as read().
     */
    void write(int unit_id, const std::string& name, uint16_t address, const std::vector<uint16_t>& words,
               const std::optional<Deadline>& deadline);

    /**
     * @brief Single write attempt without retries, reconnects or exceptions.
     * @return True if the device acknowledged the write.
     */
    bool tryWriteOnce(int unit_id, uint16_t address, uint16_t value);

private:
    void acquire(const std::optional<Deadline>& deadline);
    void ensureUsable();
    void connectLocked();
    void teardown(const std::string& reason);
    void cooldown();
    void execute(const std::string& operation, uint16_t address, uint16_t count,
                 const std::optional<Deadline>& deadline,
                 const std::function<void(ModbusTransport&)>& request);

    std::shared_ptr<TransportFactory> factory;
    RetryPolicy retry;
    EngineSettings settings;
    Sleeper sleeper;
    TransactionLock lock;
    std::unique_ptr<ModbusTransport> transport;
    std::atomic<bool> healthy;
    std::atomic<bool> closed;
};

#endif // TRANSACTION_ENGINE_H
