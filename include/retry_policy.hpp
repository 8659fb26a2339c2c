#ifndef RETRY_POLICY_H
#define RETRY_POLICY_H

#include <chrono>

/**
 * @class RetryPolicy
 * @brief Bounded exponential backoff for transient transport failures.
 *
 * The delay after the n-th failed attempt is base * 2^(n-1), capped at the
 * maximum delay. No jitter is added.
 */
class RetryPolicy {
public:
    /**
     * @param max_attempts Total number of wire attempts, at least 1.
     * @param base_delay Delay after the first failure.
     * @param max_delay Upper bound for any single delay.
     * @throw ConfigError on a zero attempt count, negative delays or max < base.
     */
    RetryPolicy(int max_attempts, std::chrono::milliseconds base_delay, std::chrono::milliseconds max_delay);

    int maxAttempts() const { return attempts; }

    /// @brief True while another attempt may follow the given failed one.
    bool shouldRetry(int failed_attempt) const { return failed_attempt < attempts; }

    std::chrono::milliseconds delayAfter(int failed_attempt) const;

private:
    int attempts;
    std::chrono::milliseconds base;
    std::chrono::milliseconds cap;
};

#endif // RETRY_POLICY_H
