#include "retry_policy.hpp"
#include "inverter_errors.hpp"

RetryPolicy::RetryPolicy(int max_attempts, std::chrono::milliseconds base_delay, std::chrono::milliseconds max_delay)
    : attempts(max_attempts), base(base_delay), cap(max_delay) {
    if (attempts < 1) {
        throw ConfigError("retry_attempts must be at least 1");
    }
    if (base.count() < 0 || cap < base) {
        throw ConfigError("retry delays must satisfy 0 <= retry_base_delay <= retry_max_delay");
    }
}

std::chrono::milliseconds RetryPolicy::delayAfter(int failed_attempt) const {
    std::chrono::milliseconds delay = base;
    for (int i = 1; i < failed_attempt && delay < cap; ++i) {
        delay *= 2;
    }
    return delay < cap ? delay : cap;
}
