#pragma once

#include "scoreflow/utils/logging.hpp"
#include "scoreflow/utils/result.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <string>
#include <thread>

namespace scoreflow {
namespace utils {

/**
 * @brief Bounded retry policy for calls into external stores.
 */
struct RetryPolicy {
    uint8_t maxRetries{2};                               // Retries after the first attempt
    std::chrono::milliseconds retryInterval{20};         // Base delay, doubled on every retry
    std::chrono::milliseconds maxRetryDelay{1000};       // Upper bound for a single delay
};

/**
 * @brief Runs operation until it succeeds, fails with a non-transient error,
 * or the retry budget is spent.
 *
 * Only ErrorCode::StoreUnavailable is considered transient.
 *
 * @param policy Retry budget and backoff
 * @param what Description used in log lines
 * @param operation Callable returning Result<T>
 */
template <typename Operation>
auto attemptWithRetry(const RetryPolicy& policy, const std::string& what, Operation&& operation)
    -> decltype(operation()) {
    for (uint8_t attempt = 0;; ++attempt) {
        auto result = operation();
        if (!result.has_error() || result.error().code != ErrorCode::StoreUnavailable) {
            if (attempt > 0 && !result.has_error()) {
                SFLOG_DEBUG(what << " succeeded after " << static_cast<int>(attempt) << " retries");
            }
            return result;
        }
        if (attempt >= policy.maxRetries) {
            SFLOG_WARN(what << " failed after " << static_cast<int>(policy.maxRetries)
                       << " retries: " << result.error().message);
            return result;
        }

        // Exponential backoff
        auto backoff = static_cast<double>(policy.retryInterval.count()) * std::pow(2.0, attempt);
        auto delay = std::min(backoff, static_cast<double>(policy.maxRetryDelay.count()));
        SFLOG_DEBUG("Retrying " << what << " in " << delay << "ms (attempt "
                    << static_cast<int>(attempt) + 1 << "): " << result.error().message);
        std::this_thread::sleep_for(std::chrono::milliseconds(static_cast<long>(delay)));
    }
}

} // namespace utils
} // namespace scoreflow
