#pragma once

#include "scoreflow/core/coverage_cache.h"
#include "scoreflow/core/tag_weighted_aggregator.h"
#include "scoreflow/utils/result.hpp"
#include "scoreflow/utils/retry.hpp"
#include <chrono>
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace scoreflow {
namespace core {

/**
 * @brief Runtime settings of the aggregation engine and its scheduler.
 *
 * JSON form (every key optional):
 * @code
 * {
 *   "workerThreads": 2,
 *   "coalescingDelayMs": 50,
 *   "dependencyTimeoutMs": 5000,
 *   "maxFailureRecords": 1000,
 *   "storeRetry": {"maxRetries": 2, "intervalMs": 20, "maxDelayMs": 1000},
 *   "coverageCache": {"maxEntries": 1000, "ttlSeconds": 300, "trackStats": false},
 *   "aggregation": {"missingTagWeight": 0.0, "absentInputs": "exclude"},
 *   "logLevel": "info"
 * }
 * @endcode
 */
struct EngineConfig {
    /**
     * @brief Number of scheduler worker threads.
     */
    std::size_t workerThreads{2};

    /**
     * @brief How long a Pending key waits for more events before it runs.
     */
    std::chrono::milliseconds coalescingDelay{50};

    /**
     * @brief Longest wait for an in-flight recomputation of the same key.
     */
    std::chrono::milliseconds dependencyTimeout{5000};

    /**
     * @brief Number of recompute failures kept in memory; older ones are dropped.
     */
    std::size_t maxFailureRecords{1000};

    utils::RetryPolicy storeRetry;
    CacheConfig coverageCache;
    AggregationPolicy aggregation;

    /**
     * @brief Minimum log level: debug, info, warn, error or off.
     */
    std::string logLevel{"info"};

    /**
     * @brief Reads a configuration, keeping defaults for missing keys.
     *
     * @return InvalidConfiguration for wrongly typed or out-of-range values
     */
    static Result<EngineConfig> fromJson(const nlohmann::json& json);

    /**
     * @brief Reads a configuration file.
     */
    static Result<EngineConfig> fromFile(const std::string& path);

    nlohmann::json toJson() const;

    /**
     * @brief Applies logLevel to the SFLOG_* macros.
     */
    void applyLogLevel() const;
};

} // namespace core
} // namespace scoreflow
