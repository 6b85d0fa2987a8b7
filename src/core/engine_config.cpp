#include "scoreflow/core/engine_config.h"
#include "scoreflow/utils/logging.hpp"
#include <cmath>
#include <fstream>
#include <limits>

namespace scoreflow {
namespace core {

using nlohmann::json;

namespace {
    Error invalid(const std::string& message) {
        return Error{ErrorCode::InvalidConfiguration, "Engine configuration: " + message};
    }

    constexpr std::int64_t MAX_WORKER_THREADS = 256;
    constexpr std::int64_t MAX_FAILURE_RECORDS = 10000000;
    constexpr std::int64_t MAX_CACHE_ENTRIES = 10000000;

    // Counts are read signed so that negative input is rejected instead of wrapping.
    Result<std::int64_t> readCount(const json& object, const std::string& field, std::int64_t fallback,
                                   std::int64_t min, std::int64_t max) {
        const std::int64_t value = object.value(field, fallback);
        if (value < min || value > max) {
            return invalid(field + " must be between " + std::to_string(min) + " and " +
                           std::to_string(max) + ", got " + std::to_string(value));
        }
        return value;
    }
}

Result<EngineConfig> EngineConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        return invalid("expected a JSON object");
    }

    EngineConfig config;
    try {
        auto workers = readCount(j, "workerThreads", static_cast<std::int64_t>(config.workerThreads),
                                 1, MAX_WORKER_THREADS);
        if (workers.has_error()) {
            return workers.error();
        }
        config.workerThreads = static_cast<std::size_t>(workers.value());
        config.coalescingDelay = std::chrono::milliseconds(
            j.value("coalescingDelayMs", static_cast<std::int64_t>(config.coalescingDelay.count())));
        config.dependencyTimeout = std::chrono::milliseconds(
            j.value("dependencyTimeoutMs", static_cast<std::int64_t>(config.dependencyTimeout.count())));
        if (config.coalescingDelay.count() < 0 || config.dependencyTimeout.count() <= 0) {
            return invalid("coalescingDelayMs must not be negative and dependencyTimeoutMs must be positive");
        }
        auto failureRecords = readCount(j, "maxFailureRecords",
                                        static_cast<std::int64_t>(config.maxFailureRecords),
                                        0, MAX_FAILURE_RECORDS);
        if (failureRecords.has_error()) {
            return failureRecords.error();
        }
        config.maxFailureRecords = static_cast<std::size_t>(failureRecords.value());

        if (j.contains("storeRetry")) {
            const auto& retry = j.at("storeRetry");
            auto retries = readCount(retry, "maxRetries", config.storeRetry.maxRetries,
                                     0, std::numeric_limits<std::uint8_t>::max());
            if (retries.has_error()) {
                return retries.error();
            }
            config.storeRetry.maxRetries = static_cast<std::uint8_t>(retries.value());
            config.storeRetry.retryInterval = std::chrono::milliseconds(
                retry.value("intervalMs", static_cast<std::int64_t>(config.storeRetry.retryInterval.count())));
            config.storeRetry.maxRetryDelay = std::chrono::milliseconds(
                retry.value("maxDelayMs", static_cast<std::int64_t>(config.storeRetry.maxRetryDelay.count())));
        }

        if (j.contains("coverageCache")) {
            const auto& cache = j.at("coverageCache");
            auto maxEntries = readCount(cache, "maxEntries",
                                        static_cast<std::int64_t>(config.coverageCache.max_entries),
                                        1, MAX_CACHE_ENTRIES);
            if (maxEntries.has_error()) {
                return maxEntries.error();
            }
            config.coverageCache.max_entries = static_cast<std::size_t>(maxEntries.value());
            config.coverageCache.ttl = std::chrono::seconds(
                cache.value("ttlSeconds", static_cast<std::int64_t>(config.coverageCache.ttl.count())));
            config.coverageCache.track_stats = cache.value("trackStats", config.coverageCache.track_stats);
        }

        if (j.contains("aggregation")) {
            const auto& aggregation = j.at("aggregation");
            config.aggregation.missingTagWeight =
                aggregation.value("missingTagWeight", config.aggregation.missingTagWeight);
            if (!std::isfinite(config.aggregation.missingTagWeight) ||
                config.aggregation.missingTagWeight < 0) {
                return invalid("aggregation.missingTagWeight must be a non-negative number");
            }
            if (aggregation.contains("absentInputs")) {
                auto policy = parseAbsentInputPolicy(aggregation.at("absentInputs").get<std::string>());
                if (!policy) {
                    return invalid("aggregation.absentInputs must be 'exclude' or 'zero'");
                }
                config.aggregation.absentInputs = *policy;
            }
        }

        config.logLevel = j.value("logLevel", config.logLevel);
        if (utils::parseLogLevel(config.logLevel) < 0) {
            return invalid("unknown logLevel '" + config.logLevel + "'");
        }
    } catch (const json::exception& e) {
        return invalid(e.what());
    }
    return config;
}

Result<EngineConfig> EngineConfig::fromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return invalid("cannot open '" + path + "'");
    }
    try {
        return fromJson(json::parse(in));
    } catch (const json::parse_error& e) {
        return invalid("'" + path + "' is not valid JSON: " + e.what());
    }
}

json EngineConfig::toJson() const {
    return json{
        {"workerThreads", workerThreads},
        {"coalescingDelayMs", coalescingDelay.count()},
        {"dependencyTimeoutMs", dependencyTimeout.count()},
        {"maxFailureRecords", maxFailureRecords},
        {"storeRetry", {
            {"maxRetries", storeRetry.maxRetries},
            {"intervalMs", storeRetry.retryInterval.count()},
            {"maxDelayMs", storeRetry.maxRetryDelay.count()}
        }},
        {"coverageCache", {
            {"maxEntries", coverageCache.max_entries},
            {"ttlSeconds", coverageCache.ttl.count()},
            {"trackStats", coverageCache.track_stats}
        }},
        {"aggregation", {
            {"missingTagWeight", aggregation.missingTagWeight},
            {"absentInputs", toString(aggregation.absentInputs)}
        }},
        {"logLevel", logLevel}
    };
}

void EngineConfig::applyLogLevel() const {
    int level = utils::parseLogLevel(logLevel);
    if (level < 0) {
        SFLOG_WARN("Ignoring unknown log level '" << logLevel << "'");
        return;
    }
    utils::setLogLevel(level);
}

} // namespace core
} // namespace scoreflow
