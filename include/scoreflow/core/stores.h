#pragma once

#include "scoreflow/core/metric_types.h"
#include "scoreflow/utils/result.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace scoreflow {
namespace core {

/**
 * @brief Read-only view of the content hierarchy.
 *
 * Implementations must be safe to call from several threads at once.
 * Transient failures are reported as ErrorCode::StoreUnavailable.
 */
class ContentCatalog {
public:
    virtual ~ContentCatalog() = default;

    /**
     * @brief Lists every item that exists at the given level.
     */
    virtual Result<std::vector<ContentItem>> itemsAtLevel(Level level) const = 0;

    /**
     * @brief Looks up a single item.
     *
     * @return std::nullopt if the item does not exist
     */
    virtual Result<std::optional<ContentItem>> findItem(const std::string& itemId) const = 0;

    /**
     * @brief Monotonic version, bumped on every catalog change.
     *
     * Used to key cached coverage resolutions.
     */
    virtual std::uint64_t version() const = 0;
};

/**
 * @brief Append-only feed of raw submissions. The engine never writes to it.
 */
class SubmissionFeed {
public:
    virtual ~SubmissionFeed() = default;

    /**
     * @brief Returns all submissions of a learner on an item, in insertion order.
     */
    virtual Result<std::vector<Submission>> submissionsFor(const std::string& learnerId,
                                                           const std::string& itemId) const = 0;

    /**
     * @brief Returns the ids of every learner with at least one submission.
     */
    virtual Result<std::vector<std::string>> learners() const = 0;
};

/**
 * @brief Read access to metric definitions. Edited by administrators, never by the engine.
 */
class MetricDefinitionStore {
public:
    virtual ~MetricDefinitionStore() = default;

    virtual Result<std::optional<MetricDefinition>> find(const std::string& metricId) const = 0;
    virtual Result<std::vector<MetricDefinition>> list() const = 0;
};

/**
 * @brief The engine's only write surface.
 */
class ScoreStore {
public:
    virtual ~ScoreStore() = default;

    /**
     * @brief Inserts or wholesale replaces the score stored under score.key.
     */
    virtual Result<void> upsert(const Score& score) = 0;

    virtual Result<std::optional<Score>> find(const ScoreKey& key) const = 0;

    /**
     * @brief Timestamp of the most recent successful upsert for a metric.
     */
    virtual Result<std::optional<EpochMillis>> lastUpdated(const std::string& metricId) const = 0;
};

} // namespace core
} // namespace scoreflow
