#pragma once

#include "scoreflow/core/coverage_cache.h"
#include "scoreflow/core/metric_types.h"
#include "scoreflow/core/stores.h"
#include "scoreflow/utils/result.hpp"
#include "scoreflow/utils/retry.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scoreflow {
namespace core {

/**
 * @brief Turns a coverage declaration into a concrete, sorted set of item ids.
 *
 * Candidates are the catalog items at the requested level, narrowed to the
 * scope item and its descendants when a scope is given.
 *
 * - All: every candidate.
 * - Include(ids): exactly ids; an id that is not a candidate fails with UnknownItem.
 * - Exclude(ids): every candidate not in ids; unknown ids are ignored.
 *
 * Results are cached per (level, scope, coverage, catalog version).
 */
class CoverageResolver {
public:
    CoverageResolver(std::shared_ptr<const ContentCatalog> catalog,
                     const CacheConfig& cacheConfig,
                     const utils::RetryPolicy& retryPolicy = utils::RetryPolicy{});

    Result<std::vector<std::string>> resolve(Level level,
                                             const Coverage& coverage,
                                             const std::optional<std::string>& scope = std::nullopt);

    /**
     * @brief Resolves a metric's coverage at its input level.
     *
     * With a scope override, Include ids outside that scope are dropped
     * instead of failing.
     *
     * @param metric The metric whose coverage to resolve
     * @param inputLevel The metric's level, or its submetric's level when it has one
     * @param scopeOverride Scope to use instead of metric.scope (submetric evaluation)
     */
    Result<std::vector<std::string>> resolveFor(const MetricDefinition& metric,
                                                Level inputLevel,
                                                const std::optional<std::string>& scopeOverride = std::nullopt);

    /**
     * @brief Checks whether an item is part of a resolved coverage set.
     */
    Result<bool> covers(Level level,
                        const Coverage& coverage,
                        const std::optional<std::string>& scope,
                        const std::string& itemId);

    CacheStats cacheStats() const { return cache_.get_stats(); }
    void clearCache() { cache_.clear(); }

private:
    std::shared_ptr<const ContentCatalog> catalog_;
    CoverageCache cache_;
    utils::RetryPolicy retryPolicy_;

    Result<std::vector<std::string>> candidates(Level level, const std::optional<std::string>& scope);
    Result<bool> isWithinScope(const ContentItem& item, const std::string& scope);
};

} // namespace core
} // namespace scoreflow
