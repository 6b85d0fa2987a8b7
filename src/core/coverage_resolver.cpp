#include "scoreflow/core/coverage_resolver.h"
#include "scoreflow/utils/logging.hpp"
#include <algorithm>
#include <iterator>
#include <set>
#include <unordered_set>

namespace scoreflow {
namespace core {

namespace {
    // Parent chains are short (at most program -> namespace -> lesson -> component),
    // anything longer means the catalog has a loop.
    constexpr int MAX_ANCESTOR_DEPTH = 16;
}

CoverageResolver::CoverageResolver(std::shared_ptr<const ContentCatalog> catalog,
                                   const CacheConfig& cacheConfig,
                                   const utils::RetryPolicy& retryPolicy)
    : catalog_(std::move(catalog))
    , cache_(cacheConfig)
    , retryPolicy_(retryPolicy) {}

Result<std::vector<std::string>> CoverageResolver::resolve(Level level,
                                                           const Coverage& coverage,
                                                           const std::optional<std::string>& scope) {
    const auto key = CoverageKey::make(level, coverage, scope, catalog_->version());
    if (auto cached = cache_.get(key)) {
        return *cached;
    }

    auto candidateResult = candidates(level, scope);
    if (candidateResult.has_error()) {
        return candidateResult.error();
    }
    const auto& candidateIds = candidateResult.value();

    std::set<std::string> selected;
    if (std::holds_alternative<Coverage::All>(coverage.selection)) {
        selected.insert(candidateIds.begin(), candidateIds.end());
    } else if (const auto* include = std::get_if<Coverage::Include>(&coverage.selection)) {
        std::unordered_set<std::string> known(candidateIds.begin(), candidateIds.end());
        for (const auto& id : include->ids) {
            if (known.count(id) == 0) {
                return Error{ErrorCode::UnknownItem,
                             "Coverage includes '" + id + "', which is not a " +
                             toString(level) + " item" +
                             (scope ? " under '" + *scope + "'" : std::string())};
            }
            selected.insert(id);
        }
    } else if (const auto* exclude = std::get_if<Coverage::Exclude>(&coverage.selection)) {
        std::unordered_set<std::string> excluded(exclude->ids.begin(), exclude->ids.end());
        for (const auto& id : candidateIds) {
            if (excluded.count(id) == 0) {
                selected.insert(id);
            }
        }
    }

    std::vector<std::string> items(selected.begin(), selected.end());
    cache_.put(key, items);
    SFLOG_DEBUG("Resolved coverage " << coverage.canonical() << " at " << toString(level)
                << " to " << items.size() << " items");
    return items;
}

Result<std::vector<std::string>> CoverageResolver::resolveFor(const MetricDefinition& metric,
                                                              Level inputLevel,
                                                              const std::optional<std::string>& scopeOverride) {
    if (!scopeOverride) {
        return resolve(inputLevel, metric.coverage, metric.scope);
    }
    const auto* include = std::get_if<Coverage::Include>(&metric.coverage.selection);
    if (!include) {
        return resolve(inputLevel, metric.coverage, scopeOverride);
    }

    // Evaluated per item of a parent metric: an Include list spans the whole
    // catalog, so keep only the ids that fall under this scope.
    auto scoped = resolve(inputLevel, Coverage::all(), scopeOverride);
    if (scoped.has_error()) {
        return scoped.error();
    }
    std::vector<std::string> wanted(include->ids);
    std::sort(wanted.begin(), wanted.end());
    std::vector<std::string> items;
    std::set_intersection(scoped.value().begin(), scoped.value().end(),
                          wanted.begin(), wanted.end(), std::back_inserter(items));
    return items;
}

Result<bool> CoverageResolver::covers(Level level,
                                      const Coverage& coverage,
                                      const std::optional<std::string>& scope,
                                      const std::string& itemId) {
    auto resolved = resolve(level, coverage, scope);
    if (resolved.has_error()) {
        return resolved.error();
    }
    const auto& items = resolved.value();
    return std::binary_search(items.begin(), items.end(), itemId);
}

Result<std::vector<std::string>> CoverageResolver::candidates(Level level,
                                                              const std::optional<std::string>& scope) {
    auto itemsResult = utils::attemptWithRetry(retryPolicy_, "catalog lookup", [&]() {
        return catalog_->itemsAtLevel(level);
    });
    if (itemsResult.has_error()) {
        return itemsResult.error();
    }

    if (scope) {
        auto scopeItem = utils::attemptWithRetry(retryPolicy_, "catalog lookup", [&]() {
            return catalog_->findItem(*scope);
        });
        if (scopeItem.has_error()) {
            return scopeItem.error();
        }
        if (!scopeItem.value()) {
            return Error{ErrorCode::UnknownItem, "Scope '" + *scope + "' does not exist"};
        }
    }

    std::vector<std::string> ids;
    for (const auto& item : itemsResult.value()) {
        if (scope) {
            auto within = isWithinScope(item, *scope);
            if (within.has_error()) {
                return within.error();
            }
            if (!within.value()) {
                continue;
            }
        }
        ids.push_back(item.id);
    }
    return ids;
}

Result<bool> CoverageResolver::isWithinScope(const ContentItem& item, const std::string& scope) {
    if (item.id == scope) {
        return true;
    }
    std::optional<std::string> parent = item.parentId;
    for (int depth = 0; parent && depth < MAX_ANCESTOR_DEPTH; ++depth) {
        if (*parent == scope) {
            return true;
        }
        auto parentItem = utils::attemptWithRetry(retryPolicy_, "catalog lookup", [&]() {
            return catalog_->findItem(*parent);
        });
        if (parentItem.has_error()) {
            return parentItem.error();
        }
        if (!parentItem.value()) {
            return false;
        }
        parent = parentItem.value()->parentId;
    }
    return false;
}

} // namespace core
} // namespace scoreflow
