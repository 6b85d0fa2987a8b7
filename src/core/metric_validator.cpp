#include "scoreflow/core/metric_validator.h"
#include "scoreflow/utils/logging.hpp"
#include <algorithm>
#include <cmath>
#include <set>

namespace scoreflow {
namespace core {

MetricValidator::MetricValidator(std::shared_ptr<const MetricDefinitionStore> definitions,
                                 std::shared_ptr<CoverageResolver> coverage,
                                 std::shared_ptr<const RuleEvaluator> rules,
                                 const utils::RetryPolicy& retryPolicy)
    : definitions_(std::move(definitions))
    , coverage_(std::move(coverage))
    , rules_(std::move(rules))
    , retryPolicy_(retryPolicy) {}

Result<void> MetricValidator::validate(const MetricDefinition& metric) {
    auto chain = checkSubmetricChain(metric);
    if (chain.has_error()) {
        return chain;
    }

    auto timeFilter = checkTimeFilter(metric);
    if (timeFilter.has_error()) {
        return timeFilter;
    }

    auto weights = checkTagWeights(metric);
    if (weights.has_error()) {
        return weights;
    }

    auto rule = rules_->validate(metric.rule);
    if (rule.has_error()) {
        return rule;
    }

    auto level = inputLevel(metric);
    if (level.has_error()) {
        return level.error();
    }
    return checkCoverage(metric, level.value());
}

MetricValidator::ValidationResult MetricValidator::check(const MetricDefinition& metric) {
    ValidationResult result{metric.id, std::nullopt, {}};
    auto outcome = validate(metric);
    if (outcome.has_error()) {
        result.error = outcome.error();
        return result;
    }
    result.warnings = findWarnings(metric);
    return result;
}

Result<std::vector<MetricValidator::ValidationResult>> MetricValidator::validateAll() {
    auto listed = utils::attemptWithRetry(retryPolicy_, "definition listing", [&]() {
        return definitions_->list();
    });
    if (listed.has_error()) {
        return listed.error();
    }

    std::vector<ValidationResult> results;
    results.reserve(listed.value().size());
    for (const auto& metric : listed.value()) {
        auto result = check(metric);
        if (!result.isValid()) {
            SFLOG_WARN("Metric '" << metric.id << "' is invalid: " << result.error->describe());
        }
        for (const auto& warning : result.warnings) {
            SFLOG_INFO("Metric '" << metric.id << "': " << warning);
        }
        results.push_back(std::move(result));
    }
    return results;
}

Result<Level> MetricValidator::inputLevel(const MetricDefinition& metric) {
    if (!metric.submetric) {
        return metric.level;
    }
    auto sub = findDefinition(*metric.submetric);
    if (sub.has_error()) {
        return sub.error();
    }
    if (!sub.value()) {
        return Error{ErrorCode::UnknownMetric,
                     "Submetric '" + *metric.submetric + "' of '" + metric.id + "' does not exist"};
    }
    return sub.value()->level;
}

Result<std::optional<MetricDefinition>> MetricValidator::findDefinition(const std::string& metricId) {
    return utils::attemptWithRetry(retryPolicy_, "definition lookup", [&]() {
        return definitions_->find(metricId);
    });
}

Result<void> MetricValidator::checkSubmetricChain(const MetricDefinition& metric) {
    if (!metric.submetric) {
        return Result<void>();
    }

    // Each definition names at most one submetric, so the references form a
    // chain; it either ends, reaches a missing definition or loops.
    std::set<std::string> visited{metric.id};
    std::vector<std::string> path{metric.id};
    std::optional<MetricDefinition> direct;
    std::optional<std::string> missing;
    std::optional<std::string> next = metric.submetric;
    while (next) {
        path.push_back(*next);
        if (!visited.insert(*next).second) {
            std::string cycle;
            for (const auto& id : path) {
                cycle += cycle.empty() ? id : " -> " + id;
            }
            return Error{ErrorCode::CyclicMetricReference, "Submetric chain loops: " + cycle};
        }
        auto found = findDefinition(*next);
        if (found.has_error()) {
            return found.error();
        }
        if (!found.value()) {
            missing = *next;
            break;
        }
        if (!direct) {
            direct = found.value();
        }
        next = found.value()->submetric;
    }

    if (missing) {
        return Error{ErrorCode::UnknownMetric,
                     "Submetric '" + *missing + "' referenced from '" + metric.id + "' does not exist"};
    }
    if (!isBelow(direct->level, metric.level)) {
        return Error{ErrorCode::InvalidConfiguration,
                     "Submetric '" + direct->id + "' is at " + toString(direct->level) +
                     ", which is not below " + toString(metric.level)};
    }
    return Result<void>();
}

Result<void> MetricValidator::checkTimeFilter(const MetricDefinition& metric) const {
    if (metric.timeFilter.start > metric.timeFilter.end) {
        return Error{ErrorCode::InvalidConfiguration,
                     "Time filter starts at " + std::to_string(metric.timeFilter.start) +
                     ", after its end " + std::to_string(metric.timeFilter.end)};
    }
    return Result<void>();
}

Result<void> MetricValidator::checkTagWeights(const MetricDefinition& metric) const {
    if (!metric.tagWeights) {
        return Result<void>();
    }
    for (const auto& [tag, weight] : *metric.tagWeights) {
        if (!std::isfinite(weight) || weight < 0) {
            return Error{ErrorCode::InvalidConfiguration,
                         "Weight of tag '" + tag + "' must be a non-negative number"};
        }
    }
    return Result<void>();
}

Result<void> MetricValidator::checkCoverage(const MetricDefinition& metric, Level inputLevel) {
    // Include ids must exist at the input level at all before the scope is considered.
    if (std::holds_alternative<Coverage::Include>(metric.coverage.selection)) {
        auto unscoped = coverage_->resolve(inputLevel, metric.coverage);
        if (unscoped.has_error()) {
            return unscoped.error();
        }
    }
    auto scoped = coverage_->resolveFor(metric, inputLevel);
    if (scoped.has_error()) {
        return scoped.error();
    }
    return Result<void>();
}

std::vector<std::string> MetricValidator::findWarnings(const MetricDefinition& metric) {
    std::vector<std::string> warnings;

    if (metric.tagWeights && !metric.tagWeights->empty() &&
        std::all_of(metric.tagWeights->begin(), metric.tagWeights->end(),
                    [](const auto& entry) { return entry.second == 0; })) {
        warnings.push_back("all tag weights are zero, every aggregate will be absent");
    }

    if (metric.submetric && metric.submissionKind) {
        warnings.push_back("submission kind '" + *metric.submissionKind +
                           "' is ignored because the metric reads a submetric");
    }

    auto level = inputLevel(metric);
    if (level.has_value()) {
        auto items = coverage_->resolveFor(metric, level.value());
        if (items.has_value() && items.value().empty()) {
            warnings.push_back(std::string("coverage selects no ") + toString(level.value()) + " items");
        }
    }
    return warnings;
}

} // namespace core
} // namespace scoreflow
