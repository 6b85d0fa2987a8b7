#pragma once

#include "scoreflow/core/coverage_resolver.h"
#include "scoreflow/core/metric_types.h"
#include "scoreflow/core/rule_evaluator.h"
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
 * @brief Checks metric definitions at the configuration boundary.
 *
 * Checks run in a fixed order and stop at the first error:
 * submetric cycle, missing submetric, submetric level, time filter,
 * tag weights, rule name, rule parameters, coverage and scope.
 * Neither the submission feed nor the score store is touched.
 */
class MetricValidator {
public:
    /**
     * @brief Outcome of validating one definition.
     */
    struct ValidationResult {
        std::string metricId;
        std::optional<Error> error;               ///< First failed check, if any
        std::vector<std::string> warnings;        ///< Legal but probably unintended settings

        bool isValid() const { return !error.has_value(); }
    };

    MetricValidator(std::shared_ptr<const MetricDefinitionStore> definitions,
                    std::shared_ptr<CoverageResolver> coverage,
                    std::shared_ptr<const RuleEvaluator> rules,
                    const utils::RetryPolicy& retryPolicy = utils::RetryPolicy{});

    /**
     * @brief Validates a definition, which need not be stored yet.
     *
     * StoreUnavailable is returned as is when the definition store cannot be read.
     */
    Result<void> validate(const MetricDefinition& metric);

    /**
     * @brief Validates a definition and collects warnings.
     */
    ValidationResult check(const MetricDefinition& metric);

    /**
     * @brief Validates every stored definition.
     */
    Result<std::vector<ValidationResult>> validateAll();

    /**
     * @brief Level whose items feed the metric: the submetric's level, or the metric's own.
     */
    Result<Level> inputLevel(const MetricDefinition& metric);

private:
    std::shared_ptr<const MetricDefinitionStore> definitions_;
    std::shared_ptr<CoverageResolver> coverage_;
    std::shared_ptr<const RuleEvaluator> rules_;
    utils::RetryPolicy retryPolicy_;

    Result<std::optional<MetricDefinition>> findDefinition(const std::string& metricId);
    Result<void> checkSubmetricChain(const MetricDefinition& metric);
    Result<void> checkTimeFilter(const MetricDefinition& metric) const;
    Result<void> checkTagWeights(const MetricDefinition& metric) const;
    Result<void> checkCoverage(const MetricDefinition& metric, Level inputLevel);
    std::vector<std::string> findWarnings(const MetricDefinition& metric);
};

} // namespace core
} // namespace scoreflow
