#pragma once

#include "scoreflow/core/metric_types.h"
#include "scoreflow/core/rule_registry.h"
#include "scoreflow/utils/result.hpp"
#include <memory>
#include <string>
#include <vector>

namespace scoreflow {
namespace core {

/// Rule applied when a metric leaves the rule name empty.
inline constexpr const char* DEFAULT_RULE_NAME = "average";

/**
 * @brief Applies a metric's named rule to the inputs of one (learner, item).
 */
class RuleEvaluator {
public:
    explicit RuleEvaluator(std::shared_ptr<const RuleRegistry> registry);

    /**
     * @brief Checks that the rule exists and its parameters are acceptable.
     *
     * @return UnknownRule or InvalidConfiguration on failure
     */
    Result<void> validate(const Rule& rule) const;

    /**
     * @brief Evaluates the rule.
     *
     * Empty input yields the rule's missing value, Absent unless the rule
     * imputes one. Non-finite results yield Absent.
     * @return UnknownRule if the name is not registered
     */
    Result<ScoreValue> evaluate(const Rule& rule, const std::vector<RuleInput>& inputs) const;

    const RuleRegistry& registry() const { return *registry_; }

private:
    std::shared_ptr<const RuleRegistry> registry_;

    Result<std::shared_ptr<ScoringRule>> lookup(const Rule& rule) const;
};

} // namespace core
} // namespace scoreflow
