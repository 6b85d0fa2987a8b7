#include "scoreflow/core/rule_evaluator.h"
#include <cmath>

namespace scoreflow {
namespace core {

RuleEvaluator::RuleEvaluator(std::shared_ptr<const RuleRegistry> registry)
    : registry_(std::move(registry)) {}

Result<std::shared_ptr<ScoringRule>> RuleEvaluator::lookup(const Rule& rule) const {
    const std::string name = rule.name.empty() ? DEFAULT_RULE_NAME : rule.name;
    auto found = registry_->getRule(name);
    if (!found) {
        return Error{ErrorCode::UnknownRule, "Rule '" + name + "' is not registered"};
    }
    return found;
}

Result<void> RuleEvaluator::validate(const Rule& rule) const {
    auto found = lookup(rule);
    if (found.has_error()) {
        return found.error();
    }
    return found.value()->validateParams(rule.params);
}

Result<ScoreValue> RuleEvaluator::evaluate(const Rule& rule, const std::vector<RuleInput>& inputs) const {
    auto found = lookup(rule);
    if (found.has_error()) {
        return found.error();
    }
    if (inputs.empty()) {
        return found.value()->valueWhenMissing(rule.params);
    }

    ScoreValue value = found.value()->evaluate(inputs, rule.params);
    if (value && !std::isfinite(*value)) {
        return ScoreValue{};
    }
    return value;
}

} // namespace core
} // namespace scoreflow
