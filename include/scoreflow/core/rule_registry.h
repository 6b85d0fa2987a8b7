#pragma once

#include "scoreflow/core/metric_types.h"
#include "scoreflow/utils/result.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace scoreflow {
namespace core {

/**
 * @brief One eligible input to a scoring rule. Absent values are never forwarded.
 */
struct RuleInput {
    double score;
    EpochMillis timestamp;
};

/**
 * @brief A named scoring rule.
 *
 * Implementations are stateless and may be called concurrently.
 */
class ScoringRule {
public:
    virtual ~ScoringRule() = default;

    virtual std::string getId() const = 0;

    /**
     * @brief Checks parameter count and types.
     *
     * @return ErrorCode::InvalidConfiguration describing the first bad parameter
     */
    virtual Result<void> validateParams(const std::vector<RuleParam>& params) const = 0;

    /**
     * @brief Computes a score for one (learner, item).
     *
     * Called only with parameters that passed validateParams().
     * @return std::nullopt when the inputs do not determine a score
     */
    virtual ScoreValue evaluate(const std::vector<RuleInput>& inputs,
                                const std::vector<RuleParam>& params) const = 0;

    /**
     * @brief Score of an item with no eligible input. Absent unless the
     * parameters ask for an imputed value.
     */
    virtual ScoreValue valueWhenMissing(const std::vector<RuleParam>& /*params*/) const {
        return std::nullopt;
    }
};

/**
 * @brief Catalog of scoring rules by name.
 */
class RuleRegistry {
public:
    RuleRegistry() = default;

    /**
     * @brief Creates a registry holding average, dropLowest, dropNLowest,
     * binaryProportion and decayedAverage.
     */
    static std::shared_ptr<RuleRegistry> withBuiltinRules();

    void registerRule(std::shared_ptr<ScoringRule> rule) {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string id = rule->getId();
        rules_[id] = std::move(rule);
    }

    bool unregisterRule(const std::string& ruleId) {
        std::lock_guard<std::mutex> lock(mutex_);
        return rules_.erase(ruleId) > 0;
    }

    bool hasRule(const std::string& ruleId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return rules_.count(ruleId) > 0;
    }

    std::shared_ptr<ScoringRule> getRule(const std::string& ruleId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = rules_.find(ruleId);
        return (it != rules_.end()) ? it->second : nullptr;
    }

    std::vector<std::string> ruleNames() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result;
        for (const auto& [id, rule] : rules_) {
            result.push_back(id);
        }
        return result;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ScoringRule>> rules_;
};

} // namespace core
} // namespace scoreflow
