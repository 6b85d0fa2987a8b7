#include "scoreflow/core/rule_registry.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace scoreflow {
namespace core {

namespace {
    constexpr const char* MISSING_ZERO = "score-missing-zero";
    constexpr const char* MISSING_IGNORE = "score-missing-ignore";
    constexpr double MILLIS_PER_MINUTE = 60000.0;
    constexpr double MAX_DROP_COUNT = 1000000.0;

    Result<void> invalid(const std::string& rule, const std::string& message) {
        return Error{ErrorCode::InvalidConfiguration, "Rule '" + rule + "': " + message};
    }

    // Validates an optional trailing missing-value policy at params[index].
    Result<void> checkMissingPolicy(const std::string& rule,
                                    const std::vector<RuleParam>& params,
                                    std::size_t index) {
        if (params.size() > index + 1) {
            return invalid(rule, "too many parameters");
        }
        if (params.size() == index + 1) {
            const auto* policy = std::get_if<std::string>(&params[index]);
            if (!policy || (*policy != MISSING_ZERO && *policy != MISSING_IGNORE)) {
                return invalid(rule, std::string("missing-value policy must be '") +
                               MISSING_ZERO + "' or '" + MISSING_IGNORE + "'");
            }
        }
        return Result<void>();
    }

    // score-missing-zero imputes 0; score-missing-ignore or no policy leaves the item Absent.
    ScoreValue missingValue(const std::vector<RuleParam>& params, std::size_t index) {
        if (params.size() > index) {
            const auto* policy = std::get_if<std::string>(&params[index]);
            if (policy && *policy == MISSING_ZERO) {
                return 0.0;
            }
        }
        return std::nullopt;
    }

    std::vector<double> scoresOf(const std::vector<RuleInput>& inputs) {
        std::vector<double> scores;
        scores.reserve(inputs.size());
        for (const auto& input : inputs) {
            scores.push_back(input.score);
        }
        return scores;
    }

    double mean(const std::vector<double>& values) {
        return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
    }

    class AverageRule : public ScoringRule {
    public:
        std::string getId() const override { return "average"; }

        Result<void> validateParams(const std::vector<RuleParam>& params) const override {
            return checkMissingPolicy(getId(), params, 0);
        }

        ScoreValue evaluate(const std::vector<RuleInput>& inputs,
                            const std::vector<RuleParam>& /*params*/) const override {
            if (inputs.empty()) return std::nullopt;
            return mean(scoresOf(inputs));
        }

        ScoreValue valueWhenMissing(const std::vector<RuleParam>& params) const override {
            return missingValue(params, 0);
        }
    };

    // Drops the single lowest score; a lone score is used as is.
    class DropLowestRule : public ScoringRule {
    public:
        std::string getId() const override { return "dropLowest"; }

        Result<void> validateParams(const std::vector<RuleParam>& params) const override {
            return checkMissingPolicy(getId(), params, 0);
        }

        ScoreValue evaluate(const std::vector<RuleInput>& inputs,
                            const std::vector<RuleParam>& /*params*/) const override {
            if (inputs.empty()) return std::nullopt;
            auto scores = scoresOf(inputs);
            if (scores.size() == 1) return scores.front();
            double sum = std::accumulate(scores.begin(), scores.end(), 0.0);
            double lowest = *std::min_element(scores.begin(), scores.end());
            return (sum - lowest) / static_cast<double>(scores.size() - 1);
        }

        ScoreValue valueWhenMissing(const std::vector<RuleParam>& params) const override {
            return missingValue(params, 0);
        }
    };

    // Drops the N lowest scores; with N or fewer scores the best one is used.
    class DropNLowestRule : public ScoringRule {
    public:
        std::string getId() const override { return "dropNLowest"; }

        Result<void> validateParams(const std::vector<RuleParam>& params) const override {
            if (params.empty()) {
                return invalid(getId(), "requires the number of scores to drop");
            }
            const auto* n = std::get_if<double>(&params[0]);
            if (!n || *n < 0 || std::floor(*n) != *n) {
                return invalid(getId(), "number to drop must be a non-negative integer");
            }
            if (*n > MAX_DROP_COUNT) {
                return invalid(getId(), "number to drop must not exceed 1000000");
            }
            return checkMissingPolicy(getId(), params, 1);
        }

        ScoreValue evaluate(const std::vector<RuleInput>& inputs,
                            const std::vector<RuleParam>& params) const override {
            if (inputs.empty()) return std::nullopt;
            const auto n = static_cast<std::size_t>(std::get<double>(params[0]));
            auto sorted = scoresOf(inputs);
            std::sort(sorted.begin(), sorted.end());
            if (sorted.size() <= n) {
                return sorted.back();
            }
            std::vector<double> kept(sorted.begin() + static_cast<std::ptrdiff_t>(n), sorted.end());
            return mean(kept);
        }

        ScoreValue valueWhenMissing(const std::vector<RuleParam>& params) const override {
            return missingValue(params, 1);
        }
    };

    // Scores of 50 and above count as 100, the rest as 0.
    class BinaryProportionRule : public ScoringRule {
    public:
        std::string getId() const override { return "binaryProportion"; }

        Result<void> validateParams(const std::vector<RuleParam>& params) const override {
            return checkMissingPolicy(getId(), params, 0);
        }

        ScoreValue evaluate(const std::vector<RuleInput>& inputs,
                            const std::vector<RuleParam>& /*params*/) const override {
            if (inputs.empty()) return std::nullopt;
            double passed = 0;
            for (const auto& input : inputs) {
                if (input.score >= 50) passed += 100;
            }
            return passed / static_cast<double>(inputs.size());
        }

        ScoreValue valueWhenMissing(const std::vector<RuleParam>& params) const override {
            return missingValue(params, 0);
        }
    };

    /**
     * Averages scores decayed by lateness. A score recorded L minutes after
     * the deadline counts as score * 2^(-min(max(L, 0), cap) / halving).
     *
     * Params: deadline (epoch ms), halving (minutes, > 0), optional cap (minutes).
     */
    class DecayedAverageRule : public ScoringRule {
    public:
        std::string getId() const override { return "decayedAverage"; }

        Result<void> validateParams(const std::vector<RuleParam>& params) const override {
            if (params.size() < 2 || params.size() > 3) {
                return invalid(getId(), "expects deadline, halving and an optional cap");
            }
            for (const auto& param : params) {
                if (!std::holds_alternative<double>(param)) {
                    return invalid(getId(), "parameters must be numeric");
                }
            }
            if (std::get<double>(params[1]) <= 0) {
                return invalid(getId(), "halving time must be positive");
            }
            if (params.size() == 3 && std::get<double>(params[2]) < 0) {
                return invalid(getId(), "cap must not be negative");
            }
            return Result<void>();
        }

        ScoreValue evaluate(const std::vector<RuleInput>& inputs,
                            const std::vector<RuleParam>& params) const override {
            if (inputs.empty()) return std::nullopt;
            const double deadline = std::get<double>(params[0]);
            const double halving = std::get<double>(params[1]);
            const double cap = params.size() == 3 ? std::get<double>(params[2])
                                                  : std::numeric_limits<double>::infinity();
            double total = 0;
            for (const auto& input : inputs) {
                double late = (static_cast<double>(input.timestamp) - deadline) / MILLIS_PER_MINUTE;
                double exponent = std::min(std::max(late, 0.0), cap) / halving;
                total += input.score * std::pow(2.0, -exponent);
            }
            return total / static_cast<double>(inputs.size());
        }
    };
}

std::shared_ptr<RuleRegistry> RuleRegistry::withBuiltinRules() {
    auto registry = std::make_shared<RuleRegistry>();
    registry->registerRule(std::make_shared<AverageRule>());
    registry->registerRule(std::make_shared<DropLowestRule>());
    registry->registerRule(std::make_shared<DropNLowestRule>());
    registry->registerRule(std::make_shared<BinaryProportionRule>());
    registry->registerRule(std::make_shared<DecayedAverageRule>());
    return registry;
}

} // namespace core
} // namespace scoreflow
