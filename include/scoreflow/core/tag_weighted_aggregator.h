#pragma once

#include "scoreflow/core/metric_types.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace scoreflow {
namespace core {

/**
 * @brief How Absent inputs enter the weighted mean.
 */
enum class AbsentInputPolicy {
    Exclude,      ///< Absent inputs are left out of both sums
    TreatAsZero   ///< Absent inputs count as 0 with their tag's weight
};

const char* toString(AbsentInputPolicy policy);
std::optional<AbsentInputPolicy> parseAbsentInputPolicy(const std::string& name);

struct AggregationPolicy {
    double missingTagWeight{0.0};                           ///< Weight of tags not listed in tagWeights
    AbsentInputPolicy absentInputs{AbsentInputPolicy::Exclude};
};

/**
 * @brief One per-item score entering an aggregation.
 */
struct AggregationInput {
    std::string itemId;
    ScoreValue value;
    std::optional<std::string> tag;
    std::optional<EpochMillis> latestSubmission;  ///< Newest submission behind the value
};

struct AggregateResult {
    ScoreValue value;
    std::vector<Contribution> contributions;
};

/**
 * @brief Combines per-item scores into one score at the metric's level.
 *
 * With tag weights, the result is sum(score * weight) / sum(applied weights).
 * Without tag weights (or with an empty map), it is the plain mean of the present
 * inputs. Untagged inputs use the weight stored under the empty tag, if any.
 *
 * The result is Absent when no input is present or the applied weights sum to 0.
 */
class TagWeightedAggregator {
public:
    explicit TagWeightedAggregator(const AggregationPolicy& policy = AggregationPolicy{});

    AggregateResult aggregate(const std::vector<AggregationInput>& inputs,
                              const std::optional<std::map<std::string, double>>& tagWeights) const;

    double weightFor(const std::optional<std::string>& tag,
                     const std::map<std::string, double>& tagWeights) const;

    const AggregationPolicy& policy() const { return policy_; }

private:
    AggregationPolicy policy_;
};

} // namespace core
} // namespace scoreflow
