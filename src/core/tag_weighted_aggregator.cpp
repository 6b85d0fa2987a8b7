#include "scoreflow/core/tag_weighted_aggregator.h"
#include <algorithm>

namespace scoreflow {
namespace core {

const char* toString(AbsentInputPolicy policy) {
    switch (policy) {
        case AbsentInputPolicy::Exclude: return "exclude";
        case AbsentInputPolicy::TreatAsZero: return "zero";
    }
    return "unknown";
}

std::optional<AbsentInputPolicy> parseAbsentInputPolicy(const std::string& name) {
    if (name == "exclude") return AbsentInputPolicy::Exclude;
    if (name == "zero") return AbsentInputPolicy::TreatAsZero;
    return std::nullopt;
}

TagWeightedAggregator::TagWeightedAggregator(const AggregationPolicy& policy)
    : policy_(policy) {}

double TagWeightedAggregator::weightFor(const std::optional<std::string>& tag,
                                        const std::map<std::string, double>& tagWeights) const {
    auto it = tagWeights.find(tag.value_or(""));
    return it != tagWeights.end() ? it->second : policy_.missingTagWeight;
}

AggregateResult TagWeightedAggregator::aggregate(
    const std::vector<AggregationInput>& inputs,
    const std::optional<std::map<std::string, double>>& tagWeights) const {
    AggregateResult result;
    result.contributions.reserve(inputs.size());

    const bool weighted = tagWeights && !tagWeights->empty();
    const bool anyPresent = std::any_of(inputs.begin(), inputs.end(),
                                        [](const AggregationInput& in) { return in.value.has_value(); });

    double total = 0;
    double weightTotal = 0;
    for (const auto& input : inputs) {
        const double weight = weighted ? weightFor(input.tag, *tagWeights) : 1.0;
        double applied = 0;
        if (input.value) {
            total += *input.value * weight;
            applied = weight;
        } else if (policy_.absentInputs == AbsentInputPolicy::TreatAsZero) {
            applied = weight;
        }
        weightTotal += applied;
        result.contributions.push_back(Contribution{input.itemId, input.value, input.tag, applied});
    }

    if (anyPresent && weightTotal > 0) {
        result.value = total / weightTotal;
    }
    return result;
}

} // namespace core
} // namespace scoreflow
