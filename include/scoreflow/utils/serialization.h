#ifndef SCOREFLOW_UTILS_SERIALIZATION_H
#define SCOREFLOW_UTILS_SERIALIZATION_H

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "scoreflow/core/metric_types.h"
#include "scoreflow/utils/result.hpp"

namespace scoreflow {
namespace utils {

/**
 * @brief Serializes a metric definition into its JSON document form.
 *
 * The layout is:
 * - coverage: `["all"]`, `["include", id...]` or `["exclude", id...]`.
 * - rule: `[name, param...]`, params as numbers or strings.
 * - timeFilter: `[start, end]` in epoch milliseconds.
 * - submetric, tagWeights, scope, submissionKind: null when unset.
 * - level and multiples: lower-case names ("lesson", "pass-through").
 */
nlohmann::json metricToJson(const core::MetricDefinition& metric);

/**
 * @brief Reads a metric definition, filling defaults for missing optional fields.
 *
 * `name` and `level` are required; `id` defaults to `name`.
 * @return InvalidConfiguration describing the first malformed field
 */
Result<core::MetricDefinition> metricFromJson(const nlohmann::json& json);

/**
 * @brief Reads a JSON array of metric definitions.
 */
Result<std::vector<core::MetricDefinition>> metricsFromJson(const nlohmann::json& json);

/**
 * @brief Serializes a score together with its per-item contributions.
 *
 * Absent values are written as null.
 */
nlohmann::json scoreToJson(const core::Score& score);

Result<core::Score> scoreFromJson(const nlohmann::json& json);

/**
 * @brief Parses JSON text, reporting syntax errors as InvalidConfiguration.
 */
Result<nlohmann::json> parseJson(const std::string& text);

} // namespace utils
} // namespace scoreflow

#endif // SCOREFLOW_UTILS_SERIALIZATION_H
