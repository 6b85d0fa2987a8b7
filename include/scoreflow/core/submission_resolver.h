#pragma once

#include "scoreflow/core/metric_types.h"
#include <optional>
#include <string>
#include <vector>

namespace scoreflow {
namespace core {

/**
 * @brief Collapses a learner's time-filtered submissions on one item.
 *
 * Input is in insertion order. The result holds zero or one submission for
 * Last, First and Max, and the untouched input for PassThrough:
 *
 * - Last: greatest timestamp, later insertion wins ties.
 * - First: smallest timestamp, earlier insertion wins ties.
 * - Max: greatest score, smallest timestamp wins ties (earliest good attempt).
 */
std::vector<Submission> resolveSubmissions(const std::vector<Submission>& submissions,
                                           MultiplesPolicy policy);

/**
 * @brief Tag carried by a resolved input.
 *
 * The most frequent tag among the submissions; ties go to the tag seen first.
 * Untagged submissions do not vote. std::nullopt if none is tagged.
 */
std::optional<std::string> representativeTag(const std::vector<Submission>& submissions);

} // namespace core
} // namespace scoreflow
