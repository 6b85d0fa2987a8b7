#pragma once

#include "scoreflow/core/metric_types.h"
#include <vector>

namespace scoreflow {
namespace core {

/**
 * @brief Keeps the submissions whose timestamp lies in [filter.start, filter.end].
 *
 * Both bounds are inclusive and the relative order of the input is preserved.
 */
std::vector<Submission> filterByTimeWindow(const std::vector<Submission>& submissions,
                                           const TimeFilter& filter);

inline bool withinTimeWindow(const Submission& submission, const TimeFilter& filter) {
    return submission.timestamp >= filter.start && submission.timestamp <= filter.end;
}

} // namespace core
} // namespace scoreflow
