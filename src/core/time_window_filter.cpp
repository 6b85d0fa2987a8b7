#include "scoreflow/core/time_window_filter.h"
#include <algorithm>
#include <iterator>

namespace scoreflow {
namespace core {

std::vector<Submission> filterByTimeWindow(const std::vector<Submission>& submissions,
                                           const TimeFilter& filter) {
    std::vector<Submission> kept;
    kept.reserve(submissions.size());
    std::copy_if(submissions.begin(), submissions.end(), std::back_inserter(kept),
                 [&filter](const Submission& s) { return withinTimeWindow(s, filter); });
    return kept;
}

} // namespace core
} // namespace scoreflow
