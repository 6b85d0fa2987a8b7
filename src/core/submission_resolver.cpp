#include "scoreflow/core/submission_resolver.h"
#include <map>

namespace scoreflow {
namespace core {

std::vector<Submission> resolveSubmissions(const std::vector<Submission>& submissions,
                                           MultiplesPolicy policy) {
    if (submissions.empty() || policy == MultiplesPolicy::PassThrough) {
        return submissions;
    }

    std::size_t chosen = 0;
    for (std::size_t i = 1; i < submissions.size(); ++i) {
        const auto& candidate = submissions[i];
        const auto& best = submissions[chosen];
        switch (policy) {
            case MultiplesPolicy::Last:
                if (candidate.timestamp >= best.timestamp) chosen = i;
                break;
            case MultiplesPolicy::First:
                if (candidate.timestamp < best.timestamp) chosen = i;
                break;
            case MultiplesPolicy::Max:
                if (candidate.score > best.score ||
                    (candidate.score == best.score && candidate.timestamp < best.timestamp)) {
                    chosen = i;
                }
                break;
            case MultiplesPolicy::PassThrough:
                break;
        }
    }
    return {submissions[chosen]};
}

std::optional<std::string> representativeTag(const std::vector<Submission>& submissions) {
    std::map<std::string, std::size_t> counts;
    std::vector<std::string> firstSeen;
    for (const auto& submission : submissions) {
        if (!submission.tag || submission.tag->empty()) {
            continue;
        }
        if (counts[*submission.tag]++ == 0) {
            firstSeen.push_back(*submission.tag);
        }
    }
    if (firstSeen.empty()) {
        return std::nullopt;
    }

    std::string best = firstSeen.front();
    for (const auto& tag : firstSeen) {
        if (counts[tag] > counts[best]) {
            best = tag;
        }
    }
    return best;
}

} // namespace core
} // namespace scoreflow
