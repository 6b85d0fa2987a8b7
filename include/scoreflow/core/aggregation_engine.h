#pragma once

#include "scoreflow/core/coverage_resolver.h"
#include "scoreflow/core/engine_config.h"
#include "scoreflow/core/metric_types.h"
#include "scoreflow/core/metric_validator.h"
#include "scoreflow/core/rule_evaluator.h"
#include "scoreflow/core/stores.h"
#include "scoreflow/core/tag_weighted_aggregator.h"
#include "scoreflow/utils/result.hpp"
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace scoreflow {
namespace core {

/**
 * @brief Computes and stores aggregate scores.
 *
 * For a ScoreKey (metric, learner, scope) a recomputation:
 * 1. validates the metric definition (cached per revision and catalog version),
 * 2. resolves coverage at the metric's input level,
 * 3. per covered item, either filters and collapses the learner's submissions
 *    or brings the submetric's score for that item up to date,
 * 4. applies the metric's rule per item and aggregates with tag weights,
 * 5. upserts the Score, replacing any previous one.
 *
 * Only one recomputation per key runs at a time; callers of the same key wait
 * up to EngineConfig::dependencyTimeout. A failed recomputation leaves the
 * stored score untouched and is recorded in failures().
 *
 * All public methods are thread-safe.
 */
class AggregationEngine {
public:
    AggregationEngine(std::shared_ptr<const ContentCatalog> catalog,
                      std::shared_ptr<const SubmissionFeed> feed,
                      std::shared_ptr<const MetricDefinitionStore> definitions,
                      std::shared_ptr<ScoreStore> scores,
                      std::shared_ptr<const RuleRegistry> rules,
                      const EngineConfig& config = EngineConfig{});
    ~AggregationEngine();

    // Prevent copying
    AggregationEngine(const AggregationEngine&) = delete;
    AggregationEngine& operator=(const AggregationEngine&) = delete;

    /**
     * @brief Recomputes one score and stores it.
     *
     * An empty key.scopeId means the metric's own scope.
     */
    Result<Score> recompute(const ScoreKey& key);

    /**
     * @brief Recomputes a metric for every learner known to the feed.
     */
    Result<std::vector<std::pair<ScoreKey, Result<Score>>>> recomputeMetric(const std::string& metricId);

    /**
     * @brief Returns the stored score if it is current, recomputing it otherwise.
     */
    Result<Score> ensureCurrent(const ScoreKey& key);

    /**
     * @brief Marks every score of the submission's learner as stale.
     */
    void noteSubmission(const Submission& submission);

    std::uint64_t generationOf(const std::string& learnerId) const;

    /**
     * @brief True if no submission of the learner arrived after the score's inputs were read
     * and the definition and catalog it was computed from are unchanged.
     */
    bool isCurrent(const Score& score) const;

    /**
     * @brief Auto-computing metrics whose inputs include the submission's item.
     *
     * Follows submetric chains: a metric over lessons is affected by a component
     * submission when its submetric, scoped to the component's lesson, covers it.
     */
    Result<std::vector<ScoreKey>> keysAffectedBy(const Submission& submission);

    /**
     * @brief Auto-computing metrics that read the given submetric score.
     */
    Result<std::vector<ScoreKey>> keysDependingOn(const ScoreKey& updated);

    std::vector<RecomputeFailure> failures() const;
    void clearFailures();

    /**
     * @brief Error that quarantines a metric at its current revision, if any.
     */
    std::optional<Error> quarantineOf(const std::string& metricId) const;

    MetricValidator& validator() { return *validator_; }
    CoverageResolver& coverage() { return *coverage_; }
    const EngineConfig& config() const { return config_; }

private:
    // Definition revision and catalog version a stored score was computed from
    struct Stamp {
        std::uint64_t revision{0};
        std::uint64_t catalogVersion{0};
    };

    struct ValidationEntry {
        std::uint64_t revision{0};
        std::uint64_t catalogVersion{0};
        std::optional<Error> error;
    };

    class InFlightGuard;

    std::shared_ptr<const ContentCatalog> catalog_;
    std::shared_ptr<const SubmissionFeed> feed_;
    std::shared_ptr<const MetricDefinitionStore> definitions_;
    std::shared_ptr<ScoreStore> scores_;
    EngineConfig config_;

    std::shared_ptr<CoverageResolver> coverage_;
    std::shared_ptr<const RuleEvaluator> evaluator_;
    std::unique_ptr<MetricValidator> validator_;
    TagWeightedAggregator aggregator_;

    mutable std::mutex stateMutex_;
    std::unordered_map<std::string, std::uint64_t> generations_;
    std::unordered_map<ScoreKey, Stamp, ScoreKeyHash> stamps_;
    std::map<std::string, ValidationEntry> validations_;
    std::deque<RecomputeFailure> failures_;

    std::mutex inFlightMutex_;
    std::condition_variable inFlightCv_;
    std::unordered_set<ScoreKey, ScoreKeyHash> inFlight_;

    Result<MetricDefinition> loadDefinition(const std::string& metricId);
    Result<void> checkDefinition(const MetricDefinition& metric);
    Result<Score> refresh(const ScoreKey& key, const MetricDefinition& metric);
    Result<Score> compute(const ScoreKey& key, const MetricDefinition& metric);
    Result<AggregationInput> evaluateItem(const ScoreKey& key,
                                          const MetricDefinition& metric,
                                          const std::optional<MetricDefinition>& submetric,
                                          const std::string& itemId,
                                          const std::optional<std::string>& itemTag);
    Result<bool> reads(const MetricDefinition& metric,
                       const ContentItem& item,
                       const std::string& submissionKind,
                       const std::optional<std::string>& scopeOverride,
                       int depth);
    Result<bool> coversItem(const MetricDefinition& metric,
                            Level inputLevel,
                            const std::optional<std::string>& scopeOverride,
                            const std::string& itemId);
    Result<std::optional<ContentItem>> ancestorAt(const ContentItem& item, Level level);
    Result<std::optional<Score>> findStored(const ScoreKey& key);
    ScoreKey normalize(const ScoreKey& key, const MetricDefinition& metric) const;
    bool isCurrentLocked(const Score& score) const;
    void recordFailure(const ScoreKey& key, const Error& error);
};

} // namespace core
} // namespace scoreflow
