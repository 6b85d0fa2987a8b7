#include "scoreflow/core/aggregation_engine.h"
#include "scoreflow/core/submission_resolver.h"
#include "scoreflow/core/time_window_filter.h"
#include "scoreflow/utils/logging.hpp"
#include "scoreflow/utils/retry.hpp"
#include <algorithm>

namespace scoreflow {
namespace core {

namespace {
    // Catalog parent chains and submetric chains are a handful of links deep;
    // anything longer is a loop.
    constexpr int MAX_CHAIN_DEPTH = 16;
}

/**
 * Marks a key as being recomputed for the lifetime of the guard.
 * Waits up to the dependency timeout for another holder to finish.
 */
class AggregationEngine::InFlightGuard {
public:
    InFlightGuard(AggregationEngine& engine, const ScoreKey& key)
        : engine_(engine), key_(key) {
        std::unique_lock<std::mutex> lock(engine_.inFlightMutex_);
        acquired_ = engine_.inFlightCv_.wait_for(lock, engine_.config_.dependencyTimeout, [this]() {
            return engine_.inFlight_.count(key_) == 0;
        });
        if (acquired_) {
            engine_.inFlight_.insert(key_);
        }
    }

    ~InFlightGuard() {
        if (!acquired_) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(engine_.inFlightMutex_);
            engine_.inFlight_.erase(key_);
        }
        engine_.inFlightCv_.notify_all();
    }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

    bool acquired() const { return acquired_; }

private:
    AggregationEngine& engine_;
    ScoreKey key_;
    bool acquired_{false};
};

AggregationEngine::AggregationEngine(std::shared_ptr<const ContentCatalog> catalog,
                                     std::shared_ptr<const SubmissionFeed> feed,
                                     std::shared_ptr<const MetricDefinitionStore> definitions,
                                     std::shared_ptr<ScoreStore> scores,
                                     std::shared_ptr<const RuleRegistry> rules,
                                     const EngineConfig& config)
    : catalog_(std::move(catalog))
    , feed_(std::move(feed))
    , definitions_(std::move(definitions))
    , scores_(std::move(scores))
    , config_(config)
    , coverage_(std::make_shared<CoverageResolver>(catalog_, config.coverageCache, config.storeRetry))
    , evaluator_(std::make_shared<RuleEvaluator>(std::move(rules)))
    , validator_(std::make_unique<MetricValidator>(definitions_, coverage_, evaluator_, config.storeRetry))
    , aggregator_(config.aggregation) {}

AggregationEngine::~AggregationEngine() = default;

Result<Score> AggregationEngine::recompute(const ScoreKey& requested) {
    auto metric = loadDefinition(requested.metricId);
    if (metric.has_error()) {
        recordFailure(requested, metric.error());
        return metric.error();
    }
    const ScoreKey key = normalize(requested, metric.value());

    auto valid = checkDefinition(metric.value());
    if (valid.has_error()) {
        recordFailure(key, valid.error());
        return valid.error();
    }

    InFlightGuard guard(*this, key);
    if (!guard.acquired()) {
        Error timeout{ErrorCode::DependencyTimeout,
                      "Recomputation of " + key.toString() + " is still running after " +
                      std::to_string(config_.dependencyTimeout.count()) + "ms"};
        recordFailure(key, timeout);
        return timeout;
    }

    auto score = compute(key, metric.value());
    if (score.has_error()) {
        recordFailure(key, score.error());
    }
    return score;
}

Result<std::vector<std::pair<ScoreKey, Result<Score>>>> AggregationEngine::recomputeMetric(
    const std::string& metricId) {
    auto metric = loadDefinition(metricId);
    if (metric.has_error()) {
        return metric.error();
    }
    auto learners = utils::attemptWithRetry(config_.storeRetry, "learner listing", [&]() {
        return feed_->learners();
    });
    if (learners.has_error()) {
        return learners.error();
    }

    SFLOG_INFO("Recomputing metric '" << metricId << "' for " << learners.value().size() << " learners");
    std::vector<std::pair<ScoreKey, Result<Score>>> results;
    results.reserve(learners.value().size());
    for (const auto& learnerId : learners.value()) {
        ScoreKey key{metricId, learnerId, metric.value().scope.value_or("")};
        results.emplace_back(key, recompute(key));
    }
    return results;
}

Result<Score> AggregationEngine::ensureCurrent(const ScoreKey& requested) {
    auto metric = loadDefinition(requested.metricId);
    if (metric.has_error()) {
        recordFailure(requested, metric.error());
        return metric.error();
    }
    const ScoreKey key = normalize(requested, metric.value());

    auto valid = checkDefinition(metric.value());
    if (valid.has_error()) {
        recordFailure(key, valid.error());
        return valid.error();
    }

    auto score = refresh(key, metric.value());
    if (score.has_error()) {
        recordFailure(key, score.error());
    }
    return score;
}

void AggregationEngine::noteSubmission(const Submission& submission) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    ++generations_[submission.learnerId];
}

std::uint64_t AggregationEngine::generationOf(const std::string& learnerId) const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    auto it = generations_.find(learnerId);
    return it != generations_.end() ? it->second : 0;
}

bool AggregationEngine::isCurrent(const Score& score) const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return isCurrentLocked(score);
}

Result<std::vector<ScoreKey>> AggregationEngine::keysAffectedBy(const Submission& submission) {
    auto metrics = utils::attemptWithRetry(config_.storeRetry, "definition listing", [&]() {
        return definitions_->list();
    });
    if (metrics.has_error()) {
        return metrics.error();
    }
    auto item = utils::attemptWithRetry(config_.storeRetry, "catalog lookup", [&]() {
        return catalog_->findItem(submission.itemId);
    });
    if (item.has_error()) {
        return item.error();
    }
    if (!item.value()) {
        SFLOG_DEBUG("Submission on unknown item '" << submission.itemId << "' affects no metric");
        return std::vector<ScoreKey>{};
    }

    std::vector<ScoreKey> keys;
    for (const auto& metric : metrics.value()) {
        if (!metric.autoCompute) {
            continue;
        }
        auto affected = reads(metric, *item.value(), submission.kind, std::nullopt, 0);
        if (affected.has_error()) {
            if (utils::isConfigurationError(affected.error().code)) {
                SFLOG_DEBUG("Skipping metric '" << metric.id << "': " << affected.error().describe());
                continue;
            }
            return affected.error();
        }
        if (affected.value()) {
            keys.push_back(ScoreKey{metric.id, submission.learnerId, metric.scope.value_or("")});
        }
    }
    return keys;
}

Result<std::vector<ScoreKey>> AggregationEngine::keysDependingOn(const ScoreKey& updated) {
    // Parents read submetric scores scoped to one of their covered items.
    if (updated.scopeId.empty()) {
        return std::vector<ScoreKey>{};
    }
    auto metrics = utils::attemptWithRetry(config_.storeRetry, "definition listing", [&]() {
        return definitions_->list();
    });
    if (metrics.has_error()) {
        return metrics.error();
    }

    std::optional<Level> submetricLevel;
    std::vector<ScoreKey> keys;
    for (const auto& metric : metrics.value()) {
        if (!metric.autoCompute || metric.submetric != updated.metricId) {
            continue;
        }
        if (!submetricLevel) {
            auto submetric = loadDefinition(updated.metricId);
            if (submetric.has_error()) {
                return submetric.error().code == ErrorCode::UnknownMetric
                    ? Result<std::vector<ScoreKey>>(std::vector<ScoreKey>{})
                    : Result<std::vector<ScoreKey>>(submetric.error());
            }
            submetricLevel = submetric.value().level;
        }
        auto covered = coversItem(metric, *submetricLevel, std::nullopt, updated.scopeId);
        if (covered.has_error()) {
            if (utils::isConfigurationError(covered.error().code)) {
                continue;
            }
            return covered.error();
        }
        if (covered.value()) {
            keys.push_back(ScoreKey{metric.id, updated.learnerId, metric.scope.value_or("")});
        }
    }
    return keys;
}

std::vector<RecomputeFailure> AggregationEngine::failures() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return std::vector<RecomputeFailure>(failures_.begin(), failures_.end());
}

void AggregationEngine::clearFailures() {
    std::lock_guard<std::mutex> lock(stateMutex_);
    failures_.clear();
}

std::optional<Error> AggregationEngine::quarantineOf(const std::string& metricId) const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    auto it = validations_.find(metricId);
    if (it == validations_.end()) {
        return std::nullopt;
    }
    return it->second.error;
}

Result<MetricDefinition> AggregationEngine::loadDefinition(const std::string& metricId) {
    auto found = utils::attemptWithRetry(config_.storeRetry, "definition lookup", [&]() {
        return definitions_->find(metricId);
    });
    if (found.has_error()) {
        return found.error();
    }
    if (!found.value()) {
        return Error{ErrorCode::UnknownMetric, "Metric '" + metricId + "' does not exist"};
    }
    return *found.value();
}

Result<void> AggregationEngine::checkDefinition(const MetricDefinition& metric) {
    const std::uint64_t catalogVersion = catalog_->version();
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        auto it = validations_.find(metric.id);
        if (it != validations_.end() && it->second.revision == metric.revision &&
            it->second.catalogVersion == catalogVersion) {
            if (it->second.error) {
                return *it->second.error;
            }
            return Result<void>();
        }
    }

    auto outcome = validator_->validate(metric);
    if (outcome.has_error() && !utils::isConfigurationError(outcome.error().code)) {
        // Transient: do not remember
        return outcome;
    }

    std::lock_guard<std::mutex> lock(stateMutex_);
    ValidationEntry entry{metric.revision, catalogVersion, std::nullopt};
    if (outcome.has_error()) {
        entry.error = outcome.error();
        SFLOG_WARN("Metric '" << metric.id << "' quarantined at revision " << metric.revision
                   << ": " << outcome.error().describe());
    }
    validations_[metric.id] = entry;
    return outcome;
}

Result<Score> AggregationEngine::refresh(const ScoreKey& key, const MetricDefinition& metric) {
    auto stored = findStored(key);
    if (stored.has_error()) {
        return stored.error();
    }
    if (stored.value() && isCurrent(*stored.value())) {
        return *stored.value();
    }

    InFlightGuard guard(*this, key);
    if (!guard.acquired()) {
        return Error{ErrorCode::DependencyTimeout,
                     "Timed out after " + std::to_string(config_.dependencyTimeout.count()) +
                     "ms waiting for " + key.toString()};
    }

    // Another caller may have finished it while we waited
    stored = findStored(key);
    if (stored.has_error()) {
        return stored.error();
    }
    if (stored.value() && isCurrent(*stored.value())) {
        return *stored.value();
    }
    return compute(key, metric);
}

Result<Score> AggregationEngine::compute(const ScoreKey& key, const MetricDefinition& metric) {
    // Read the generation before any input so a submission arriving mid-run marks the result stale
    const std::uint64_t generation = generationOf(key.learnerId);
    const std::uint64_t catalogVersion = catalog_->version();

    std::optional<MetricDefinition> submetric;
    if (metric.submetric) {
        auto loaded = loadDefinition(*metric.submetric);
        if (loaded.has_error()) {
            return loaded.error();
        }
        auto valid = checkDefinition(loaded.value());
        if (valid.has_error()) {
            return Error{valid.error().code,
                         "Submetric '" + loaded.value().id + "': " + valid.error().message};
        }
        submetric = loaded.value();
    }
    const Level inputLevel = submetric ? submetric->level : metric.level;

    std::optional<std::string> scopeOverride;
    if (!key.scopeId.empty() && key.scopeId != metric.scope.value_or("")) {
        scopeOverride = key.scopeId;
    }
    auto items = coverage_->resolveFor(metric, inputLevel, scopeOverride);
    if (items.has_error()) {
        return items.error();
    }

    auto catalogItems = utils::attemptWithRetry(config_.storeRetry, "catalog lookup", [&]() {
        return catalog_->itemsAtLevel(inputLevel);
    });
    if (catalogItems.has_error()) {
        return catalogItems.error();
    }
    std::unordered_map<std::string, std::optional<std::string>> itemTags;
    for (const auto& item : catalogItems.value()) {
        itemTags[item.id] = item.tag;
    }

    std::vector<AggregationInput> inputs;
    inputs.reserve(items.value().size());
    for (const auto& itemId : items.value()) {
        auto tag = itemTags.find(itemId);
        auto input = evaluateItem(key, metric, submetric, itemId,
                                  tag != itemTags.end() ? tag->second : std::nullopt);
        if (input.has_error()) {
            return input.error();
        }
        inputs.push_back(std::move(input.value()));
    }

    std::optional<EpochMillis> sourceTime;
    for (const auto& input : inputs) {
        if (input.latestSubmission && (!sourceTime || *input.latestSubmission > *sourceTime)) {
            sourceTime = input.latestSubmission;
        }
    }

    auto aggregate = aggregator_.aggregate(inputs, metric.tagWeights);
    Score score{key, aggregate.value, nowMillis(), generation, std::move(aggregate.contributions), sourceTime};

    auto written = utils::attemptWithRetry(config_.storeRetry, "score upsert", [&]() {
        return scores_->upsert(score);
    });
    if (written.has_error()) {
        return written.error();
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        stamps_[key] = Stamp{metric.revision, catalogVersion};
    }
    if (score.value) {
        SFLOG_DEBUG("Stored " << key.toString() << " = " << *score.value << " from "
                    << inputs.size() << " items");
    } else {
        SFLOG_DEBUG("Stored " << key.toString() << " = absent from " << inputs.size() << " items");
    }
    return score;
}

Result<AggregationInput> AggregationEngine::evaluateItem(const ScoreKey& key,
                                                         const MetricDefinition& metric,
                                                         const std::optional<MetricDefinition>& submetric,
                                                         const std::string& itemId,
                                                         const std::optional<std::string>& itemTag) {
    if (submetric) {
        ScoreKey subKey{submetric->id, key.learnerId, itemId};
        auto subScore = refresh(subKey, *submetric);
        if (subScore.has_error()) {
            return subScore.error();
        }
        const Score& sub = subScore.value();
        if (!sub.value) {
            auto missing = evaluator_->evaluate(metric.rule, {});
            if (missing.has_error()) {
                return missing.error();
            }
            return AggregationInput{itemId, missing.value(), itemTag, sub.sourceTime};
        }
        // A score with no submission behind it is never late.
        std::vector<RuleInput> ruleInputs{RuleInput{*sub.value, sub.sourceTime.value_or(0)}};
        auto value = evaluator_->evaluate(metric.rule, ruleInputs);
        if (value.has_error()) {
            return value.error();
        }
        return AggregationInput{itemId, value.value(), itemTag, sub.sourceTime};
    }

    auto submissions = utils::attemptWithRetry(config_.storeRetry, "submission lookup", [&]() {
        return feed_->submissionsFor(key.learnerId, itemId);
    });
    if (submissions.has_error()) {
        return submissions.error();
    }

    std::vector<Submission> eligible = submissions.value();
    if (metric.submissionKind) {
        eligible.erase(std::remove_if(eligible.begin(), eligible.end(),
                                      [&](const Submission& s) { return s.kind != *metric.submissionKind; }),
                       eligible.end());
    }
    auto resolved = resolveSubmissions(filterByTimeWindow(eligible, metric.timeFilter), metric.multiples);
    if (resolved.empty()) {
        auto missing = evaluator_->evaluate(metric.rule, {});
        if (missing.has_error()) {
            return missing.error();
        }
        return AggregationInput{itemId, missing.value(), itemTag, std::nullopt};
    }

    std::vector<RuleInput> ruleInputs;
    ruleInputs.reserve(resolved.size());
    EpochMillis latest = resolved.front().timestamp;
    for (const auto& submission : resolved) {
        ruleInputs.push_back(RuleInput{submission.score, submission.timestamp});
        latest = std::max(latest, submission.timestamp);
    }
    auto value = evaluator_->evaluate(metric.rule, ruleInputs);
    if (value.has_error()) {
        return value.error();
    }

    auto tag = resolved.size() == 1 ? resolved.front().tag : representativeTag(resolved);
    return AggregationInput{itemId, value.value(), tag ? tag : itemTag, latest};
}

Result<bool> AggregationEngine::reads(const MetricDefinition& metric,
                                      const ContentItem& item,
                                      const std::string& submissionKind,
                                      const std::optional<std::string>& scopeOverride,
                                      int depth) {
    if (depth > MAX_CHAIN_DEPTH) {
        return Error{ErrorCode::CyclicMetricReference,
                     "Submetric chain below '" + metric.id + "' does not end"};
    }

    if (!metric.submetric) {
        if (item.level != metric.level) {
            return false;
        }
        if (metric.submissionKind && *metric.submissionKind != submissionKind) {
            return false;
        }
        return coversItem(metric, metric.level, scopeOverride, item.id);
    }

    auto submetric = loadDefinition(*metric.submetric);
    if (submetric.has_error()) {
        return submetric.error();
    }
    const Level inputLevel = submetric.value().level;
    auto ancestor = ancestorAt(item, inputLevel);
    if (ancestor.has_error()) {
        return ancestor.error();
    }
    if (!ancestor.value()) {
        return false;
    }

    auto covered = coversItem(metric, inputLevel, scopeOverride, ancestor.value()->id);
    if (covered.has_error() || !covered.value()) {
        return covered;
    }
    return reads(submetric.value(), item, submissionKind, ancestor.value()->id, depth + 1);
}

Result<bool> AggregationEngine::coversItem(const MetricDefinition& metric,
                                           Level inputLevel,
                                           const std::optional<std::string>& scopeOverride,
                                           const std::string& itemId) {
    auto items = coverage_->resolveFor(metric, inputLevel, scopeOverride);
    if (items.has_error()) {
        return items.error();
    }
    return std::binary_search(items.value().begin(), items.value().end(), itemId);
}

Result<std::optional<ContentItem>> AggregationEngine::ancestorAt(const ContentItem& item, Level level) {
    ContentItem current = item;
    for (int depth = 0; depth < MAX_CHAIN_DEPTH; ++depth) {
        if (current.level == level) {
            return std::optional<ContentItem>{current};
        }
        if (isBelow(level, current.level) || !current.parentId) {
            break;
        }
        auto parent = utils::attemptWithRetry(config_.storeRetry, "catalog lookup", [&]() {
            return catalog_->findItem(*current.parentId);
        });
        if (parent.has_error()) {
            return parent.error();
        }
        if (!parent.value()) {
            break;
        }
        current = *parent.value();
    }
    return std::optional<ContentItem>{};
}

Result<std::optional<Score>> AggregationEngine::findStored(const ScoreKey& key) {
    return utils::attemptWithRetry(config_.storeRetry, "score lookup", [&]() {
        return scores_->find(key);
    });
}

ScoreKey AggregationEngine::normalize(const ScoreKey& key, const MetricDefinition& metric) const {
    if (!key.scopeId.empty() || !metric.scope) {
        return key;
    }
    return ScoreKey{key.metricId, key.learnerId, *metric.scope};
}

bool AggregationEngine::isCurrentLocked(const Score& score) const {
    auto generation = generations_.find(score.key.learnerId);
    const std::uint64_t current = generation != generations_.end() ? generation->second : 0;
    if (score.sourceGeneration != current) {
        return false;
    }
    auto stamp = stamps_.find(score.key);
    auto validation = validations_.find(score.key.metricId);
    if (stamp == stamps_.end() || validation == validations_.end()) {
        return false;
    }
    return stamp->second.revision == validation->second.revision &&
           stamp->second.catalogVersion == validation->second.catalogVersion &&
           validation->second.catalogVersion == catalog_->version();
}

void AggregationEngine::recordFailure(const ScoreKey& key, const Error& error) {
    if (utils::isConfigurationError(error.code)) {
        SFLOG_WARN("Recompute of " << key.toString() << " rejected: " << error.describe());
    } else {
        SFLOG_ERROR("Recompute of " << key.toString() << " failed: " << error.describe());
    }

    std::lock_guard<std::mutex> lock(stateMutex_);
    failures_.push_back(RecomputeFailure{key, error.code, error.message, nowMillis()});
    while (failures_.size() > config_.maxFailureRecords) {
        failures_.pop_front();
    }
}

} // namespace core
} // namespace scoreflow
