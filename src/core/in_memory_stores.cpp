#include "scoreflow/core/in_memory_stores.h"
#include <algorithm>

namespace scoreflow {
namespace core {

void InMemoryContentCatalog::addItem(const ContentItem& item) {
    std::lock_guard<std::mutex> lock(mutex_);
    items_[item.id] = item;
    version_++;
}

bool InMemoryContentCatalog::removeItem(const std::string& itemId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.erase(itemId) == 0) {
        return false;
    }
    version_++;
    return true;
}

Result<std::vector<ContentItem>> InMemoryContentCatalog::itemsAtLevel(Level level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ContentItem> result;
    for (const auto& [id, item] : items_) {
        if (item.level == level) {
            result.push_back(item);
        }
    }
    return result;
}

Result<std::optional<ContentItem>> InMemoryContentCatalog::findItem(const std::string& itemId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(itemId);
    if (it == items_.end()) {
        return std::optional<ContentItem>{};
    }
    return std::optional<ContentItem>{it->second};
}

std::uint64_t InMemoryContentCatalog::version() const {
    return version_.load();
}

void InMemorySubmissionFeed::append(const Submission& submission) {
    std::lock_guard<std::mutex> lock(mutex_);
    byLearner_[submission.learnerId][submission.itemId].push_back(submission);
    count_++;
}

std::size_t InMemorySubmissionFeed::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

Result<std::vector<Submission>> InMemorySubmissionFeed::submissionsFor(const std::string& learnerId,
                                                                       const std::string& itemId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto learnerIt = byLearner_.find(learnerId);
    if (learnerIt == byLearner_.end()) {
        return std::vector<Submission>{};
    }
    auto itemIt = learnerIt->second.find(itemId);
    if (itemIt == learnerIt->second.end()) {
        return std::vector<Submission>{};
    }
    return itemIt->second;
}

Result<std::vector<std::string>> InMemorySubmissionFeed::learners() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(byLearner_.size());
    for (const auto& [learnerId, _] : byLearner_) {
        result.push_back(learnerId);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::uint64_t InMemoryMetricDefinitionStore::put(MetricDefinition definition) {
    std::lock_guard<std::mutex> lock(mutex_);
    definition.revision = nextRevision_++;
    const auto revision = definition.revision;
    definitions_[definition.id] = std::move(definition);
    return revision;
}

bool InMemoryMetricDefinitionStore::remove(const std::string& metricId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return definitions_.erase(metricId) > 0;
}

Result<std::optional<MetricDefinition>> InMemoryMetricDefinitionStore::find(const std::string& metricId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = definitions_.find(metricId);
    if (it == definitions_.end()) {
        return std::optional<MetricDefinition>{};
    }
    return std::optional<MetricDefinition>{it->second};
}

Result<std::vector<MetricDefinition>> InMemoryMetricDefinitionStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MetricDefinition> result;
    result.reserve(definitions_.size());
    for (const auto& [id, definition] : definitions_) {
        result.push_back(definition);
    }
    return result;
}

Result<void> InMemoryScoreStore::upsert(const Score& score) {
    std::lock_guard<std::mutex> lock(mutex_);
    scores_[score.key] = score;
    auto& last = lastUpdated_[score.key.metricId];
    last = std::max(last, score.computedAt);
    upserts_++;
    return Result<void>();
}

Result<std::optional<Score>> InMemoryScoreStore::find(const ScoreKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = scores_.find(key);
    if (it == scores_.end()) {
        return std::optional<Score>{};
    }
    return std::optional<Score>{it->second};
}

Result<std::optional<EpochMillis>> InMemoryScoreStore::lastUpdated(const std::string& metricId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lastUpdated_.find(metricId);
    if (it == lastUpdated_.end()) {
        return std::optional<EpochMillis>{};
    }
    return std::optional<EpochMillis>{it->second};
}

std::vector<Score> InMemoryScoreStore::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Score> result;
    result.reserve(scores_.size());
    for (const auto& [key, score] : scores_) {
        result.push_back(score);
    }
    std::sort(result.begin(), result.end(),
              [](const Score& a, const Score& b) { return a.key < b.key; });
    return result;
}

std::size_t InMemoryScoreStore::upsertCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return upserts_;
}

} // namespace core
} // namespace scoreflow
