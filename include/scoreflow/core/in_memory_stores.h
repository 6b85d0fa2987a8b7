#pragma once

#include "scoreflow/core/stores.h"
#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace scoreflow {
namespace core {

/**
 * @brief In-memory implementation of the ContentCatalog interface.
 *
 * Every mutation bumps the catalog version so cached coverage resolutions
 * keyed on the old version are no longer hit.
 */
class InMemoryContentCatalog : public ContentCatalog {
public:
    InMemoryContentCatalog() = default;
    ~InMemoryContentCatalog() noexcept override = default;

    /**
     * @brief Adds or replaces an item.
     */
    void addItem(const ContentItem& item);

    /**
     * @brief Removes an item. Children keep their parent reference.
     *
     * @return true if the item existed
     */
    bool removeItem(const std::string& itemId);

    Result<std::vector<ContentItem>> itemsAtLevel(Level level) const override;
    Result<std::optional<ContentItem>> findItem(const std::string& itemId) const override;
    std::uint64_t version() const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, ContentItem> items_;
    std::atomic<std::uint64_t> version_{1};
};

/**
 * @brief In-memory append-only submission feed.
 */
class InMemorySubmissionFeed : public SubmissionFeed {
public:
    InMemorySubmissionFeed() = default;
    ~InMemorySubmissionFeed() noexcept override = default;

    void append(const Submission& submission);
    std::size_t size() const;

    Result<std::vector<Submission>> submissionsFor(const std::string& learnerId,
                                                   const std::string& itemId) const override;
    Result<std::vector<std::string>> learners() const override;

private:
    mutable std::mutex mutex_;
    // learner -> item -> submissions in insertion order
    std::unordered_map<std::string, std::unordered_map<std::string, std::vector<Submission>>> byLearner_;
    std::size_t count_{0};
};

/**
 * @brief In-memory metric definition store.
 *
 * put() stamps each stored definition with a fresh revision number.
 */
class InMemoryMetricDefinitionStore : public MetricDefinitionStore {
public:
    InMemoryMetricDefinitionStore() = default;
    ~InMemoryMetricDefinitionStore() noexcept override = default;

    /**
     * @brief Creates or edits a definition.
     *
     * @return The revision assigned to the stored definition
     */
    std::uint64_t put(MetricDefinition definition);
    bool remove(const std::string& metricId);

    Result<std::optional<MetricDefinition>> find(const std::string& metricId) const override;
    Result<std::vector<MetricDefinition>> list() const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, MetricDefinition> definitions_;
    std::uint64_t nextRevision_{1};
};

/**
 * @brief In-memory score store with wholesale replacement semantics.
 */
class InMemoryScoreStore : public ScoreStore {
public:
    InMemoryScoreStore() = default;
    ~InMemoryScoreStore() noexcept override = default;

    Result<void> upsert(const Score& score) override;
    Result<std::optional<Score>> find(const ScoreKey& key) const override;
    Result<std::optional<EpochMillis>> lastUpdated(const std::string& metricId) const override;

    std::vector<Score> all() const;
    std::size_t upsertCount() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<ScoreKey, Score, ScoreKeyHash> scores_;
    std::unordered_map<std::string, EpochMillis> lastUpdated_;
    std::size_t upserts_{0};
};

} // namespace core
} // namespace scoreflow
