#pragma once

#include <gmock/gmock.h>
#include "scoreflow/core/stores.h"

namespace scoreflow {
namespace core {

class MockContentCatalog : public ContentCatalog {
public:
    MOCK_METHOD(Result<std::vector<ContentItem>>, itemsAtLevel, (Level level), (const, override));
    MOCK_METHOD(Result<std::optional<ContentItem>>, findItem, (const std::string& itemId), (const, override));
    MOCK_METHOD(std::uint64_t, version, (), (const, override));
};

class MockSubmissionFeed : public SubmissionFeed {
public:
    MOCK_METHOD(Result<std::vector<Submission>>, submissionsFor,
                (const std::string& learnerId, const std::string& itemId), (const, override));
    MOCK_METHOD(Result<std::vector<std::string>>, learners, (), (const, override));
};

class MockMetricDefinitionStore : public MetricDefinitionStore {
public:
    MOCK_METHOD(Result<std::optional<MetricDefinition>>, find, (const std::string& metricId), (const, override));
    MOCK_METHOD(Result<std::vector<MetricDefinition>>, list, (), (const, override));
};

class MockScoreStore : public ScoreStore {
public:
    MOCK_METHOD(Result<void>, upsert, (const Score& score), (override));
    MOCK_METHOD(Result<std::optional<Score>>, find, (const ScoreKey& key), (const, override));
    MOCK_METHOD(Result<std::optional<EpochMillis>>, lastUpdated, (const std::string& metricId), (const, override));
};

} // namespace core
} // namespace scoreflow
