#pragma once

#include "scoreflow/utils/result.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace scoreflow {
namespace core {

/// Milliseconds since the Unix epoch.
using EpochMillis = std::int64_t;

/// Current wall-clock time in epoch milliseconds.
EpochMillis nowMillis();

/// A computed score. std::nullopt is the Absent marker and is never the same as 0.
using ScoreValue = std::optional<double>;

/**
 * @brief Position in the component -> lesson -> namespace -> program hierarchy.
 *
 * Enumerators are ordered from the lowest to the highest level.
 */
enum class Level {
    Component = 0,
    Lesson = 1,
    Namespace = 2,
    Program = 3
};

const char* toString(Level level);
std::optional<Level> parseLevel(const std::string& name);

/// True if `lower` sits strictly below `upper` in the hierarchy.
inline bool isBelow(Level lower, Level upper) {
    return static_cast<int>(lower) < static_cast<int>(upper);
}

/**
 * @brief Selection of content items taking part in an aggregation.
 */
struct Coverage {
    struct All {};
    struct Include { std::vector<std::string> ids; };
    struct Exclude { std::vector<std::string> ids; };

    std::variant<All, Include, Exclude> selection{All{}};

    static Coverage all() { return Coverage{All{}}; }
    static Coverage include(std::vector<std::string> ids) { return Coverage{Include{std::move(ids)}}; }
    static Coverage exclude(std::vector<std::string> ids) { return Coverage{Exclude{std::move(ids)}}; }

    /// Stable textual form for log lines. Ids are not escaped.
    std::string canonical() const;
};

/// A single rule parameter: numeric (thresholds, deadlines) or symbolic ("score-missing-ignore").
using RuleParam = std::variant<double, std::string>;

struct Rule {
    std::string name;
    std::vector<RuleParam> params;
};

/**
 * @brief Policy for collapsing repeated submissions on one item.
 */
enum class MultiplesPolicy {
    Last,
    First,
    Max,
    PassThrough
};

const char* toString(MultiplesPolicy policy);
std::optional<MultiplesPolicy> parseMultiplesPolicy(const std::string& name);

/// Closed interval [start, end] of accepted submission timestamps.
struct TimeFilter {
    EpochMillis start{0};
    EpochMillis end{315360000000000}; // 10000 years after the epoch
};

struct MetricDefinition {
    std::string id;
    std::string name;
    Level level{Level::Lesson};
    std::optional<std::string> scope;            ///< Item the metric is attached to
    Coverage coverage;
    Rule rule;
    std::optional<std::string> submetric;        ///< Id of a lower-level metric
    std::optional<std::map<std::string, double>> tagWeights;
    TimeFilter timeFilter;
    MultiplesPolicy multiples{MultiplesPolicy::Last};
    std::optional<std::string> submissionKind;   ///< Only submissions of this kind are eligible
    bool autoCompute{false};
    bool visibleToStudent{false};
    std::optional<EpochMillis> lastUpdated;
    std::uint64_t revision{0};
};

/**
 * @brief One raw recorded performance event. Consumed, never owned.
 */
struct Submission {
    std::string learnerId;
    std::string itemId;
    EpochMillis timestamp{0};
    double score{0.0};
    std::optional<std::string> tag;
    std::string kind;
};

struct ContentItem {
    std::string id;
    Level level{Level::Component};
    std::optional<std::string> parentId;
    std::optional<std::string> tag;
};

struct ScoreKey {
    std::string metricId;
    std::string learnerId;
    std::string scopeId;  ///< Empty for unscoped metrics

    std::string toString() const;

    bool operator==(const ScoreKey& other) const {
        return metricId == other.metricId && learnerId == other.learnerId &&
               scopeId == other.scopeId;
    }
    bool operator!=(const ScoreKey& other) const { return !(*this == other); }
    bool operator<(const ScoreKey& other) const {
        if (metricId != other.metricId) return metricId < other.metricId;
        if (learnerId != other.learnerId) return learnerId < other.learnerId;
        return scopeId < other.scopeId;
    }
};

struct ScoreKeyHash {
    std::size_t operator()(const ScoreKey& key) const;
};

/// One per-item input that went into an aggregate.
struct Contribution {
    std::string itemId;
    ScoreValue value;
    std::optional<std::string> tag;
    double weight{0.0};
};

struct Score {
    ScoreKey key;
    ScoreValue value;
    EpochMillis computedAt{0};
    std::uint64_t sourceGeneration{0};
    std::vector<Contribution> contributions;
    std::optional<EpochMillis> sourceTime;  ///< Latest submission timestamp that fed the value
};

/**
 * @brief Record of a failed recomputation. The stored Score is left untouched.
 */
struct RecomputeFailure {
    ScoreKey key;
    utils::ErrorCode code;
    std::string message;
    EpochMillis at{0};
};

} // namespace core
} // namespace scoreflow
