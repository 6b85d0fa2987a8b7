#include <gtest/gtest.h>
#include "scoreflow/utils/serialization.h"

using namespace scoreflow;
using namespace scoreflow::core;
using namespace scoreflow::utils;
using nlohmann::json;

TEST(MetricSerializationTest, ReadsFullDocument) {
    auto parsed = parseJson(R"({
        "id": "weighted-lessons",
        "name": "Weighted lessons",
        "level": "namespace",
        "scope": "N1",
        "coverage": ["exclude", "L9"],
        "rule": ["dropNLowest", 1, "score-missing-zero"],
        "submetric": "lesson-score",
        "tagWeights": {"homework": 3, "exam": 1},
        "timeFilter": [1000, 3.1536e14],
        "multiples": "pass-through",
        "submissionKind": "correct",
        "autoCompute": true,
        "visibleToStudent": true
    })");
    ASSERT_TRUE(parsed.has_value());

    auto metric = metricFromJson(parsed.value());
    ASSERT_TRUE(metric.has_value()) << metric.error().describe();
    const auto& m = metric.value();
    EXPECT_EQ(m.id, "weighted-lessons");
    EXPECT_EQ(m.level, Level::Namespace);
    EXPECT_EQ(m.scope, std::optional<std::string>("N1"));
    ASSERT_TRUE(std::holds_alternative<Coverage::Exclude>(m.coverage.selection));
    EXPECT_EQ(std::get<Coverage::Exclude>(m.coverage.selection).ids, std::vector<std::string>{"L9"});
    EXPECT_EQ(m.rule.name, "dropNLowest");
    ASSERT_EQ(m.rule.params.size(), 2u);
    EXPECT_DOUBLE_EQ(std::get<double>(m.rule.params[0]), 1);
    EXPECT_EQ(std::get<std::string>(m.rule.params[1]), "score-missing-zero");
    EXPECT_EQ(m.submetric, std::optional<std::string>("lesson-score"));
    ASSERT_TRUE(m.tagWeights.has_value());
    EXPECT_DOUBLE_EQ(m.tagWeights->at("homework"), 3);
    EXPECT_EQ(m.timeFilter.start, 1000);
    EXPECT_EQ(m.timeFilter.end, 315360000000000);
    EXPECT_EQ(m.multiples, MultiplesPolicy::PassThrough);
    EXPECT_EQ(m.submissionKind, std::optional<std::string>("correct"));
    EXPECT_TRUE(m.autoCompute);
    EXPECT_TRUE(m.visibleToStudent);
}

TEST(MetricSerializationTest, AppliesDefaults) {
    auto metric = metricFromJson(json{{"name", "completion"}, {"level", "component"}});
    ASSERT_TRUE(metric.has_value());
    const auto& m = metric.value();
    EXPECT_EQ(m.id, "completion");
    EXPECT_TRUE(std::holds_alternative<Coverage::All>(m.coverage.selection));
    EXPECT_TRUE(m.rule.name.empty());
    EXPECT_FALSE(m.submetric.has_value());
    EXPECT_FALSE(m.tagWeights.has_value());
    EXPECT_EQ(m.multiples, MultiplesPolicy::Last);
    EXPECT_FALSE(m.autoCompute);
}

TEST(MetricSerializationTest, WritesNullForUnsetFields) {
    MetricDefinition m;
    m.id = "c";
    m.name = "c";
    m.level = Level::Component;
    m.coverage = Coverage::include({"c1", "c2"});
    m.rule = Rule{"average", {}};

    auto j = metricToJson(m);
    EXPECT_TRUE(j.at("submetric").is_null());
    EXPECT_TRUE(j.at("tagWeights").is_null());
    EXPECT_TRUE(j.at("scope").is_null());
    EXPECT_EQ(j.at("coverage"), json::array({"include", "c1", "c2"}));
    EXPECT_EQ(j.at("rule"), json::array({"average"}));
    EXPECT_EQ(j.at("level"), "component");

    auto back = metricFromJson(j);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(metricToJson(back.value()), j);
}

TEST(MetricSerializationTest, RejectsMalformedDocuments) {
    struct Case { json document; const char* why; };
    std::vector<Case> bad{
        {json::array(), "not an object"},
        {json{{"level", "lesson"}}, "missing name"},
        {json{{"name", "x"}}, "missing level"},
        {json{{"name", "x"}, {"level", "course"}}, "unknown level"},
        {json{{"name", "x"}, {"level", "lesson"}, {"coverage", json::array({"some"})}}, "unknown coverage mode"},
        {json{{"name", "x"}, {"level", "lesson"}, {"rule", "average"}}, "rule not an array"},
        {json{{"name", "x"}, {"level", "lesson"}, {"rule", json::array({"average", true})}}, "boolean parameter"},
        {json{{"name", "x"}, {"level", "lesson"}, {"timeFilter", json::array({1})}}, "one-sided time filter"},
        {json{{"name", "x"}, {"level", "lesson"}, {"multiples", "median"}}, "unknown multiples"},
        {json{{"name", 7}, {"level", "lesson"}}, "wrongly typed name"},
    };
    for (const auto& c : bad) {
        auto result = metricFromJson(c.document);
        ASSERT_TRUE(result.has_error()) << c.why;
        EXPECT_EQ(result.error().code, ErrorCode::InvalidConfiguration) << c.why;
    }
}

TEST(MetricSerializationTest, ReadsArraysAndStopsAtFirstError) {
    json list = json::array({
        json{{"name", "a"}, {"level", "component"}},
        json{{"name", "b"}, {"level", "lesson"}, {"submetric", "a"}},
    });
    auto metrics = metricsFromJson(list);
    ASSERT_TRUE(metrics.has_value());
    ASSERT_EQ(metrics.value().size(), 2u);
    EXPECT_EQ(metrics.value()[1].submetric, std::optional<std::string>("a"));

    list.push_back(json{{"name", "c"}});
    EXPECT_TRUE(metricsFromJson(list).has_error());
    EXPECT_TRUE(metricsFromJson(json::object()).has_error());
}

TEST(ScoreSerializationTest, AbsentIsNullNotZero) {
    Score score;
    score.key = ScoreKey{"m", "u1", "N1"};
    score.value = std::nullopt;
    score.computedAt = 1700000000000;
    score.contributions.push_back(Contribution{"L1", std::nullopt, std::string("exam"), 0.0});
    score.contributions.push_back(Contribution{"L2", 0.0, std::nullopt, 1.0});

    auto j = scoreToJson(score);
    EXPECT_TRUE(j.at("value").is_null());
    EXPECT_TRUE(j.at("contributions")[0].at("value").is_null());
    EXPECT_EQ(j.at("contributions")[1].at("value"), 0.0);
    EXPECT_TRUE(j.at("contributions")[1].at("tag").is_null());

    auto back = scoreFromJson(j);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back.value().key, score.key);
    EXPECT_FALSE(back.value().value.has_value());
    ASSERT_EQ(back.value().contributions.size(), 2u);
    EXPECT_EQ(back.value().contributions[0].tag, std::optional<std::string>("exam"));
    ASSERT_TRUE(back.value().contributions[1].value.has_value());
    EXPECT_DOUBLE_EQ(*back.value().contributions[1].value, 0.0);
}

TEST(ScoreSerializationTest, SourceTimeIsNullWhenUnknown) {
    Score score;
    score.key = ScoreKey{"m", "u1", ""};
    score.value = 80.0;
    score.computedAt = 1700000000000;

    auto j = scoreToJson(score);
    EXPECT_TRUE(j.at("sourceTime").is_null());
    auto back = scoreFromJson(j);
    ASSERT_TRUE(back.has_value());
    EXPECT_FALSE(back.value().sourceTime.has_value());

    score.sourceTime = 500;
    back = scoreFromJson(scoreToJson(score));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back.value().sourceTime, std::optional<EpochMillis>(500));
}

TEST(ScoreSerializationTest, RejectsIncompleteScores) {
    auto result = scoreFromJson(json{{"metric", "m"}});
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidConfiguration);
}

TEST(ParseJsonTest, ReportsSyntaxErrors) {
    auto result = parseJson("{\"name\": ");
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidConfiguration);
}
