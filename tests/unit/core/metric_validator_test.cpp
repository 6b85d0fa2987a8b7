#include <gtest/gtest.h>
#include <algorithm>
#include "scoreflow/core/in_memory_stores.h"
#include "scoreflow/core/metric_validator.h"

using namespace scoreflow;
using namespace scoreflow::core;

class MetricValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        catalog = std::make_shared<InMemoryContentCatalog>();
        catalog->addItem({"N1", Level::Namespace, std::nullopt, std::nullopt});
        catalog->addItem({"L1", Level::Lesson, "N1", "homework"});
        catalog->addItem({"L2", Level::Lesson, "N1", "exam"});
        catalog->addItem({"c1", Level::Component, "L1", std::nullopt});
        catalog->addItem({"c2", Level::Component, "L2", std::nullopt});

        definitions = std::make_shared<InMemoryMetricDefinitionStore>();
        auto coverage = std::make_shared<CoverageResolver>(catalog, CacheConfig{});
        auto rules = std::make_shared<RuleEvaluator>(RuleRegistry::withBuiltinRules());
        validator = std::make_unique<MetricValidator>(definitions, coverage, rules);
    }

    static MetricDefinition metric(const std::string& id, Level level) {
        MetricDefinition m;
        m.id = id;
        m.name = id;
        m.level = level;
        m.rule = Rule{"average", {}};
        return m;
    }

    ErrorCode failureOf(const MetricDefinition& m) {
        auto result = validator->validate(m);
        EXPECT_TRUE(result.has_error()) << m.id << " unexpectedly valid";
        return result.has_error() ? result.error().code : ErrorCode::StoreUnavailable;
    }

    std::shared_ptr<InMemoryContentCatalog> catalog;
    std::shared_ptr<InMemoryMetricDefinitionStore> definitions;
    std::unique_ptr<MetricValidator> validator;
};

TEST_F(MetricValidatorTest, AcceptsWellFormedDefinitions) {
    auto component = metric("completion", Level::Component);
    definitions->put(component);

    auto lesson = metric("lesson-avg", Level::Lesson);
    lesson.submetric = "completion";
    lesson.tagWeights = std::map<std::string, double>{{"homework", 1}, {"exam", 2}};
    lesson.scope = "N1";

    EXPECT_TRUE(validator->validate(component).has_value());
    EXPECT_TRUE(validator->validate(lesson).has_value());
}

TEST_F(MetricValidatorTest, DetectsSelfReference) {
    auto m = metric("loop", Level::Lesson);
    m.submetric = "loop";
    definitions->put(m);
    EXPECT_EQ(failureOf(m), ErrorCode::CyclicMetricReference);
}

TEST_F(MetricValidatorTest, DetectsLongerCycles) {
    auto a = metric("a", Level::Program);
    auto b = metric("b", Level::Namespace);
    auto c = metric("c", Level::Lesson);
    a.submetric = "b";
    b.submetric = "c";
    c.submetric = "a";
    definitions->put(a);
    definitions->put(b);
    definitions->put(c);

    EXPECT_EQ(failureOf(a), ErrorCode::CyclicMetricReference);
    EXPECT_EQ(failureOf(b), ErrorCode::CyclicMetricReference);
}

TEST_F(MetricValidatorTest, CycleIsReportedBeforeOtherProblems) {
    auto m = metric("loop", Level::Lesson);
    m.submetric = "loop";
    m.rule = Rule{"median", {}};
    m.timeFilter = TimeFilter{10, 5};
    EXPECT_EQ(failureOf(m), ErrorCode::CyclicMetricReference);
}

TEST_F(MetricValidatorTest, MissingSubmetric) {
    auto m = metric("lesson-avg", Level::Lesson);
    m.submetric = "nowhere";
    EXPECT_EQ(failureOf(m), ErrorCode::UnknownMetric);
}

TEST_F(MetricValidatorTest, SubmetricMustSitBelow) {
    definitions->put(metric("peer", Level::Lesson));
    auto m = metric("lesson-avg", Level::Lesson);
    m.submetric = "peer";
    EXPECT_EQ(failureOf(m), ErrorCode::InvalidConfiguration);
}

TEST_F(MetricValidatorTest, TimeFilterMustBeOrdered) {
    auto m = metric("c", Level::Component);
    m.timeFilter = TimeFilter{2000, 1000};
    EXPECT_EQ(failureOf(m), ErrorCode::InvalidConfiguration);

    m.timeFilter = TimeFilter{1000, 1000};
    EXPECT_TRUE(validator->validate(m).has_value());
}

TEST_F(MetricValidatorTest, RejectsNegativeTagWeights) {
    auto m = metric("c", Level::Component);
    m.tagWeights = std::map<std::string, double>{{"exam", -1}};
    EXPECT_EQ(failureOf(m), ErrorCode::InvalidConfiguration);
}

TEST_F(MetricValidatorTest, RejectsUnknownRuleAndBadParams) {
    auto unknown = metric("c", Level::Component);
    unknown.rule = Rule{"median", {}};
    EXPECT_EQ(failureOf(unknown), ErrorCode::UnknownRule);

    auto badParams = metric("c", Level::Component);
    badParams.rule = Rule{"dropNLowest", {std::string("two")}};
    EXPECT_EQ(failureOf(badParams), ErrorCode::InvalidConfiguration);
}

TEST_F(MetricValidatorTest, RejectsUnknownCoverageItemsAndScope) {
    auto include = metric("c", Level::Component);
    include.coverage = Coverage::include({"c1", "c99"});
    EXPECT_EQ(failureOf(include), ErrorCode::UnknownItem);

    auto scoped = metric("c", Level::Component);
    scoped.scope = "L404";
    EXPECT_EQ(failureOf(scoped), ErrorCode::UnknownItem);

    auto excluded = metric("c", Level::Component);
    excluded.coverage = Coverage::exclude({"c99"});
    EXPECT_TRUE(validator->validate(excluded).has_value());
}

TEST_F(MetricValidatorTest, IncludeChecksUseTheSubmetricLevel) {
    definitions->put(metric("completion", Level::Component));
    auto m = metric("lesson-avg", Level::Lesson);
    m.submetric = "completion";
    m.coverage = Coverage::include({"L1"});
    EXPECT_EQ(failureOf(m), ErrorCode::UnknownItem);

    m.coverage = Coverage::include({"c1"});
    EXPECT_TRUE(validator->validate(m).has_value());
}

TEST_F(MetricValidatorTest, CheckCollectsWarnings) {
    auto m = metric("c", Level::Component);
    m.tagWeights = std::map<std::string, double>{{"exam", 0}};
    auto result = validator->check(m);
    EXPECT_TRUE(result.isValid());
    ASSERT_FALSE(result.warnings.empty());
    EXPECT_NE(result.warnings[0].find("zero"), std::string::npos);
}

TEST_F(MetricValidatorTest, ValidateAllReportsEveryDefinition) {
    definitions->put(metric("good", Level::Component));
    auto bad = metric("bad", Level::Component);
    bad.rule = Rule{"median", {}};
    definitions->put(bad);

    auto results = validator->validateAll();
    ASSERT_TRUE(results.has_value());
    ASSERT_EQ(results.value().size(), 2u);

    auto find = [&](const std::string& id) {
        return *std::find_if(results.value().begin(), results.value().end(),
                             [&](const auto& r) { return r.metricId == id; });
    };
    EXPECT_TRUE(find("good").isValid());
    EXPECT_FALSE(find("bad").isValid());
    EXPECT_EQ(find("bad").error->code, ErrorCode::UnknownRule);
}
