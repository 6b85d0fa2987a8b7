#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "scoreflow/core/rule_evaluator.h"

using namespace scoreflow;
using namespace scoreflow::core;

namespace {
    constexpr EpochMillis MINUTE = 60000;

    std::vector<RuleInput> scores(std::initializer_list<double> values) {
        std::vector<RuleInput> out;
        for (double v : values) out.push_back(RuleInput{v, 0});
        return out;
    }

    class ConstantRule : public ScoringRule {
    public:
        explicit ConstantRule(double value) : value_(value) {}
        std::string getId() const override { return "constant"; }
        Result<void> validateParams(const std::vector<RuleParam>&) const override { return Result<void>(); }
        ScoreValue evaluate(const std::vector<RuleInput>&, const std::vector<RuleParam>&) const override {
            return value_;
        }
    private:
        double value_;
    };
}

class RuleEvaluatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry = RuleRegistry::withBuiltinRules();
        evaluator = std::make_unique<RuleEvaluator>(registry);
    }

    double evaluate(const Rule& rule, const std::vector<RuleInput>& inputs) {
        auto result = evaluator->evaluate(rule, inputs);
        EXPECT_TRUE(result.has_value());
        EXPECT_TRUE(result.value().has_value());
        return result.value().value_or(std::numeric_limits<double>::quiet_NaN());
    }

    std::shared_ptr<RuleRegistry> registry;
    std::unique_ptr<RuleEvaluator> evaluator;
};

TEST_F(RuleEvaluatorTest, BuiltinRulesAreRegistered) {
    for (const char* name : {"average", "dropLowest", "dropNLowest", "binaryProportion", "decayedAverage"}) {
        EXPECT_TRUE(registry->hasRule(name)) << name;
    }
}

TEST_F(RuleEvaluatorTest, Average) {
    EXPECT_DOUBLE_EQ(evaluate({"average", {}}, scores({60, 80, 100})), 80);
}

TEST_F(RuleEvaluatorTest, EmptyNameMeansAverage) {
    EXPECT_DOUBLE_EQ(evaluate({"", {}}, scores({50, 100})), 75);
}

TEST_F(RuleEvaluatorTest, DropLowest) {
    EXPECT_DOUBLE_EQ(evaluate({"dropLowest", {}}, scores({10, 80, 100})), 90);
    EXPECT_DOUBLE_EQ(evaluate({"dropLowest", {}}, scores({42})), 42);
}

TEST_F(RuleEvaluatorTest, DropNLowest) {
    Rule rule{"dropNLowest", {2.0}};
    EXPECT_DOUBLE_EQ(evaluate(rule, scores({10, 20, 70, 90})), 80);
    EXPECT_DOUBLE_EQ(evaluate(rule, scores({10, 60})), 60);
}

TEST_F(RuleEvaluatorTest, BinaryProportion) {
    EXPECT_DOUBLE_EQ(evaluate({"binaryProportion", {}}, scores({49.9, 50, 100, 0})), 50);
}

TEST_F(RuleEvaluatorTest, DecayedAverageHalvesPerHalvingPeriod) {
    const EpochMillis deadline = 1000000;
    Rule rule{"decayedAverage", {static_cast<double>(deadline), 60.0}};

    std::vector<RuleInput> onTime{{80, deadline - MINUTE}};
    EXPECT_DOUBLE_EQ(evaluate(rule, onTime), 80);

    std::vector<RuleInput> hourLate{{80, deadline + 60 * MINUTE}};
    EXPECT_DOUBLE_EQ(evaluate(rule, hourLate), 40);
}

TEST_F(RuleEvaluatorTest, DecayedAverageRespectsCap) {
    const EpochMillis deadline = 0;
    Rule rule{"decayedAverage", {0.0, 60.0, 60.0}};
    std::vector<RuleInput> veryLate{{80, deadline + 600 * MINUTE}};
    EXPECT_DOUBLE_EQ(evaluate(rule, veryLate), 40);
}

TEST_F(RuleEvaluatorTest, EmptyInputIsAbsent) {
    auto result = evaluator->evaluate({"average", {}}, {});
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result.value().has_value());
}

TEST_F(RuleEvaluatorTest, MissingZeroPolicyImputesZeroForEmptyInput) {
    const std::vector<Rule> zeroing{
        {"average", {std::string("score-missing-zero")}},
        {"dropLowest", {std::string("score-missing-zero")}},
        {"dropNLowest", {2.0, std::string("score-missing-zero")}},
        {"binaryProportion", {std::string("score-missing-zero")}},
    };
    for (const auto& rule : zeroing) {
        auto result = evaluator->evaluate(rule, {});
        ASSERT_TRUE(result.has_value()) << rule.name;
        ASSERT_TRUE(result.value().has_value()) << rule.name;
        EXPECT_DOUBLE_EQ(*result.value(), 0) << rule.name;
    }

    auto ignored = evaluator->evaluate({"average", {std::string("score-missing-ignore")}}, {});
    ASSERT_TRUE(ignored.has_value());
    EXPECT_FALSE(ignored.value().has_value());

    // The policy only fills in missing items; present scores are untouched
    EXPECT_DOUBLE_EQ(evaluate({"average", {std::string("score-missing-zero")}}, scores({60, 80})), 70);
}

TEST_F(RuleEvaluatorTest, NonFiniteResultIsAbsent) {
    registry->registerRule(std::make_shared<ConstantRule>(std::numeric_limits<double>::infinity()));
    auto result = evaluator->evaluate({"constant", {}}, scores({1}));
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result.value().has_value());
}

TEST_F(RuleEvaluatorTest, UnknownRuleFails) {
    auto result = evaluator->evaluate({"median", {}}, scores({1, 2}));
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code, ErrorCode::UnknownRule);

    auto validation = evaluator->validate({"median", {}});
    ASSERT_TRUE(validation.has_error());
    EXPECT_EQ(validation.error().code, ErrorCode::UnknownRule);
}

TEST_F(RuleEvaluatorTest, CustomRulesCanBeRegistered) {
    registry->registerRule(std::make_shared<ConstantRule>(12.5));
    EXPECT_DOUBLE_EQ(evaluate({"constant", {}}, scores({99})), 12.5);

    ASSERT_TRUE(registry->unregisterRule("constant"));
    EXPECT_TRUE(evaluator->evaluate({"constant", {}}, scores({99})).has_error());
}

TEST_F(RuleEvaluatorTest, ParameterValidation) {
    EXPECT_TRUE(evaluator->validate({"average", {std::string("score-missing-ignore")}}).has_value());
    EXPECT_TRUE(evaluator->validate({"dropNLowest", {1.0, std::string("score-missing-zero")}}).has_value());
    EXPECT_TRUE(evaluator->validate({"dropNLowest", {1000000.0}}).has_value());

    struct Case { Rule rule; const char* why; };
    std::vector<Case> bad{
        {{"average", {std::string("sometimes")}}, "unknown missing-value policy"},
        {{"average", {std::string("score-missing-zero"), 1.0}}, "too many parameters"},
        {{"dropNLowest", {}}, "missing N"},
        {{"dropNLowest", {-1.0}}, "negative N"},
        {{"dropNLowest", {1.5}}, "fractional N"},
        {{"dropNLowest", {1e7}}, "N above limit"},
        {{"dropNLowest", {1e300}}, "N beyond size_t"},
        {{"decayedAverage", {0.0}}, "missing halving"},
        {{"decayedAverage", {0.0, 0.0}}, "zero halving"},
        {{"decayedAverage", {0.0, 10.0, -1.0}}, "negative cap"},
        {{"decayedAverage", {0.0, std::string("soon")}}, "non-numeric"},
    };
    for (const auto& c : bad) {
        auto result = evaluator->validate(c.rule);
        ASSERT_TRUE(result.has_error()) << c.why;
        EXPECT_EQ(result.error().code, ErrorCode::InvalidConfiguration) << c.why;
    }
}
