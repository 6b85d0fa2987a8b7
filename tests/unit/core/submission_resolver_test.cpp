#include <gtest/gtest.h>
#include "scoreflow/core/submission_resolver.h"

using namespace scoreflow::core;

namespace {
    Submission make(EpochMillis timestamp, double score, std::optional<std::string> tag = std::nullopt) {
        return Submission{"learner", "c1", timestamp, score, std::move(tag), "completed"};
    }
}

class SubmissionResolverTest : public ::testing::Test {
protected:
    // Insertion order differs from timestamp order on purpose
    std::vector<Submission> attempts{
        make(200, 40),
        make(100, 90),
        make(300, 70),
        make(150, 90),
    };
};

TEST_F(SubmissionResolverTest, LastPicksGreatestTimestamp) {
    auto resolved = resolveSubmissions(attempts, MultiplesPolicy::Last);
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(resolved[0].timestamp, 300);
    EXPECT_DOUBLE_EQ(resolved[0].score, 70);
}

TEST_F(SubmissionResolverTest, FirstPicksSmallestTimestamp) {
    auto resolved = resolveSubmissions(attempts, MultiplesPolicy::First);
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(resolved[0].timestamp, 100);
}

TEST_F(SubmissionResolverTest, MaxPicksHighestScoreEarliestOnTie) {
    auto resolved = resolveSubmissions(attempts, MultiplesPolicy::Max);
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_DOUBLE_EQ(resolved[0].score, 90);
    EXPECT_EQ(resolved[0].timestamp, 100);
}

TEST_F(SubmissionResolverTest, PassThroughKeepsEverythingInOrder) {
    auto resolved = resolveSubmissions(attempts, MultiplesPolicy::PassThrough);
    ASSERT_EQ(resolved.size(), attempts.size());
    for (std::size_t i = 0; i < attempts.size(); ++i) {
        EXPECT_EQ(resolved[i].timestamp, attempts[i].timestamp);
    }
}

TEST_F(SubmissionResolverTest, TimestampTiesResolveByInsertionOrder) {
    std::vector<Submission> tied{make(500, 10), make(500, 20), make(500, 30)};

    auto last = resolveSubmissions(tied, MultiplesPolicy::Last);
    ASSERT_EQ(last.size(), 1u);
    EXPECT_DOUBLE_EQ(last[0].score, 30);

    auto first = resolveSubmissions(tied, MultiplesPolicy::First);
    ASSERT_EQ(first.size(), 1u);
    EXPECT_DOUBLE_EQ(first[0].score, 10);
}

TEST_F(SubmissionResolverTest, EmptyInputStaysEmpty) {
    for (auto policy : {MultiplesPolicy::Last, MultiplesPolicy::First,
                        MultiplesPolicy::Max, MultiplesPolicy::PassThrough}) {
        EXPECT_TRUE(resolveSubmissions({}, policy).empty()) << toString(policy);
    }
}

TEST(RepresentativeTagTest, MostFrequentTagWins) {
    std::vector<Submission> subs{
        make(1, 50, std::string("quiz")),
        make(2, 50, std::string("exam")),
        make(3, 50, std::string("exam")),
        make(4, 50, std::nullopt),
    };
    EXPECT_EQ(representativeTag(subs), std::optional<std::string>("exam"));
}

TEST(RepresentativeTagTest, TieGoesToFirstSeen) {
    std::vector<Submission> subs{
        make(1, 50, std::string("quiz")),
        make(2, 50, std::string("exam")),
    };
    EXPECT_EQ(representativeTag(subs), std::optional<std::string>("quiz"));
}

TEST(RepresentativeTagTest, UntaggedSubmissionsGiveNoTag) {
    EXPECT_FALSE(representativeTag({make(1, 50), make(2, 60)}).has_value());
}
