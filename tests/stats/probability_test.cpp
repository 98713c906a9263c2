// Tests for stats/probability.h -- vote rates, group comparisons, distributions.

#include "stats/probability.h"

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace deliberation {
namespace {

constexpr double kTolerance = 1e-9;

VoteInfo twoGroups() {
  return VoteInfo::byGroup({{"0", {10, 5, 0}}, {"1", {5, 10, 5}}});
}

// ---------------------------------------------------------------------------
// Single tally
// ---------------------------------------------------------------------------

TEST(ProbabilityTest, AgreeRateUsesPrior) {
  EXPECT_NEAR(agreeRate({10, 5, 5}, true), 11.0 / 22.0, kTolerance);
  EXPECT_NEAR(agreeRate({10, 5, 5}, false), 11.0 / 17.0, kTolerance);
}

TEST(ProbabilityTest, EmptyTallyEstimatesHalf) {
  EXPECT_NEAR(agreeRate({0, 0, 0}, true), 0.5, kTolerance);
  EXPECT_NEAR(disagreeRate({0, 0, 0}, true), 0.5, kTolerance);
  EXPECT_NEAR(passRate({0, 0, 0}), 0.5, kTolerance);
}

TEST(ProbabilityTest, OneSidedTallies) {
  EXPECT_NEAR(agreeRate({0, 5, 0}, true), 1.0 / 7.0, kTolerance);
  EXPECT_NEAR(agreeRate({5, 0, 0}, true), 6.0 / 7.0, kTolerance);
  EXPECT_NEAR(disagreeRate({0, 5, 0}, true), 6.0 / 7.0, kTolerance);
  EXPECT_NEAR(disagreeRate({5, 0, 0}, true), 1.0 / 7.0, kTolerance);
}

TEST(ProbabilityTest, RawRatesWithoutPrior) {
  EXPECT_NEAR(agreeRate({10, 5, 5}, true, false), 0.5, kTolerance);
  EXPECT_NEAR(disagreeRate({10, 5, 5}, false, false), 1.0 / 3.0, kTolerance);
  EXPECT_NEAR(passRate({10, 5, 5}, false), 0.25, kTolerance);
}

TEST(ProbabilityTest, RawRateOfEmptyTallyIsZero) {
  EXPECT_EQ(agreeRate({0, 0, 0}, true, false), 0.0);
  EXPECT_EQ(disagreeRate({0, 0, 4}, false, false), 0.0);
  EXPECT_EQ(passRate({0, 0, 0}, false), 0.0);
}

TEST(ProbabilityTest, RawAgreeAndDisagreeSumToOneWithoutPasses) {
  const VoteTally tallies[] = {{1, 0, 0}, {3, 7, 2}, {20, 1, 2}, {9, 9, 30}};
  for (const auto& tally : tallies) {
    EXPECT_NEAR(agreeRate(tally, false, false) + disagreeRate(tally, false, false), 1.0,
                kTolerance);
  }
}

TEST(ProbabilityTest, EstimatedAgreeAndDisagreeSumToExactlyOne) {
  for (VoteCount agree = 0; agree < 60; ++agree) {
    for (VoteCount disagree = 0; disagree < 60; ++disagree) {
      VoteTally tally{agree, disagree, agree % 7};
      EXPECT_EQ(agreeRate(tally, false, true) + disagreeRate(tally, false, true), 1.0)
          << agree << "/" << disagree;
    }
  }
}

TEST(ProbabilityTest, RatesStayWithinUnitInterval) {
  const VoteTally tallies[] = {{0, 0, 0}, {100, 0, 0}, {0, 0, 100}, {4, 4, 4}};
  for (const auto& tally : tallies) {
    for (bool estimate : {true, false}) {
      EXPECT_GE(agreeRate(tally, true, estimate), 0.0);
      EXPECT_LE(agreeRate(tally, true, estimate), 1.0);
      EXPECT_GE(passRate(tally, estimate), 0.0);
      EXPECT_LE(passRate(tally, estimate), 1.0);
    }
  }
}

// ---------------------------------------------------------------------------
// Whole comment
// ---------------------------------------------------------------------------

TEST(ProbabilityTest, TotalRateSumsGroupsBeforeSmoothing) {
  EXPECT_NEAR(totalAgreeRate(twoGroups(), true, false), 15.0 / 35.0, kTolerance);
  EXPECT_NEAR(totalAgreeRate(twoGroups(), true, true), 16.0 / 37.0, kTolerance);
  EXPECT_NEAR(totalPassRate(twoGroups(), false), 5.0 / 35.0, kTolerance);
}

TEST(ProbabilityTest, TotalRateOfPooledTally) {
  VoteInfo info = VoteInfo::pooled({10, 5, 0});
  EXPECT_NEAR(totalAgreeRate(info, true, false), 10.0 / 15.0, kTolerance);
  EXPECT_NEAR(totalDisagreeRate(info, false, false), 5.0 / 15.0, kTolerance);
}

// ---------------------------------------------------------------------------
// Group comparisons
// ---------------------------------------------------------------------------

TEST(ProbabilityTest, GroupInformedConsensusIsProduct) {
  EXPECT_NEAR(groupInformedConsensus(twoGroups()), (11.0 / 17.0) * (6.0 / 22.0), kTolerance);
  EXPECT_NEAR(groupInformedDisagreeConsensus(twoGroups()), (6.0 / 17.0) * (11.0 / 22.0),
              kTolerance);
}

TEST(ProbabilityTest, MinimumGroupRates) {
  EXPECT_NEAR(minAgreeProb(twoGroups()), 3.0 / 11.0, kTolerance);
  EXPECT_NEAR(minDisagreeProb(twoGroups()), 6.0 / 17.0, kTolerance);
}

TEST(ProbabilityTest, GroupAgreeDifferenceAgainstRest) {
  VoteInfo info = VoteInfo::byGroup({{"0", {1, 2, 0}}, {"1", {3, 1, 0}}});
  EXPECT_NEAR(groupAgreeProbDifference(info, "0"), 2.0 / 5.0 - 2.0 / 3.0, kTolerance);
  EXPECT_NEAR(groupAgreeProbDifference(info, "1"), 2.0 / 3.0 - 2.0 / 5.0, kTolerance);
  EXPECT_NEAR(maxGroupAgreeProbDifference(info), 2.0 / 3.0 - 2.0 / 5.0, kTolerance);
}

TEST(ProbabilityTest, GroupAgreeDifferenceUnknownGroupThrows) {
  EXPECT_THROW(groupAgreeProbDifference(twoGroups(), "7"), std::invalid_argument);
}

TEST(ProbabilityTest, GroupFunctionsRejectPooledInfo) {
  VoteInfo pooled = VoteInfo::pooled({10, 5, 0});
  EXPECT_THROW(groupInformedConsensus(pooled), std::invalid_argument);
  EXPECT_THROW(groupInformedDisagreeConsensus(pooled), std::invalid_argument);
  EXPECT_THROW(minAgreeProb(pooled), std::invalid_argument);
  EXPECT_THROW(minDisagreeProb(pooled), std::invalid_argument);
  EXPECT_THROW(maxGroupAgreeProbDifference(pooled), std::invalid_argument);
}

TEST(ProbabilityTest, PooledErrorNamesTheCalculation) {
  try {
    minAgreeProb(VoteInfo::pooled({1, 1, 1}));
    FAIL() << "expected std::invalid_argument";
  } catch (const std::invalid_argument& ex) {
    EXPECT_NE(std::string(ex.what()).find("Group information is required"), std::string::npos);
  }
}

// ---------------------------------------------------------------------------
// Distribution helpers
// ---------------------------------------------------------------------------

TEST(DistributionTest, MeanAndStandardDeviation) {
  std::vector<double> values = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
  EXPECT_NEAR(mean(values), 5.0, kTolerance);
  EXPECT_NEAR(sampleStandardDeviation(values), std::sqrt(32.0 / 7.0), kTolerance);
}

TEST(DistributionTest, DegenerateInputs) {
  EXPECT_EQ(mean({}), 0.0);
  EXPECT_EQ(sampleStandardDeviation({}), 0.0);
  EXPECT_EQ(sampleStandardDeviation({3.0}), 0.0);
  EXPECT_EQ(percentile({}, 0.5), 0.0);
}

TEST(DistributionTest, PercentileInterpolates) {
  std::vector<double> values = {0.4, 0.1, 0.3, 0.2};
  EXPECT_NEAR(percentile(values, 0.0), 0.1, kTolerance);
  EXPECT_NEAR(percentile(values, 1.0), 0.4, kTolerance);
  EXPECT_NEAR(percentile(values, 0.75), 0.325, kTolerance);
  EXPECT_NEAR(percentile(values, 0.5), 0.25, kTolerance);
}

}  // namespace
}  // namespace deliberation
