// Tests for stats/pooled_scorer.h -- pooled (majority) consensus scoring.

#include "stats/pooled_scorer.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace deliberation {
namespace {

Comment singleGroupComment(const std::string& id, VoteCount agree, VoteCount disagree,
                           VoteCount pass) {
  return Comment{id, "comment" + id, VoteInfo::byGroup({{"0", {agree, disagree, pass}}}), {}};
}

Comment pooledComment(const std::string& id, VoteCount agree, VoteCount disagree,
                      VoteCount pass) {
  return Comment{id, "comment" + id, VoteInfo::pooled({agree, disagree, pass}), {}};
}

std::vector<std::string> ids(const std::vector<Comment>& comments) {
  std::vector<std::string> result;
  for (const auto& comment : comments) result.push_back(comment.id);
  return result;
}

std::vector<std::string> sortedIds(const std::vector<Comment>& comments) {
  std::vector<std::string> result = ids(comments);
  std::sort(result.begin(), result.end());
  return result;
}

/// Agreement, disagreement, split votes and three heavily passed comments.
std::vector<Comment> majorityComments() {
  return {
      singleGroupComment("1", 20, 1, 2),   singleGroupComment("2", 2, 50, 3),
      singleGroupComment("3", 10, 11, 3),  singleGroupComment("4", 33, 33, 33),
      singleGroupComment("5", 3, 4, 150),  singleGroupComment("6", 3, 4, 150),
      singleGroupComment("7", 3, 4, 150),
  };
}

// ---------------------------------------------------------------------------
// Selections
// ---------------------------------------------------------------------------

TEST(PooledScorerTest, CommonGroundCoversAgreeAndDisagree) {
  PooledScorer scorer(majorityComments());
  std::vector<Comment> selected = scorer.selectCommonGround(3);
  EXPECT_EQ(sortedIds(selected), (std::vector<std::string>{"1", "2"}));
}

TEST(PooledScorerTest, CommonGroundOrderedByStrongerSide) {
  PooledScorer scorer(majorityComments());
  // 50/52 disagreement beats 20/21 agreement.
  EXPECT_EQ(ids(scorer.selectCommonGround(3)), (std::vector<std::string>{"2", "1"}));
}

TEST(PooledScorerTest, MostAgreement) {
  PooledScorer scorer(majorityComments());
  std::vector<Comment> selected = scorer.selectCommonGroundAgree(1);
  ASSERT_EQ(selected.size(), 1u);
  EXPECT_EQ(selected[0].id, "1");
}

TEST(PooledScorerTest, MostDisagreement) {
  PooledScorer scorer(majorityComments());
  std::vector<Comment> selected = scorer.selectCommonGroundDisagree(1);
  ASSERT_EQ(selected.size(), 1u);
  EXPECT_EQ(selected[0].id, "2");
}

TEST(PooledScorerTest, DifferencesOfOpinionExcludeUncertainComments) {
  PooledScorer scorer(majorityComments());
  EXPECT_EQ(sortedIds(scorer.selectDifferencesOfOpinion(10)),
            (std::vector<std::string>{"3", "4"}));
}

TEST(PooledScorerTest, UncertainComments) {
  PooledScorer scorer(majorityComments());
  EXPECT_EQ(sortedIds(scorer.selectUncertain(10)), (std::vector<std::string>{"5", "6", "7"}));
  EXPECT_NEAR(scorer.uncertaintyThreshold(), 150.0 / 157.0, 1e-9);
}

TEST(PooledScorerTest, PassRateEqualToThresholdIsUncertain) {
  // The three passed comments fill the top quartile, so the threshold is
  // their own pass rate.
  PooledScorer scorer(majorityComments());
  const Comment& passed = scorer.comments()[4];
  EXPECT_EQ(scorer.uncertainScore(passed), scorer.uncertaintyThreshold());
  std::vector<Comment> uncertain = scorer.selectUncertain(10);
  EXPECT_NE(std::find_if(uncertain.begin(), uncertain.end(),
                         [](const Comment& comment) { return comment.id == "5"; }),
            uncertain.end());
}

TEST(PooledScorerTest, SmallConversationUsesUncertaintyFloor) {
  PooledScorer scorer({singleGroupComment("1", 20, 1, 2), singleGroupComment("2", 2, 50, 3),
                       singleGroupComment("3", 10, 11, 3)});
  EXPECT_DOUBLE_EQ(scorer.uncertaintyThreshold(), 0.2);
  EXPECT_EQ(ids(scorer.selectDifferencesOfOpinion(3)), (std::vector<std::string>{"3"}));
  EXPECT_TRUE(scorer.selectUncertain(3).empty());
}

TEST(PooledScorerTest, StrongAgreementWithPooledTally) {
  PooledScorer scorer({pooledComment("a", 20, 1, 2)});
  std::vector<Comment> selected = scorer.selectCommonGround();
  ASSERT_EQ(selected.size(), 1u);
  EXPECT_EQ(selected[0].id, "a");
  EXPECT_TRUE(scorer.selectDifferencesOfOpinion().empty());
}

TEST(PooledScorerTest, DifferenceBandIsInclusive) {
  // 8 agree / 12 disagree -> exactly 0.4 / 0.6 without passes.
  PooledScorer scorer({pooledComment("edge", 8, 12, 0)});
  EXPECT_EQ(ids(scorer.selectDifferencesOfOpinion()), (std::vector<std::string>{"edge"}));
}

TEST(PooledScorerTest, OutsideDifferenceBand) {
  PooledScorer scorer({pooledComment("lean", 13, 7, 0)});
  EXPECT_TRUE(scorer.selectDifferencesOfOpinion().empty());
  EXPECT_TRUE(scorer.selectCommonGround().empty());
}

// ---------------------------------------------------------------------------
// Scores
// ---------------------------------------------------------------------------

TEST(PooledScorerTest, DifferenceScorePenalizesImbalanceAndPasses) {
  PooledScorer scorer({pooledComment("a", 10, 10, 0), pooledComment("b", 9, 11, 5)});
  EXPECT_NEAR(scorer.differenceOfOpinionScore(scorer.comments()[0]), 1.0, 1e-9);
  EXPECT_NEAR(scorer.differenceOfOpinionScore(scorer.comments()[1]), 1.0 - 0.1 - 0.2, 1e-9);
}

TEST(PooledScorerTest, ScoresOfCommentWithoutVotesAreZero) {
  Comment unvoted{"x", "no votes", std::nullopt, {}};
  PooledScorer scorer({unvoted, pooledComment("a", 10, 10, 0)});
  EXPECT_EQ(scorer.commonGroundScore(unvoted), 0.0);
  EXPECT_EQ(scorer.differenceOfOpinionScore(unvoted), 0.0);
  EXPECT_EQ(scorer.uncertainScore(unvoted), 0.0);
  EXPECT_EQ(ids(scorer.selectDifferencesOfOpinion()), (std::vector<std::string>{"a"}));
}

TEST(PooledScorerTest, BalancedCommentRanksFirst) {
  PooledScorer scorer({pooledComment("b", 9, 11, 2), pooledComment("a", 10, 10, 0)});
  EXPECT_EQ(ids(scorer.selectDifferencesOfOpinion()), (std::vector<std::string>{"a", "b"}));
}

TEST(PooledScorerTest, UsesRawRatesByDefault) {
  PooledScorer scorer({pooledComment("a", 14, 6, 0)});
  // 14/20 = 0.7 meets the threshold only without the prior.
  EXPECT_NEAR(scorer.commonGroundScore(scorer.comments()[0]), 0.7, 1e-9);
  EXPECT_EQ(scorer.selectCommonGroundAgree().size(), 1u);
}

// ---------------------------------------------------------------------------
// Messages
// ---------------------------------------------------------------------------

TEST(PooledScorerTest, MessagesQuoteThresholds) {
  PooledScorer scorer(std::vector<Comment>{});
  std::string common = scorer.noCommonGroundMessage();
  EXPECT_NE(common.find("at least 20 votes"), std::string::npos);
  EXPECT_NE(common.find("70%"), std::string::npos);

  std::string differences = scorer.noDifferencesMessage();
  EXPECT_NE(differences.find("between 40% and 60%"), std::string::npos);
}

TEST(PooledScorerTest, Strategy) {
  PooledScorer scorer(std::vector<Comment>{});
  EXPECT_EQ(scorer.strategy(), ScoringStrategy::Pooled);
}

}  // namespace
}  // namespace deliberation
