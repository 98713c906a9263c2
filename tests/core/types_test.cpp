// Tests for core/types.h -- vote tallies, VoteInfo, comment helpers.

#include "core/types.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

namespace deliberation {
namespace {

// ---------------------------------------------------------------------------
// VoteTally
// ---------------------------------------------------------------------------

TEST(VoteTallyTest, TotalCountWithAndWithoutPasses) {
  VoteTally tally{10, 4, 3};
  EXPECT_EQ(tally.totalCount(true), 17u);
  EXPECT_EQ(tally.totalCount(false), 14u);
}

TEST(VoteTallyTest, DefaultIsEmpty) {
  VoteTally tally;
  EXPECT_EQ(tally.totalCount(true), 0u);
}

TEST(VoteTallyTest, AdditionIsComponentWise) {
  VoteTally sum = VoteTally{1, 2, 3} + VoteTally{10, 20, 30};
  EXPECT_EQ(sum, (VoteTally{11, 22, 33}));
}

// ---------------------------------------------------------------------------
// VoteInfo
// ---------------------------------------------------------------------------

TEST(VoteInfoTest, PooledExposesTally) {
  VoteInfo info = VoteInfo::pooled({5, 2, 1});
  EXPECT_TRUE(info.isPooled());
  EXPECT_FALSE(info.isByGroup());
  EXPECT_EQ(info.tally(), (VoteTally{5, 2, 1}));
  EXPECT_EQ(info.combined(), (VoteTally{5, 2, 1}));
}

TEST(VoteInfoTest, PooledRejectsGroupAccess) {
  VoteInfo info = VoteInfo::pooled({5, 2, 1});
  EXPECT_THROW(info.groups(), std::invalid_argument);
}

TEST(VoteInfoTest, ByGroupExposesGroups) {
  VoteInfo info = VoteInfo::byGroup({{"0", {3, 1, 0}}, {"1", {2, 4, 1}}});
  EXPECT_TRUE(info.isByGroup());
  ASSERT_EQ(info.groups().size(), 2u);
  EXPECT_EQ(info.groups().at("1"), (VoteTally{2, 4, 1}));
  EXPECT_THROW(info.tally(), std::invalid_argument);
}

TEST(VoteInfoTest, CombinedSumsGroups) {
  VoteInfo info = VoteInfo::byGroup({{"a", {3, 1, 0}}, {"b", {2, 4, 1}}, {"c", {0, 0, 5}}});
  EXPECT_EQ(info.combined(), (VoteTally{5, 5, 6}));
}

TEST(VoteInfoTest, EqualityRequiresSameKind) {
  VoteInfo pooled = VoteInfo::pooled({3, 1, 0});
  VoteInfo grouped = VoteInfo::byGroup({{"0", {3, 1, 0}}});
  EXPECT_FALSE(pooled == grouped);
  EXPECT_TRUE(pooled == VoteInfo::pooled({3, 1, 0}));
}

TEST(VoteInfoTest, KindToString) {
  EXPECT_STREQ(voteInfoKindToString(VoteInfo::Kind::Pooled), "pooled");
  EXPECT_STREQ(voteInfoKindToString(VoteInfo::Kind::ByGroup), "by_group");
}

// ---------------------------------------------------------------------------
// Comment helpers
// ---------------------------------------------------------------------------

TEST(CommentTest, VoteCountWithoutVotesIsZero) {
  Comment comment{"1", "text", std::nullopt, {}};
  EXPECT_FALSE(comment.hasVotes());
  EXPECT_EQ(commentVoteCount(comment, true), 0u);
  EXPECT_FALSE(hasGroupVotes(comment));
}

TEST(CommentTest, VoteCountSumsGroups) {
  Comment comment{"1", "text", VoteInfo::byGroup({{"0", {3, 1, 2}}, {"1", {4, 0, 1}}}), {}};
  EXPECT_EQ(commentVoteCount(comment, true), 11u);
  EXPECT_EQ(commentVoteCount(comment, false), 8u);
  EXPECT_TRUE(hasGroupVotes(comment));
}

TEST(CommentTest, TopicLeafDetection) {
  Topic leaf{"Taxes", {}};
  Topic parent{"Economy", {leaf}};
  EXPECT_TRUE(leaf.isLeaf());
  EXPECT_FALSE(parent.isLeaf());
}

// ---------------------------------------------------------------------------
// decimalToPercent
// ---------------------------------------------------------------------------

TEST(DecimalToPercentTest, WholePercent) {
  EXPECT_EQ(decimalToPercent(0.6), "60%");
  EXPECT_EQ(decimalToPercent(0.7), "70%");
  EXPECT_EQ(decimalToPercent(1.0), "100%");
  EXPECT_EQ(decimalToPercent(0.0), "0%");
}

TEST(DecimalToPercentTest, RoundsHalfUp) {
  EXPECT_EQ(decimalToPercent(0.125), "13%");
  EXPECT_EQ(decimalToPercent(0.954), "95%");
}

TEST(DecimalToPercentTest, PrecisionDropsTrailingZeros) {
  EXPECT_EQ(decimalToPercent(0.125, 1), "12.5%");
  EXPECT_EQ(decimalToPercent(0.5, 2), "50%");
}

}  // namespace
}  // namespace deliberation
