// Group-aware consensus scoring.

#include "stats/group_aware_scorer.h"

#include <map>
#include <set>
#include <stdexcept>
#include <utility>

#include "stats/probability.h"

namespace deliberation {
namespace {

/// @brief Vote info of a ranked comment, which always has votes.
const VoteInfo& votesOf(const Comment& comment) {
  if (!comment.vote_info) {
    throw std::invalid_argument("Comment " + comment.id + " has no vote information.");
  }
  return *comment.vote_info;
}

}  // namespace

GroupAwareScorer::GroupAwareScorer(std::vector<Comment> comments, const ScorerConfig& config)
    : ConsensusScorer(std::move(comments), config) {}

// ---------------------------------------------------------------------------
// Common ground
// ---------------------------------------------------------------------------

double GroupAwareScorer::agreeScore(const Comment& comment) const {
  return groupInformedConsensus(votesOf(comment), config().use_estimate);
}

bool GroupAwareScorer::isAgreeCommonGround(const Comment& comment) const {
  return minAgreeProb(votesOf(comment), config().use_estimate) >= config().min_common_ground_prob;
}

double GroupAwareScorer::disagreeScore(const Comment& comment) const {
  return groupInformedDisagreeConsensus(votesOf(comment), config().use_estimate);
}

bool GroupAwareScorer::isDisagreeCommonGround(const Comment& comment) const {
  return minDisagreeProb(votesOf(comment), config().use_estimate) >=
         config().min_common_ground_prob;
}

// ---------------------------------------------------------------------------
// Differences of opinion
// ---------------------------------------------------------------------------

bool GroupAwareScorer::hasSplit(const Comment& comment) const {
  return minAgreeProb(votesOf(comment), config().use_estimate) < config().min_common_ground_prob;
}

double GroupAwareScorer::differenceScore(const Comment& comment) const {
  return maxGroupAgreeProbDifference(votesOf(comment), config().use_estimate);
}

bool GroupAwareScorer::isDifferenceOfOpinion(const Comment& comment) const {
  return hasSplit(comment) && differenceScore(comment) > config().min_agree_prob_difference;
}

std::vector<Comment> GroupAwareScorer::selectGroupRepresentative(const std::string& group,
                                                                 uint32_t k) const {
  auto difference = [this, &group](const Comment& comment) {
    return groupAgreeProbDifference(votesOf(comment), group, config().use_estimate);
  };
  return topK(difference, k, [this, &group, &difference](const Comment& comment) {
    const auto& groups = votesOf(comment).groups();
    if (groups.find(group) == groups.end()) return false;
    return hasSplit(comment) && difference(comment) > config().min_agree_prob_difference;
  });
}

// ---------------------------------------------------------------------------
// Group totals
// ---------------------------------------------------------------------------

std::vector<GroupStats> GroupAwareScorer::statsByGroup() const {
  std::map<std::string, uint64_t> totals;
  for (const auto& comment : comments()) {
    if (!comment.vote_info) continue;
    for (const auto& entry : comment.vote_info->groups()) {
      totals[entry.first] += entry.second.totalCount(true);
    }
  }

  std::vector<GroupStats> result;
  result.reserve(totals.size());
  for (const auto& entry : totals) {
    result.push_back({entry.first, entry.second});
  }
  return result;
}

std::vector<std::string> GroupAwareScorer::groupNames() const {
  std::set<std::string> names;
  for (const auto& comment : comments()) {
    if (!hasGroupVotes(comment)) continue;
    for (const auto& entry : comment.vote_info->groups()) {
      names.insert(entry.first);
    }
  }
  return {names.begin(), names.end()};
}

// ---------------------------------------------------------------------------
// Messages
// ---------------------------------------------------------------------------

std::string GroupAwareScorer::noCommonGroundMessage() const {
  return "No statements met the thresholds necessary to be considered as a point of common "
         "ground (at least " + std::to_string(config().min_vote_count) +
         " votes, and at least " + decimalToPercent(config().min_common_ground_prob) +
         " agreement across groups).";
}

std::string GroupAwareScorer::noDifferencesMessage() const {
  return "No statements met the thresholds necessary to be considered as a significant "
         "difference of opinion (at least " + std::to_string(config().min_vote_count) +
         " votes, and more than " + decimalToPercent(config().min_agree_prob_difference) +
         " difference in agreement rate between groups).";
}

}  // namespace deliberation
