// Group-aware consensus scoring: rewards agreement that holds in every
// opinion group simultaneously.

#ifndef DELIBERATION_STATS_GROUP_AWARE_SCORER_H
#define DELIBERATION_STATS_GROUP_AWARE_SCORER_H

#include <string>
#include <vector>

#include "stats/consensus_scorer.h"

namespace deliberation {

/// @brief Votes cast by one opinion group across a set of comments.
struct GroupStats {
  std::string name;
  uint64_t vote_count = 0;
};

/// @brief Scorer built on per-group tallies.
///
/// Every ranked comment must carry VoteInfo::Kind::ByGroup; a pooled tally
/// in filteredComments() makes the selections throw std::invalid_argument.
///
/// - Common ground: score is the product of every group's agree (or
///   disagree) rate; eligible only if the lowest group rate reaches
///   min_common_ground_prob, so one dissenting group disqualifies it.
/// - Differences of opinion: score is the largest |group - rest| agree-rate
///   gap; eligible if the lowest group agree rate is below
///   min_common_ground_prob and the gap exceeds min_agree_prob_difference.
class GroupAwareScorer : public ConsensusScorer {
 public:
  explicit GroupAwareScorer(std::vector<Comment> comments,
                            const ScorerConfig& config = defaultConfigFor(ScoringStrategy::GroupAware));

  ScoringStrategy strategy() const override { return ScoringStrategy::GroupAware; }

  /// @brief Comments that @p group agrees with more than everyone else.
  ///
  /// Ranked by the signed agree-rate gap of @p group against the rest.
  /// Eligible when the comment is not common ground (some group agree rate
  /// below min_common_ground_prob) and the gap exceeds
  /// min_agree_prob_difference. Comments without @p group are skipped.
  std::vector<Comment> selectGroupRepresentative(const std::string& group, uint32_t k) const;
  std::vector<Comment> selectGroupRepresentative(const std::string& group) const {
    return selectGroupRepresentative(group, config().max_sample_size);
  }

  /// @brief Vote totals per opinion group over all comments, ordered by name.
  ///
  /// Comments without votes are skipped. Throws std::invalid_argument for
  /// pooled vote info.
  std::vector<GroupStats> statsByGroup() const;

  /// @brief Names of every opinion group seen in the comments, sorted.
  std::vector<std::string> groupNames() const;

  std::string noCommonGroundMessage() const override;
  std::string noDifferencesMessage() const override;

 protected:
  double agreeScore(const Comment& comment) const override;
  bool isAgreeCommonGround(const Comment& comment) const override;
  double disagreeScore(const Comment& comment) const override;
  bool isDisagreeCommonGround(const Comment& comment) const override;
  double differenceScore(const Comment& comment) const override;
  bool isDifferenceOfOpinion(const Comment& comment) const override;

 private:
  /// Below min_common_ground_prob for at least one group.
  bool hasSplit(const Comment& comment) const;
};

}  // namespace deliberation

#endif  // DELIBERATION_STATS_GROUP_AWARE_SCORER_H
