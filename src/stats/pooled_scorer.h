// Pooled consensus scoring: ignores opinion groups and ranks on the summed
// tally of each comment.

#ifndef DELIBERATION_STATS_POOLED_SCORER_H
#define DELIBERATION_STATS_POOLED_SCORER_H

#include <string>
#include <vector>

#include "stats/consensus_scorer.h"

namespace deliberation {

/// @brief Scorer that treats all participants as one population.
///
/// Accepts pooled or per-group vote info; group tallies are summed before
/// the rate is taken.
///
/// - Common ground: total agree (or disagree) rate of at least
///   min_common_ground_prob.
/// - Differences of opinion: agree and disagree rates both within
///   [min_difference_prob, max_difference_prob] and a pass rate below
///   uncertaintyThreshold() - uncertainty_buffer. Scored by
///   1 - |agree - disagree| - pass, which peaks for an even, engaged split.
class PooledScorer : public ConsensusScorer {
 public:
  explicit PooledScorer(std::vector<Comment> comments,
                        const ScorerConfig& config = defaultConfigFor(ScoringStrategy::Pooled));

  ScoringStrategy strategy() const override { return ScoringStrategy::Pooled; }

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
  bool inDifferenceBand(double rate) const;
};

}  // namespace deliberation

#endif  // DELIBERATION_STATS_POOLED_SCORER_H
