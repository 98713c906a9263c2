// Pooled consensus scoring.

#include "stats/pooled_scorer.h"

#include <cmath>
#include <utility>

#include "stats/probability.h"

namespace deliberation {

PooledScorer::PooledScorer(std::vector<Comment> comments, const ScorerConfig& config)
    : ConsensusScorer(std::move(comments), config) {}

// Ranked comments always carry vote info (see filteredComments()).

double PooledScorer::agreeScore(const Comment& comment) const {
  return totalAgreeRate(*comment.vote_info, config().include_passes, config().use_estimate);
}

bool PooledScorer::isAgreeCommonGround(const Comment& comment) const {
  return agreeScore(comment) >= config().min_common_ground_prob;
}

double PooledScorer::disagreeScore(const Comment& comment) const {
  return totalDisagreeRate(*comment.vote_info, config().include_passes, config().use_estimate);
}

bool PooledScorer::isDisagreeCommonGround(const Comment& comment) const {
  return disagreeScore(comment) >= config().min_common_ground_prob;
}

double PooledScorer::differenceScore(const Comment& comment) const {
  return 1.0 - std::fabs(agreeScore(comment) - disagreeScore(comment)) - uncertainScore(comment);
}

bool PooledScorer::inDifferenceBand(double rate) const {
  return rate >= config().min_difference_prob && rate <= config().max_difference_prob;
}

bool PooledScorer::isDifferenceOfOpinion(const Comment& comment) const {
  return inDifferenceBand(agreeScore(comment)) && inDifferenceBand(disagreeScore(comment)) &&
         uncertainScore(comment) < uncertaintyThreshold() - config().uncertainty_buffer;
}

// ---------------------------------------------------------------------------
// Messages
// ---------------------------------------------------------------------------

std::string PooledScorer::noCommonGroundMessage() const {
  return "No statements met the thresholds necessary to be considered as a point of common "
         "ground (at least " + std::to_string(config().min_vote_count) +
         " votes, and at least " + decimalToPercent(config().min_common_ground_prob) +
         " agreement).";
}

std::string PooledScorer::noDifferencesMessage() const {
  return "No statements met the thresholds necessary to be considered as a significant "
         "difference of opinion (at least " + std::to_string(config().min_vote_count) +
         " votes, and both an agreement rate and disagree rate between " +
         decimalToPercent(config().min_difference_prob) + " and " +
         decimalToPercent(config().max_difference_prob) + ").";
}

}  // namespace deliberation
