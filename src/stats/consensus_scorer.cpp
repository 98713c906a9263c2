// Shared ranking logic for consensus scorers.

#include "stats/consensus_scorer.h"

#include <algorithm>
#include <cstdio>
#include <utility>

#include "stats/probability.h"

namespace deliberation {
namespace {

/// Below this many pass rates the percentile is not meaningful.
constexpr size_t kMinSamplesForPercentile = 4;

/// Pass-rate spread under which the distribution counts as uniform.
constexpr double kUniformSpread = 1e-9;

bool hasNestedTopic(const std::vector<Topic>& topics) {
  for (const auto& topic : topics) {
    if (!topic.isLeaf()) return true;
  }
  return false;
}

}  // namespace

ConsensusScorer::ConsensusScorer(std::vector<Comment> comments, const ScorerConfig& config)
    : comments_(std::move(comments)), config_(config) {
  for (const auto& comment : comments_) {
    if (comment.hasVotes() && commentVoteCount(comment, true) >= config_.min_vote_count) {
      filtered_.push_back(comment);
    }
  }
  uncertainty_threshold_ = computeUncertaintyThreshold();
}

uint64_t ConsensusScorer::voteCount() const {
  uint64_t total = 0;
  for (const auto& comment : comments_) {
    total += commentVoteCount(comment, true);
  }
  return total;
}

bool ConsensusScorer::containsSubtopics() const {
  for (const auto& comment : comments_) {
    if (hasNestedTopic(comment.topics)) return true;
  }
  return false;
}

// ---------------------------------------------------------------------------
// Selections
// ---------------------------------------------------------------------------

std::vector<Comment> ConsensusScorer::topK(const ScoreFn& score, uint32_t k,
                                           const FilterFn& eligible) const {
  std::vector<std::pair<double, size_t>> ranked;
  for (size_t idx = 0; idx < filtered_.size(); ++idx) {
    if (eligible(filtered_[idx])) {
      ranked.emplace_back(score(filtered_[idx]), idx);
    }
  }
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const std::pair<double, size_t>& lhs,
                      const std::pair<double, size_t>& rhs) { return lhs.first > rhs.first; });

  size_t count = std::min(ranked.size(), static_cast<size_t>(k));
  std::vector<Comment> result;
  result.reserve(count);
  for (size_t idx = 0; idx < count; ++idx) {
    result.push_back(filtered_[ranked[idx].second]);
  }
  return result;
}

std::vector<Comment> ConsensusScorer::selectCommonGround(uint32_t k) const {
  return topK([this](const Comment& comment) { return commonGroundScore(comment); }, k,
              [this](const Comment& comment) {
                return isAgreeCommonGround(comment) || isDisagreeCommonGround(comment);
              });
}

std::vector<Comment> ConsensusScorer::selectCommonGroundAgree(uint32_t k) const {
  return topK([this](const Comment& comment) { return agreeScore(comment); }, k,
              [this](const Comment& comment) { return isAgreeCommonGround(comment); });
}

std::vector<Comment> ConsensusScorer::selectCommonGroundDisagree(uint32_t k) const {
  return topK([this](const Comment& comment) { return disagreeScore(comment); }, k,
              [this](const Comment& comment) { return isDisagreeCommonGround(comment); });
}

std::vector<Comment> ConsensusScorer::selectDifferencesOfOpinion(uint32_t k) const {
  // A comment that already counts as common ground is never reported as a
  // difference of opinion.
  return topK([this](const Comment& comment) { return differenceScore(comment); }, k,
              [this](const Comment& comment) {
                return isDifferenceOfOpinion(comment) && !isAgreeCommonGround(comment) &&
                       !isDisagreeCommonGround(comment);
              });
}

std::vector<Comment> ConsensusScorer::selectUncertain(uint32_t k) const {
  return topK([this](const Comment& comment) { return uncertainScore(comment); }, k,
              [this](const Comment& comment) { return isUncertain(comment); });
}

// ---------------------------------------------------------------------------
// Scores
// ---------------------------------------------------------------------------

double ConsensusScorer::commonGroundScore(const Comment& comment) const {
  if (!comment.vote_info) return 0.0;
  return std::max(agreeScore(comment), disagreeScore(comment));
}

double ConsensusScorer::differenceOfOpinionScore(const Comment& comment) const {
  if (!comment.vote_info) return 0.0;
  return differenceScore(comment);
}

double ConsensusScorer::uncertainScore(const Comment& comment) const {
  if (!comment.vote_info) return 0.0;
  return totalPassRate(*comment.vote_info, config_.use_estimate);
}

bool ConsensusScorer::isUncertain(const Comment& comment) const {
  // Inclusive: when the top quartile shares one pass rate, the percentile
  // lands on that rate and those comments still qualify.
  return uncertainScore(comment) >= uncertainty_threshold_;
}

double ConsensusScorer::computeUncertaintyThreshold() const {
  std::vector<double> pass_rates;
  pass_rates.reserve(filtered_.size());
  for (const auto& comment : filtered_) {
    pass_rates.push_back(uncertainScore(comment));
  }

  const double floor = config_.min_uncertainty_prob;
  if (pass_rates.size() < kMinSamplesForPercentile) {
    if (config_.verbose) {
      std::fprintf(stderr, "[ConsensusScorer] %zu pass rates, using floor %.3f\n",
                   pass_rates.size(), floor);
    }
    return floor;
  }
  auto bounds = std::minmax_element(pass_rates.begin(), pass_rates.end());
  if (*bounds.second - *bounds.first < kUniformSpread) {
    if (config_.verbose) {
      std::fprintf(stderr, "[ConsensusScorer] uniform pass rates, using floor %.3f\n", floor);
    }
    return floor;
  }

  double threshold = std::max(percentile(pass_rates, config_.uncertainty_percentile), floor);
  if (config_.verbose) {
    std::fprintf(stderr,
                 "[ConsensusScorer] %zu/%zu comments ranked, uncertainty threshold %.3f\n",
                 filtered_.size(), comments_.size(), threshold);
  }
  return threshold;
}

// ---------------------------------------------------------------------------
// Messages
// ---------------------------------------------------------------------------

std::string ConsensusScorer::noUncertainMessage() const {
  return "No statements met the thresholds necessary to be considered as uncertain "
         "(at least " + std::to_string(config_.min_vote_count) + " votes, and at least " +
         decimalToPercent(uncertainty_threshold_) + " pass rate).";
}

}  // namespace deliberation
