// Abstract consensus scorer: selects common ground, differences of opinion
// and uncertain comments from a fixed comment set.
// Concrete strategies: GroupAwareScorer, PooledScorer.

#ifndef DELIBERATION_STATS_CONSENSUS_SCORER_H
#define DELIBERATION_STATS_CONSENSUS_SCORER_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <vector>

#include "core/types.h"
#include "stats/scorer_config.h"

namespace deliberation {

/// Pass as k to select every qualifying comment.
constexpr uint32_t kAllComments = std::numeric_limits<uint32_t>::max();

/// @brief Base class for consensus scoring strategies.
///
/// A scorer owns a copy of its comments. Rankings only consider
/// filteredComments(): comments with vote info and at least
/// config().min_vote_count votes (passes included). Selections never pad:
/// a k larger than the number of qualifying comments returns all of them,
/// ordered by descending score with ties kept in input order.
///
/// Strategies implement the per-comment score and eligibility hooks; the
/// ranking itself is shared.
class ConsensusScorer {
 public:
  ConsensusScorer(std::vector<Comment> comments, const ScorerConfig& config);
  virtual ~ConsensusScorer() = default;

  ConsensusScorer(const ConsensusScorer&) = delete;
  ConsensusScorer& operator=(const ConsensusScorer&) = delete;

  /// @brief Strategy implemented by this scorer.
  virtual ScoringStrategy strategy() const = 0;

  const ScorerConfig& config() const { return config_; }

  /// @brief Every comment given at construction, in input order.
  const std::vector<Comment>& comments() const { return comments_; }

  /// @brief Comments eligible for ranking (enough votes).
  const std::vector<Comment>& filteredComments() const { return filtered_; }

  size_t commentCount() const { return comments_.size(); }

  /// @brief Total votes across all comments (passes included).
  uint64_t voteCount() const;

  /// @brief True if any comment carries a topic with subtopics.
  bool containsSubtopics() const;

  // -------------------------------------------------------------------------
  // Selections
  // -------------------------------------------------------------------------

  /// @brief Comments everyone agrees on or everyone disagrees on.
  std::vector<Comment> selectCommonGround(uint32_t k) const;
  std::vector<Comment> selectCommonGround() const {
    return selectCommonGround(config_.max_sample_size);
  }

  /// @brief Common ground restricted to broad agreement.
  std::vector<Comment> selectCommonGroundAgree(uint32_t k) const;
  std::vector<Comment> selectCommonGroundAgree() const {
    return selectCommonGroundAgree(config_.max_sample_size);
  }

  /// @brief Common ground restricted to broad disagreement.
  std::vector<Comment> selectCommonGroundDisagree(uint32_t k) const;
  std::vector<Comment> selectCommonGroundDisagree() const {
    return selectCommonGroundDisagree(config_.max_sample_size);
  }

  /// @brief Comments that split opinion without being common ground.
  std::vector<Comment> selectDifferencesOfOpinion(uint32_t k) const;
  std::vector<Comment> selectDifferencesOfOpinion() const {
    return selectDifferencesOfOpinion(config_.max_sample_size);
  }

  /// @brief Comments with a pass rate at or above uncertaintyThreshold().
  std::vector<Comment> selectUncertain(uint32_t k) const;
  std::vector<Comment> selectUncertain() const {
    return selectUncertain(config_.max_sample_size);
  }

  // -------------------------------------------------------------------------
  // Scores
  // -------------------------------------------------------------------------

  /// @brief Larger of the agree and disagree common-ground scores
  ///        (0 without vote info).
  double commonGroundScore(const Comment& comment) const;

  /// @brief How well a comment represents a difference of opinion
  ///        (0 without vote info).
  double differenceOfOpinionScore(const Comment& comment) const;

  /// @brief Pass rate of the comment (0 without vote info).
  double uncertainScore(const Comment& comment) const;

  /// @brief Pass rate a comment needs to count as uncertain.
  ///
  /// The uncertainty_percentile of the pass rates in filteredComments(),
  /// never below min_uncertainty_prob. Falls back to min_uncertainty_prob
  /// when fewer than four rates exist or they are all equal.
  double uncertaintyThreshold() const { return uncertainty_threshold_; }

  // -------------------------------------------------------------------------
  // Empty-result messages
  // -------------------------------------------------------------------------

  virtual std::string noCommonGroundMessage() const = 0;
  virtual std::string noDifferencesMessage() const = 0;
  std::string noUncertainMessage() const;

 protected:
  using ScoreFn = std::function<double(const Comment&)>;
  using FilterFn = std::function<bool(const Comment&)>;

  /// @brief Rank filteredComments() passing @p eligible by @p score.
  std::vector<Comment> topK(const ScoreFn& score, uint32_t k, const FilterFn& eligible) const;

  // Strategy hooks. Only called for comments in filteredComments().
  virtual double agreeScore(const Comment& comment) const = 0;
  virtual bool isAgreeCommonGround(const Comment& comment) const = 0;
  virtual double disagreeScore(const Comment& comment) const = 0;
  virtual bool isDisagreeCommonGround(const Comment& comment) const = 0;
  virtual double differenceScore(const Comment& comment) const = 0;
  virtual bool isDifferenceOfOpinion(const Comment& comment) const = 0;

  bool isUncertain(const Comment& comment) const;

 private:
  double computeUncertaintyThreshold() const;

  std::vector<Comment> comments_;
  std::vector<Comment> filtered_;
  ScorerConfig config_;
  double uncertainty_threshold_ = 0.0;
};

}  // namespace deliberation

#endif  // DELIBERATION_STATS_CONSENSUS_SCORER_H
