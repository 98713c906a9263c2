// Vote-rate estimation and distribution helpers.
//
// Rates use an optional additive (MAP) prior: (n + 1) / (d + 2). The prior
// removes divide-by-zero and pulls sparse tallies toward 0.5.

#ifndef DELIBERATION_STATS_PROBABILITY_H
#define DELIBERATION_STATS_PROBABILITY_H

#include <string>
#include <vector>

#include "core/types.h"

namespace deliberation {

// ---------------------------------------------------------------------------
// Single tally
// ---------------------------------------------------------------------------

/// @brief Agree rate of one tally.
/// @param tally Votes.
/// @param include_passes Whether passes count toward the denominator.
/// @param use_estimate Apply the +1/+2 prior. Without it an empty
///        denominator yields 0.
double agreeRate(const VoteTally& tally, bool include_passes, bool use_estimate = true);

/// @brief Disagree rate of one tally. Same conventions as agreeRate().
double disagreeRate(const VoteTally& tally, bool include_passes, bool use_estimate = true);

/// @brief Pass rate of one tally; the denominator always includes passes.
double passRate(const VoteTally& tally, bool use_estimate = true);

// ---------------------------------------------------------------------------
// Whole comment (pooled aggregate)
// ---------------------------------------------------------------------------

/// @brief Agree rate over all votes on a comment.
///
/// Pooled info delegates to agreeRate(). Group info sums numerators and
/// denominators across every group first and applies the prior once.
double totalAgreeRate(const VoteInfo& info, bool include_passes, bool use_estimate = true);

/// @brief Disagree rate over all votes. See totalAgreeRate().
double totalDisagreeRate(const VoteInfo& info, bool include_passes, bool use_estimate = true);

/// @brief Pass rate over all votes. See totalAgreeRate().
double totalPassRate(const VoteInfo& info, bool use_estimate = true);

// ---------------------------------------------------------------------------
// Group comparisons (require VoteInfo::Kind::ByGroup)
// ---------------------------------------------------------------------------
//
// Every function below throws std::invalid_argument when given pooled vote
// info. Per-group rates always include passes in the denominator.

/// @brief Product of every group's agree rate (group-informed consensus).
double groupInformedConsensus(const VoteInfo& info, bool use_estimate = true);

/// @brief Product of every group's disagree rate.
double groupInformedDisagreeConsensus(const VoteInfo& info, bool use_estimate = true);

/// @brief Lowest agree rate of any group.
double minAgreeProb(const VoteInfo& info, bool use_estimate = true);

/// @brief Lowest disagree rate of any group.
double minDisagreeProb(const VoteInfo& info, bool use_estimate = true);

/// @brief Agree rate of @p group minus the agree rate of all other groups combined.
///
/// The complement tally is the component-wise sum of every other group's
/// tally. Throws std::invalid_argument if @p group is absent.
double groupAgreeProbDifference(const VoteInfo& info, const std::string& group,
                                bool use_estimate = true);

/// @brief Largest |groupAgreeProbDifference| over all groups.
double maxGroupAgreeProbDifference(const VoteInfo& info, bool use_estimate = true);

// ---------------------------------------------------------------------------
// Distribution helpers
// ---------------------------------------------------------------------------

/// @brief Arithmetic mean; 0 for an empty list.
double mean(const std::vector<double>& values);

/// @brief Sample standard deviation (n - 1 denominator); 0 when n <= 1.
double sampleStandardDeviation(const std::vector<double>& values);

/// @brief Percentile by linear interpolation between closest ranks.
/// @param values Unsorted samples.
/// @param fraction Position in [0, 1] (0.75 = 75th percentile).
/// @return Interpolated value at fraction * (n - 1) of the ascending sort;
///         0 for an empty list.
double percentile(std::vector<double> values, double fraction);

}  // namespace deliberation

#endif  // DELIBERATION_STATS_PROBABILITY_H
