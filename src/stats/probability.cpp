// Vote-rate estimation and distribution helpers.

#include "stats/probability.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace deliberation {
namespace {

/// @brief n / d with the optional +1/+2 prior; 0 for an empty raw denominator.
double smoothedRatio(VoteCount numerator, VoteCount denominator, bool use_estimate) {
  if (use_estimate) {
    return (static_cast<double>(numerator) + 1.0) / (static_cast<double>(denominator) + 2.0);
  }
  if (denominator == 0) return 0.0;
  return static_cast<double>(numerator) / static_cast<double>(denominator);
}

/// @brief Group tallies of @p info, or a descriptive type error.
const GroupVoteTallies& requireGroups(const VoteInfo& info, const char* operation) {
  if (!info.isByGroup()) {
    throw std::invalid_argument(std::string("Group information is required for calculating ") +
                                operation + ".");
  }
  return info.groups();
}

}  // namespace

// ---------------------------------------------------------------------------
// Single tally
// ---------------------------------------------------------------------------

double agreeRate(const VoteTally& tally, bool include_passes, bool use_estimate) {
  return smoothedRatio(tally.agree_count, tally.totalCount(include_passes), use_estimate);
}

double disagreeRate(const VoteTally& tally, bool include_passes, bool use_estimate) {
  return smoothedRatio(tally.disagree_count, tally.totalCount(include_passes), use_estimate);
}

double passRate(const VoteTally& tally, bool use_estimate) {
  return smoothedRatio(tally.pass_count, tally.totalCount(true), use_estimate);
}

// ---------------------------------------------------------------------------
// Whole comment
// ---------------------------------------------------------------------------

// VoteInfo::combined() adds the group tallies component-wise, which is the
// "sum numerators and denominators, smooth once" aggregate.

double totalAgreeRate(const VoteInfo& info, bool include_passes, bool use_estimate) {
  return agreeRate(info.combined(), include_passes, use_estimate);
}

double totalDisagreeRate(const VoteInfo& info, bool include_passes, bool use_estimate) {
  return disagreeRate(info.combined(), include_passes, use_estimate);
}

double totalPassRate(const VoteInfo& info, bool use_estimate) {
  return passRate(info.combined(), use_estimate);
}

// ---------------------------------------------------------------------------
// Group comparisons
// ---------------------------------------------------------------------------

double groupInformedConsensus(const VoteInfo& info, bool use_estimate) {
  double product = 1.0;
  for (const auto& entry : requireGroups(info, "group informed consensus")) {
    product *= agreeRate(entry.second, true, use_estimate);
  }
  return product;
}

double groupInformedDisagreeConsensus(const VoteInfo& info, bool use_estimate) {
  double product = 1.0;
  for (const auto& entry : requireGroups(info, "group informed disagree consensus")) {
    product *= disagreeRate(entry.second, true, use_estimate);
  }
  return product;
}

double minAgreeProb(const VoteInfo& info, bool use_estimate) {
  const auto& groups = requireGroups(info, "minimum agree probability");
  double lowest = 1.0;
  for (const auto& entry : groups) {
    lowest = std::min(lowest, agreeRate(entry.second, true, use_estimate));
  }
  return lowest;
}

double minDisagreeProb(const VoteInfo& info, bool use_estimate) {
  const auto& groups = requireGroups(info, "minimum disagree probability");
  double lowest = 1.0;
  for (const auto& entry : groups) {
    lowest = std::min(lowest, disagreeRate(entry.second, true, use_estimate));
  }
  return lowest;
}

double groupAgreeProbDifference(const VoteInfo& info, const std::string& group,
                                bool use_estimate) {
  const auto& groups = requireGroups(info, "group agreement probability difference");
  auto found = groups.find(group);
  if (found == groups.end()) {
    throw std::invalid_argument("Unknown opinion group '" + group + "'.");
  }

  VoteTally others;
  for (const auto& entry : groups) {
    if (entry.first != group) others = others + entry.second;
  }
  return agreeRate(found->second, true, use_estimate) - agreeRate(others, true, use_estimate);
}

double maxGroupAgreeProbDifference(const VoteInfo& info, bool use_estimate) {
  const auto& groups = requireGroups(info, "maximum group agreement probability difference");
  double largest = 0.0;
  for (const auto& entry : groups) {
    largest = std::max(largest,
                       std::fabs(groupAgreeProbDifference(info, entry.first, use_estimate)));
  }
  return largest;
}

// ---------------------------------------------------------------------------
// Distribution helpers
// ---------------------------------------------------------------------------

double mean(const std::vector<double>& values) {
  if (values.empty()) return 0.0;
  double sum = 0.0;
  for (double val : values) sum += val;
  return sum / static_cast<double>(values.size());
}

double sampleStandardDeviation(const std::vector<double>& values) {
  if (values.size() <= 1) return 0.0;
  double avg = mean(values);
  double squares = 0.0;
  for (double val : values) squares += (val - avg) * (val - avg);
  return std::sqrt(squares / static_cast<double>(values.size() - 1));
}

double percentile(std::vector<double> values, double fraction) {
  if (values.empty()) return 0.0;
  std::sort(values.begin(), values.end());
  fraction = std::clamp(fraction, 0.0, 1.0);

  double rank = fraction * static_cast<double>(values.size() - 1);
  size_t lower = static_cast<size_t>(std::floor(rank));
  size_t upper = std::min(lower + 1, values.size() - 1);
  double weight = rank - static_cast<double>(lower);
  return values[lower] + (values[upper] - values[lower]) * weight;
}

}  // namespace deliberation
