// Thresholds and flags shared by both consensus scoring strategies.

#ifndef DELIBERATION_STATS_SCORER_CONFIG_H
#define DELIBERATION_STATS_SCORER_CONFIG_H

#include <cstdint>
#include <string>
#include <string_view>

#include "core/types.h"

namespace deliberation {

/// @brief Which consensus scoring strategy to use.
enum class ScoringStrategy : uint8_t {
  GroupAware,  ///< Requires per-group tallies; rewards cross-group agreement.
  Pooled       ///< Ignores groups; uses the summed tally.
};

/// @brief Convert ScoringStrategy to string ("group_aware" / "pooled").
const char* scoringStrategyToString(ScoringStrategy strategy);

/// @brief Parse a ScoringStrategy. Unrecognized input -> GroupAware.
ScoringStrategy scoringStrategyFromString(const std::string& str);

/// @brief Scorer thresholds. Use defaultConfigFor() for strategy defaults.
struct ScorerConfig {
  /// Comments with fewer total votes are excluded from every ranking.
  VoteCount min_vote_count = 20;
  /// Agree (or disagree) rate needed to count as common ground.
  double min_common_ground_prob = 0.6;
  /// Group-vs-rest agree-rate gap needed for a difference of opinion.
  double min_agree_prob_difference = 0.3;
  /// Pooled differences of opinion: agree and disagree rates both in this band.
  double min_difference_prob = 0.4;
  double max_difference_prob = 0.6;
  /// Floor of the adaptive uncertainty threshold.
  double min_uncertainty_prob = 0.2;
  /// Percentile of observed pass rates used as the uncertainty threshold.
  double uncertainty_percentile = 0.75;
  /// Pooled differences of opinion must stay this far below the uncertainty threshold.
  double uncertainty_buffer = 0.05;
  /// Default k for every selection.
  uint32_t max_sample_size = 12;
  bool include_passes = true;
  bool use_estimate = true;
  /// Print diagnostics to stderr.
  bool verbose = false;
};

/// @brief Defaults for a strategy (pooled: 0.7 threshold, raw rates without passes).
ScorerConfig defaultConfigFor(ScoringStrategy strategy);

/// @brief Check thresholds for consistency.
/// @param config Config to check.
/// @param error Optional; receives the first problem found.
/// @return True if every probability is in [0, 1], the difference band is
///         ordered and max_sample_size > 0.
bool validateConfig(const ScorerConfig& config, std::string* error = nullptr);

/// @brief Override fields from a flat JSON object keyed by field name.
///
/// Keys not present keep their current value; unknown keys are ignored.
/// The config is left untouched if the text is malformed, a value has the
/// wrong type, or the result fails validateConfig().
///
/// @param config Config to update.
/// @param json_text e.g. {"min_vote_count": 10, "use_estimate": false}.
/// @param error Optional; receives the failure reason.
/// @return True if the overrides were applied.
bool applyConfigOverrides(ScorerConfig& config, std::string_view json_text,
                          std::string* error = nullptr);

}  // namespace deliberation

#endif  // DELIBERATION_STATS_SCORER_CONFIG_H
