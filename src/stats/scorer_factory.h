// Builds consensus scorers for a chosen strategy.

#ifndef DELIBERATION_STATS_SCORER_FACTORY_H
#define DELIBERATION_STATS_SCORER_FACTORY_H

#include <functional>
#include <memory>
#include <vector>

#include "core/types.h"
#include "stats/consensus_scorer.h"
#include "stats/scorer_config.h"

namespace deliberation {

/// @brief Creates a scorer scoped to exactly the given comments.
using ScorerFactory = std::function<std::unique_ptr<ConsensusScorer>(std::vector<Comment>)>;

/// @brief Factory producing scorers of @p strategy with a fixed @p config.
///
/// Resolve once for the whole conversation and pass it down, so every topic
/// node is scored the same way as the root.
ScorerFactory makeScorerFactory(ScoringStrategy strategy, const ScorerConfig& config);

/// @brief Factory using defaultConfigFor(@p strategy).
ScorerFactory makeScorerFactory(ScoringStrategy strategy);

}  // namespace deliberation

#endif  // DELIBERATION_STATS_SCORER_FACTORY_H
