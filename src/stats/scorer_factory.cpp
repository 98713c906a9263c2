// Scorer factory.

#include "stats/scorer_factory.h"

#include <utility>

#include "stats/group_aware_scorer.h"
#include "stats/pooled_scorer.h"

namespace deliberation {

ScorerFactory makeScorerFactory(ScoringStrategy strategy, const ScorerConfig& config) {
  switch (strategy) {
    case ScoringStrategy::Pooled:
      return [config](std::vector<Comment> comments) -> std::unique_ptr<ConsensusScorer> {
        return std::make_unique<PooledScorer>(std::move(comments), config);
      };
    case ScoringStrategy::GroupAware:
      break;
  }
  return [config](std::vector<Comment> comments) -> std::unique_ptr<ConsensusScorer> {
    return std::make_unique<GroupAwareScorer>(std::move(comments), config);
  };
}

ScorerFactory makeScorerFactory(ScoringStrategy strategy) {
  return makeScorerFactory(strategy, defaultConfigFor(strategy));
}

}  // namespace deliberation
