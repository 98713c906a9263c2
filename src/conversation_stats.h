// Conversation statistics: scores a whole conversation and its topic tree
// with one strategy and collects the selections into a single result.

#ifndef DELIBERATION_CONVERSATION_STATS_H
#define DELIBERATION_CONVERSATION_STATS_H

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "core/types.h"
#include "stats/consensus_scorer.h"
#include "stats/group_aware_scorer.h"
#include "stats/scorer_config.h"
#include "topics/topic_aggregator.h"

namespace deliberation {

/// @brief Configuration for computeConversationStats().
struct ConversationStatsConfig {
  ScoringStrategy strategy = ScoringStrategy::GroupAware;
  ScorerConfig scorer = defaultConfigFor(ScoringStrategy::GroupAware);
  bool verbose = false;  ///< Diagnostics on stderr (also enables scorer logging).
};

/// @brief Config for @p strategy with that strategy's default thresholds.
ConversationStatsConfig makeConversationStatsConfig(ScoringStrategy strategy);

/// @brief Relative-context labels of one subtopic among its siblings.
struct SubtopicContext {
  std::vector<std::string> path;  ///< Topic names from the top level down.
  std::string engagement;         ///< e.g. "moderately high engagement".
  std::string alignment;          ///< e.g. "low alignment".
};

/// @brief Result of computeConversationStats().
struct ConversationStatsResult {
  bool success = false;
  std::string error_message;
  ScoringStrategy strategy = ScoringStrategy::GroupAware;

  std::unique_ptr<ConsensusScorer> scorer;  ///< Scorer over every comment.
  std::vector<TopicStats> topic_stats;      ///< Sorted topic tree.
  std::vector<SubtopicContext> subtopic_context;

  std::vector<Comment> common_ground;
  std::vector<Comment> differences_of_opinion;
  std::vector<Comment> uncertain;

  // Group-aware strategy only.
  std::vector<GroupStats> group_stats;
  std::map<std::string, std::vector<Comment>> group_representatives;

  /// Explanations for every selection that came back empty.
  std::vector<std::string> messages;

  /// @brief Labels for the subtopic at @p path, or nullptr.
  const SubtopicContext* findContext(const std::vector<std::string>& path) const;

  /// @brief Short human-readable summary.
  std::string toTextSummary() const;
};

/// @brief Score a conversation and its topic tree.
///
/// The scorer factory is resolved once from config.strategy and
/// config.scorer and used for the root and every topic node. Shape errors
/// (pooled votes under the group-aware strategy) and invalid thresholds are
/// reported through success/error_message.
///
/// @param comments Every comment of the conversation.
/// @param config Strategy, thresholds and verbosity.
/// @return Selections, topic statistics and messages.
ConversationStatsResult computeConversationStats(const std::vector<Comment>& comments,
                                                 const ConversationStatsConfig& config);

/// @brief Build a JSON report of @p result (selections by comment id, topic
///        tree with counts and context labels, group statistics).
std::string buildStatsJson(const ConversationStatsResult& result);

}  // namespace deliberation

#endif  // DELIBERATION_CONVERSATION_STATS_H
