// Topic aggregation: partitions comments into a topic/subtopic tree and
// scores every node with its own consensus scorer.

#ifndef DELIBERATION_TOPICS_TOPIC_AGGREGATOR_H
#define DELIBERATION_TOPICS_TOPIC_AGGREGATOR_H

#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "core/types.h"
#include "stats/consensus_scorer.h"
#include "stats/scorer_factory.h"

namespace deliberation {

// ---------------------------------------------------------------------------
// Grouping
// ---------------------------------------------------------------------------

/// @brief Comments labelled with one topic name at one level of the tree.
struct TopicGroup {
  std::string name;
  /// Indices into the input comment list of comments labelled with this
  /// topic and nothing below it, first-seen order, one entry per comment id.
  std::vector<size_t> direct;
  std::set<std::string> direct_ids;
  /// Subtopic groups in first-seen order.
  std::vector<TopicGroup> children;

  /// @brief Child named @p child_name, created on first use.
  TopicGroup& child(const std::string& child_name);

  /// @brief Child named @p child_name, or nullptr.
  const TopicGroup* findChild(const std::string& child_name) const;

  /// @brief Add a comment directly to this group (ignored if its id is present).
  void addDirect(size_t index, const std::string& comment_id);

  /// @brief Indices of the comments under this node, ascending, one per id.
  ///
  /// With subtopics: the union of the subtopics' members. Without: the
  /// directly labelled comments.
  std::vector<size_t> members(const std::vector<Comment>& comments) const;
};

/// @brief Build the topic tree of @p comments.
///
/// Comments without topics are skipped (reported on stderr when
/// @p verbose). Top-level groups are in first-seen order.
std::vector<TopicGroup> groupCommentsByTopic(const std::vector<Comment>& comments,
                                             bool verbose = false);

// ---------------------------------------------------------------------------
// Topic statistics
// ---------------------------------------------------------------------------

/// @brief Statistics for one topic (or subtopic) node.
struct TopicStats {
  std::string name;
  size_t comment_count = 0;
  std::vector<TopicStats> subtopic_stats;  ///< Empty for a leaf.
  /// Scorer scoped to exactly the comments under this node.
  std::unique_ptr<ConsensusScorer> scorer;

  bool hasSubtopics() const { return !subtopic_stats.empty(); }
};

/// @brief Build sorted topic statistics for @p comments.
///
/// Every node gets a fresh scorer from @p factory scoped to its comments; a
/// topic's comment set is the deduplicated union of its subtopics'. Each
/// sibling list is sorted with sortTopicStats().
///
/// @param comments All comments of the conversation.
/// @param factory Scorer factory resolved once for the conversation.
/// @param verbose Report skipped comments and node sizes on stderr.
std::vector<TopicStats> buildTopicStats(const std::vector<Comment>& comments,
                                        const ScorerFactory& factory, bool verbose = false);

/// @brief Sort by descending comment_count with "Other" always last,
///        recursively for every subtopic list. Ties keep their order.
void sortTopicStats(std::vector<TopicStats>& stats);

/// @brief Find a direct child by name.
/// @return Matching node, or nullptr.
const TopicStats* findTopic(const std::vector<TopicStats>& stats, const std::string& name);

}  // namespace deliberation

#endif  // DELIBERATION_TOPICS_TOPIC_AGGREGATOR_H
