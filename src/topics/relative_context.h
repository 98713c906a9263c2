// Relative context: places a topic's engagement and alignment against its
// siblings using mean and standard deviation bands.

#ifndef DELIBERATION_TOPICS_RELATIVE_CONTEXT_H
#define DELIBERATION_TOPICS_RELATIVE_CONTEXT_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "topics/topic_aggregator.h"

namespace deliberation {

/// @brief Position of a value relative to the mean and one standard deviation.
enum class RelativeLevel : uint8_t {
  Low,             ///< Below mean - stddev.
  ModeratelyLow,   ///< Below mean.
  ModeratelyHigh,  ///< Below mean + stddev.
  High             ///< At or above mean + stddev.
};

/// @brief Convert RelativeLevel to its label ("low", "moderately low", ...).
const char* relativeLevelToString(RelativeLevel level);

/// @brief Classify @p value against @p average and @p std_deviation.
RelativeLevel classifyRelative(double value, double average, double std_deviation);

/// @brief Engagement and alignment statistics over a set of topic nodes.
///
/// Alignment of a node is the share of its comments that are common ground
/// (agree or disagree, no sample limit). Engagement weighs comment count and
/// vote count equally: each is divided by the largest value in the context,
/// so a node of the context scores in [0, 2].
///
/// Selections run on each node's scorer, so building a context over
/// group-aware scorers with pooled data throws std::invalid_argument.
class RelativeContext {
 public:
  /// @brief Context over @p siblings (typically the subtopics of one topic).
  explicit RelativeContext(const std::vector<TopicStats>& siblings);

  /// @brief Context over every subtopic of every topic in @p topics.
  static RelativeContext fromTopics(const std::vector<TopicStats>& topics);

  /// @brief Share of @p node's comments that are agree or disagree common ground.
  static double alignmentRate(const TopicStats& node);

  /// @brief Normalized comment count plus normalized vote count of @p node.
  double engagement(const TopicStats& node) const;

  RelativeLevel engagementLevel(const TopicStats& node) const;
  RelativeLevel alignmentLevel(const TopicStats& node) const;

  /// @brief "low engagement", "moderately low engagement", ...
  std::string relativeEngagement(const TopicStats& node) const;

  /// @brief "low alignment", "moderately low alignment", ...
  std::string relativeAlignment(const TopicStats& node) const;

  size_t nodeCount() const { return node_count_; }
  size_t maxCommentCount() const { return max_comment_count_; }
  uint64_t maxVoteCount() const { return max_vote_count_; }
  double averageAlignment() const { return average_alignment_; }
  double alignmentStdDeviation() const { return alignment_std_deviation_; }
  double averageEngagement() const { return average_engagement_; }
  double engagementStdDeviation() const { return engagement_std_deviation_; }

 private:
  explicit RelativeContext(const std::vector<const TopicStats*>& nodes);

  size_t node_count_ = 0;
  size_t max_comment_count_ = 0;
  uint64_t max_vote_count_ = 0;
  double average_alignment_ = 0.0;
  double alignment_std_deviation_ = 0.0;
  double average_engagement_ = 0.0;
  double engagement_std_deviation_ = 0.0;
};

}  // namespace deliberation

#endif  // DELIBERATION_TOPICS_RELATIVE_CONTEXT_H
