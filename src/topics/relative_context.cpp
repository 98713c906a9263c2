// Relative context.

#include "topics/relative_context.h"

#include <algorithm>

#include "stats/probability.h"

namespace deliberation {

const char* relativeLevelToString(RelativeLevel level) {
  switch (level) {
    case RelativeLevel::Low:            return "low";
    case RelativeLevel::ModeratelyLow:  return "moderately low";
    case RelativeLevel::ModeratelyHigh: return "moderately high";
    case RelativeLevel::High:           return "high";
  }
  return "unknown";
}

RelativeLevel classifyRelative(double value, double average, double std_deviation) {
  if (value < average - std_deviation) return RelativeLevel::Low;
  if (value < average) return RelativeLevel::ModeratelyLow;
  if (value < average + std_deviation) return RelativeLevel::ModeratelyHigh;
  return RelativeLevel::High;
}

namespace {

uint64_t nodeVoteCount(const TopicStats& node) {
  return node.scorer ? node.scorer->voteCount() : 0;
}

std::vector<const TopicStats*> pointersTo(const std::vector<TopicStats>& stats) {
  std::vector<const TopicStats*> result;
  result.reserve(stats.size());
  for (const auto& node : stats) result.push_back(&node);
  return result;
}

}  // namespace

RelativeContext::RelativeContext(const std::vector<TopicStats>& siblings)
    : RelativeContext(pointersTo(siblings)) {}

RelativeContext RelativeContext::fromTopics(const std::vector<TopicStats>& topics) {
  std::vector<const TopicStats*> nodes;
  for (const auto& topic : topics) {
    for (const auto& sub : topic.subtopic_stats) nodes.push_back(&sub);
  }
  return RelativeContext(nodes);
}

RelativeContext::RelativeContext(const std::vector<const TopicStats*>& nodes)
    : node_count_(nodes.size()) {
  for (const TopicStats* node : nodes) {
    max_comment_count_ = std::max(max_comment_count_, node->comment_count);
    max_vote_count_ = std::max(max_vote_count_, nodeVoteCount(*node));
  }

  std::vector<double> alignments;
  std::vector<double> engagements;
  alignments.reserve(nodes.size());
  engagements.reserve(nodes.size());
  for (const TopicStats* node : nodes) {
    alignments.push_back(alignmentRate(*node));
    engagements.push_back(engagement(*node));
  }

  average_alignment_ = mean(alignments);
  alignment_std_deviation_ = sampleStandardDeviation(alignments);
  average_engagement_ = mean(engagements);
  engagement_std_deviation_ = sampleStandardDeviation(engagements);
}

double RelativeContext::alignmentRate(const TopicStats& node) {
  if (node.comment_count == 0 || !node.scorer) return 0.0;
  size_t common = node.scorer->selectCommonGroundAgree(kAllComments).size() +
                  node.scorer->selectCommonGroundDisagree(kAllComments).size();
  return static_cast<double>(common) / static_cast<double>(node.comment_count);
}

double RelativeContext::engagement(const TopicStats& node) const {
  double result = 0.0;
  if (max_comment_count_ > 0) {
    result += static_cast<double>(node.comment_count) / static_cast<double>(max_comment_count_);
  }
  if (max_vote_count_ > 0) {
    result += static_cast<double>(nodeVoteCount(node)) / static_cast<double>(max_vote_count_);
  }
  return result;
}

RelativeLevel RelativeContext::engagementLevel(const TopicStats& node) const {
  return classifyRelative(engagement(node), average_engagement_, engagement_std_deviation_);
}

RelativeLevel RelativeContext::alignmentLevel(const TopicStats& node) const {
  return classifyRelative(alignmentRate(node), average_alignment_, alignment_std_deviation_);
}

std::string RelativeContext::relativeEngagement(const TopicStats& node) const {
  return std::string(relativeLevelToString(engagementLevel(node))) + " engagement";
}

std::string RelativeContext::relativeAlignment(const TopicStats& node) const {
  return std::string(relativeLevelToString(alignmentLevel(node))) + " alignment";
}

}  // namespace deliberation
