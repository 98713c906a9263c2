// Topic aggregation.

#include "topics/topic_aggregator.h"

#include <algorithm>
#include <cstdio>

namespace deliberation {

// ---------------------------------------------------------------------------
// TopicGroup
// ---------------------------------------------------------------------------

TopicGroup& TopicGroup::child(const std::string& child_name) {
  for (auto& existing : children) {
    if (existing.name == child_name) return existing;
  }
  children.push_back(TopicGroup{child_name, {}, {}, {}});
  return children.back();
}

const TopicGroup* TopicGroup::findChild(const std::string& child_name) const {
  for (const auto& existing : children) {
    if (existing.name == child_name) return &existing;
  }
  return nullptr;
}

void TopicGroup::addDirect(size_t index, const std::string& comment_id) {
  if (direct_ids.insert(comment_id).second) {
    direct.push_back(index);
  }
}

std::vector<size_t> TopicGroup::members(const std::vector<Comment>& comments) const {
  if (children.empty()) {
    std::vector<size_t> result = direct;
    std::sort(result.begin(), result.end());
    return result;
  }

  // A comment filed under several subtopics counts once for the topic.
  std::set<std::string> seen_ids;
  std::vector<size_t> result;
  for (const auto& sub : children) {
    for (size_t index : sub.members(comments)) {
      if (seen_ids.insert(comments[index].id).second) {
        result.push_back(index);
      }
    }
  }
  std::sort(result.begin(), result.end());
  return result;
}

namespace {

void addToGroup(TopicGroup& group, const Topic& topic, size_t index, const std::string& id) {
  if (topic.isLeaf()) {
    group.addDirect(index, id);
    return;
  }
  for (const auto& sub : topic.subtopics) {
    addToGroup(group.child(sub.name), sub, index, id);
  }
}

}  // namespace

std::vector<TopicGroup> groupCommentsByTopic(const std::vector<Comment>& comments,
                                             bool verbose) {
  TopicGroup root;
  for (size_t idx = 0; idx < comments.size(); ++idx) {
    const Comment& comment = comments[idx];
    if (comment.topics.empty()) {
      if (verbose) {
        std::fprintf(stderr, "[TopicAggregator] Comment %s has no topics assigned.\n",
                     comment.id.c_str());
      }
      continue;
    }
    for (const auto& topic : comment.topics) {
      addToGroup(root.child(topic.name), topic, idx, comment.id);
    }
  }
  return std::move(root.children);
}

// ---------------------------------------------------------------------------
// TopicStats
// ---------------------------------------------------------------------------

namespace {

std::vector<Comment> collect(const std::vector<Comment>& comments,
                             const std::vector<size_t>& indices) {
  std::vector<Comment> result;
  result.reserve(indices.size());
  for (size_t index : indices) result.push_back(comments[index]);
  return result;
}

TopicStats buildNode(const TopicGroup& group, const std::vector<Comment>& comments,
                     const ScorerFactory& factory, bool verbose, int depth) {
  TopicStats node;
  node.name = group.name;
  for (const auto& sub : group.children) {
    node.subtopic_stats.push_back(buildNode(sub, comments, factory, verbose, depth + 1));
  }

  std::vector<size_t> indices = group.members(comments);
  node.comment_count = indices.size();
  node.scorer = factory(collect(comments, indices));

  if (verbose) {
    std::fprintf(stderr, "[TopicAggregator] %*s%s: %zu comments, %zu subtopics\n", depth * 2,
                 "", node.name.c_str(), node.comment_count, node.subtopic_stats.size());
  }
  return node;
}

}  // namespace

std::vector<TopicStats> buildTopicStats(const std::vector<Comment>& comments,
                                        const ScorerFactory& factory, bool verbose) {
  std::vector<TopicStats> result;
  for (const auto& group : groupCommentsByTopic(comments, verbose)) {
    result.push_back(buildNode(group, comments, factory, verbose, 0));
  }
  sortTopicStats(result);
  return result;
}

void sortTopicStats(std::vector<TopicStats>& stats) {
  std::stable_sort(stats.begin(), stats.end(), [](const TopicStats& lhs, const TopicStats& rhs) {
    bool lhs_other = lhs.name == kOtherTopicName;
    bool rhs_other = rhs.name == kOtherTopicName;
    if (lhs_other != rhs_other) return rhs_other;
    return lhs.comment_count > rhs.comment_count;
  });
  for (auto& topic : stats) {
    sortTopicStats(topic.subtopic_stats);
  }
}

const TopicStats* findTopic(const std::vector<TopicStats>& stats, const std::string& name) {
  for (const auto& topic : stats) {
    if (topic.name == name) return &topic;
  }
  return nullptr;
}

}  // namespace deliberation
