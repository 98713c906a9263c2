// Conversation statistics entry point.

#include "conversation_stats.h"

#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "core/json_writer.h"
#include "stats/scorer_factory.h"
#include "topics/relative_context.h"

namespace deliberation {

ConversationStatsConfig makeConversationStatsConfig(ScoringStrategy strategy) {
  ConversationStatsConfig config;
  config.strategy = strategy;
  config.scorer = defaultConfigFor(strategy);
  return config;
}

namespace {

void collectSubtopicContext(const std::vector<TopicStats>& siblings,
                            std::vector<std::string>& path,
                            std::vector<SubtopicContext>& out) {
  for (const auto& topic : siblings) {
    if (!topic.hasSubtopics()) continue;
    path.push_back(topic.name);
    RelativeContext context(topic.subtopic_stats);
    for (const auto& sub : topic.subtopic_stats) {
      SubtopicContext labels;
      labels.path = path;
      labels.path.push_back(sub.name);
      labels.engagement = context.relativeEngagement(sub);
      labels.alignment = context.relativeAlignment(sub);
      out.push_back(std::move(labels));
    }
    collectSubtopicContext(topic.subtopic_stats, path, out);
    path.pop_back();
  }
}

void fillResult(ConversationStatsResult& result, const std::vector<Comment>& comments,
                const ConversationStatsConfig& config, const ScorerConfig& scorer_config) {
  ScorerFactory factory = makeScorerFactory(config.strategy, scorer_config);

  result.scorer = factory(comments);
  const ConsensusScorer& scorer = *result.scorer;

  result.common_ground = scorer.selectCommonGround();
  result.differences_of_opinion = scorer.selectDifferencesOfOpinion();
  result.uncertain = scorer.selectUncertain();
  if (result.common_ground.empty()) result.messages.push_back(scorer.noCommonGroundMessage());
  if (result.differences_of_opinion.empty()) {
    result.messages.push_back(scorer.noDifferencesMessage());
  }
  if (result.uncertain.empty()) result.messages.push_back(scorer.noUncertainMessage());

  if (const auto* group_scorer = dynamic_cast<const GroupAwareScorer*>(&scorer)) {
    result.group_stats = group_scorer->statsByGroup();
    for (const auto& group : group_scorer->groupNames()) {
      result.group_representatives[group] = group_scorer->selectGroupRepresentative(group);
    }
  }

  result.topic_stats = buildTopicStats(comments, factory, config.verbose);
  std::vector<std::string> path;
  collectSubtopicContext(result.topic_stats, path, result.subtopic_context);
}

}  // namespace

ConversationStatsResult computeConversationStats(const std::vector<Comment>& comments,
                                                 const ConversationStatsConfig& config) {
  ConversationStatsResult result;
  result.strategy = config.strategy;

  std::string error;
  if (!validateConfig(config.scorer, &error)) {
    result.error_message = "Invalid scorer config: " + error;
    return result;
  }

  ScorerConfig scorer_config = config.scorer;
  scorer_config.verbose = scorer_config.verbose || config.verbose;

  try {
    fillResult(result, comments, config, scorer_config);
  } catch (const std::invalid_argument& ex) {
    if (config.verbose) {
      std::fprintf(stderr, "[ConversationStats] %s\n", ex.what());
    }
    ConversationStatsResult failed;
    failed.strategy = config.strategy;
    failed.error_message = ex.what();
    return failed;
  }

  if (config.verbose) {
    std::fprintf(stderr,
                 "[ConversationStats] %s: %zu comments, %zu topics, %zu common ground, "
                 "%zu differences, %zu uncertain\n",
                 scoringStrategyToString(config.strategy), comments.size(),
                 result.topic_stats.size(), result.common_ground.size(),
                 result.differences_of_opinion.size(), result.uncertain.size());
  }
  result.success = true;
  return result;
}

const SubtopicContext* ConversationStatsResult::findContext(
    const std::vector<std::string>& path) const {
  for (const auto& labels : subtopic_context) {
    if (labels.path == path) return &labels;
  }
  return nullptr;
}

// ---------------------------------------------------------------------------
// Text summary
// ---------------------------------------------------------------------------

namespace {

void appendTopicLines(const ConversationStatsResult& result,
                      const std::vector<TopicStats>& topics, std::vector<std::string>& path,
                      std::ostringstream& oss) {
  for (const auto& topic : topics) {
    path.push_back(topic.name);
    oss << std::string((path.size() - 1) * 2, ' ') << topic.name << " (" << topic.comment_count
        << " comments)";
    if (const SubtopicContext* labels = result.findContext(path)) {
      oss << ": " << labels->engagement << ", " << labels->alignment;
    }
    oss << "\n";
    appendTopicLines(result, topic.subtopic_stats, path, oss);
    path.pop_back();
  }
}

}  // namespace

std::string ConversationStatsResult::toTextSummary() const {
  std::ostringstream oss;
  if (!success) {
    oss << "Error: " << error_message << "\n";
    return oss.str();
  }

  oss << "=== Conversation ===\n";
  oss << "Strategy: " << scoringStrategyToString(strategy);
  if (scorer) {
    oss << " | Comments: " << scorer->commentCount() << " | Votes: " << scorer->voteCount();
  }
  oss << "\n";
  oss << "Common ground: " << common_ground.size()
      << " | Differences of opinion: " << differences_of_opinion.size()
      << " | Uncertain: " << uncertain.size() << "\n";
  for (const auto& message : messages) {
    oss << "  " << message << "\n";
  }

  if (!topic_stats.empty()) {
    oss << "\n=== Topics ===\n";
    std::vector<std::string> path;
    appendTopicLines(*this, topic_stats, path, oss);
  }

  if (!group_stats.empty()) {
    oss << "\n=== Groups ===\n";
    for (const auto& group : group_stats) {
      oss << group.name << ": " << group.vote_count << " votes";
      auto iter = group_representatives.find(group.name);
      if (iter != group_representatives.end()) {
        oss << " | Representative comments: " << iter->second.size();
      }
      oss << "\n";
    }
  }

  return oss.str();
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

namespace {

void writeCommentIds(JsonWriter& writer, const std::vector<Comment>& comments) {
  writer.beginArray();
  for (const auto& comment : comments) writer.value(comment.id);
  writer.endArray();
}

void writeTopics(JsonWriter& writer, const ConversationStatsResult& result,
                 const std::vector<TopicStats>& topics, std::vector<std::string>& path) {
  writer.beginArray();
  for (const auto& topic : topics) {
    path.push_back(topic.name);
    writer.beginObject();
    writer.field("name", topic.name);
    writer.field("comment_count", static_cast<uint64_t>(topic.comment_count));
    writer.field("vote_count", topic.scorer ? topic.scorer->voteCount() : uint64_t{0});
    if (const SubtopicContext* labels = result.findContext(path)) {
      writer.field("engagement", labels->engagement);
      writer.field("alignment", labels->alignment);
    }
    if (topic.hasSubtopics()) {
      writer.key("subtopics");
      writeTopics(writer, result, topic.subtopic_stats, path);
    }
    writer.endObject();
    path.pop_back();
  }
  writer.endArray();
}

}  // namespace

std::string buildStatsJson(const ConversationStatsResult& result) {
  JsonWriter writer;
  writer.beginObject();

  writer.field("success", result.success);
  writer.field("strategy", scoringStrategyToString(result.strategy));
  if (!result.success) {
    writer.field("error", result.error_message);
    writer.endObject();
    return writer.toPrettyString();
  }

  if (result.scorer) {
    writer.field("comment_count", static_cast<uint64_t>(result.scorer->commentCount()));
    writer.field("vote_count", result.scorer->voteCount());
    writer.field("uncertainty_threshold", result.scorer->uncertaintyThreshold());
  }

  writer.key("common_ground");
  writeCommentIds(writer, result.common_ground);
  writer.key("differences_of_opinion");
  writeCommentIds(writer, result.differences_of_opinion);
  writer.key("uncertain");
  writeCommentIds(writer, result.uncertain);

  writer.key("messages");
  writer.beginArray();
  for (const auto& message : result.messages) writer.value(message);
  writer.endArray();

  writer.key("topics");
  std::vector<std::string> path;
  writeTopics(writer, result, result.topic_stats, path);

  if (result.strategy == ScoringStrategy::GroupAware) {
    writer.key("groups");
    writer.beginArray();
    for (const auto& group : result.group_stats) {
      writer.beginObject();
      writer.field("name", group.name);
      writer.field("vote_count", group.vote_count);
      writer.key("representative");
      auto iter = result.group_representatives.find(group.name);
      writeCommentIds(writer, iter != result.group_representatives.end()
                                  ? iter->second
                                  : std::vector<Comment>{});
      writer.endObject();
    }
    writer.endArray();
  }

  writer.endObject();
  return writer.toPrettyString();
}

}  // namespace deliberation
