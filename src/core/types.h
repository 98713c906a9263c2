// Basic types for deliberation statistics: vote tallies, comments, topics.

#ifndef DELIBERATION_CORE_TYPES_H
#define DELIBERATION_CORE_TYPES_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace deliberation {

/// Vote count type (agree / disagree / pass tallies).
using VoteCount = uint32_t;

/// Literal topic name that always sorts last among its siblings.
constexpr const char* kOtherTopicName = "Other";

// ---------------------------------------------------------------------------
// Vote tallies
// ---------------------------------------------------------------------------

/// @brief Aggregated votes of one entity (the whole conversation or one group).
struct VoteTally {
  VoteCount agree_count = 0;
  VoteCount disagree_count = 0;
  VoteCount pass_count = 0;

  /// @brief Total number of votes.
  /// @param include_passes Whether pass votes count toward the total.
  constexpr VoteCount totalCount(bool include_passes) const {
    return include_passes ? agree_count + disagree_count + pass_count
                          : agree_count + disagree_count;
  }

  /// @brief Component-wise sum.
  constexpr VoteTally operator+(const VoteTally& other) const {
    return {agree_count + other.agree_count, disagree_count + other.disagree_count,
            pass_count + other.pass_count};
  }

  constexpr bool operator==(const VoteTally& other) const {
    return agree_count == other.agree_count && disagree_count == other.disagree_count &&
           pass_count == other.pass_count;
  }
};

/// Opinion-group id -> tally. Ordered so iteration is deterministic.
using GroupVoteTallies = std::map<std::string, VoteTally>;

/// @brief Vote information attached to a comment.
///
/// Either a single pooled tally or one tally per opinion group. The kind is
/// fixed at construction; accessing the other representation throws
/// std::invalid_argument. A dataset is expected to use one kind throughout.
class VoteInfo {
 public:
  enum class Kind : uint8_t {
    Pooled,   ///< One tally for all participants.
    ByGroup   ///< One tally per opinion group.
  };

  /// @brief Create pooled vote info.
  static VoteInfo pooled(const VoteTally& tally);

  /// @brief Create vote info broken down by opinion group.
  static VoteInfo byGroup(GroupVoteTallies groups);

  Kind kind() const { return kind_; }
  bool isPooled() const { return kind_ == Kind::Pooled; }
  bool isByGroup() const { return kind_ == Kind::ByGroup; }

  /// @brief The pooled tally. Throws std::invalid_argument for group info.
  const VoteTally& tally() const;

  /// @brief The per-group tallies. Throws std::invalid_argument for pooled info.
  const GroupVoteTallies& groups() const;

  /// @brief Sum of all tallies (the pooled tally itself, or all groups added).
  VoteTally combined() const;

  bool operator==(const VoteInfo& other) const;

 private:
  VoteInfo() = default;

  Kind kind_ = Kind::Pooled;
  VoteTally tally_;
  GroupVoteTallies groups_;
};

/// @brief Convert VoteInfo::Kind to a string ("pooled" / "by_group").
const char* voteInfoKindToString(VoteInfo::Kind kind);

// ---------------------------------------------------------------------------
// Topics and comments
// ---------------------------------------------------------------------------

/// @brief A topic label, optionally with nested subtopics.
///
/// Names must be unique among siblings; this is not validated.
struct Topic {
  std::string name;
  std::vector<Topic> subtopics;  ///< Empty for a leaf topic.

  bool isLeaf() const { return subtopics.empty(); }
};

/// @brief A statement from the deliberation with optional votes and topics.
struct Comment {
  std::string id;
  std::string text;
  std::optional<VoteInfo> vote_info;
  std::vector<Topic> topics;

  bool hasVotes() const { return vote_info.has_value(); }
};

/// @brief Total votes on a comment (0 if it carries no vote info).
/// @param comment The comment.
/// @param include_passes Whether pass votes are counted.
/// @return Pooled total, or the sum across all groups.
VoteCount commentVoteCount(const Comment& comment, bool include_passes);

/// @brief True if the comment has vote info broken down by group.
bool hasGroupVotes(const Comment& comment);

/// @brief Render a fraction as a percentage string, e.g. 0.6 -> "60%".
/// @param value Fraction (1.0 == 100%).
/// @param precision Decimal places kept after rounding.
/// @return Percentage string without trailing zeros.
std::string decimalToPercent(double value, int precision = 0);

}  // namespace deliberation

#endif  // DELIBERATION_CORE_TYPES_H
