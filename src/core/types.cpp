// Basic types for deliberation statistics.

#include "core/types.h"

#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace deliberation {

// ---------------------------------------------------------------------------
// VoteInfo
// ---------------------------------------------------------------------------

VoteInfo VoteInfo::pooled(const VoteTally& tally) {
  VoteInfo info;
  info.kind_ = Kind::Pooled;
  info.tally_ = tally;
  return info;
}

VoteInfo VoteInfo::byGroup(GroupVoteTallies groups) {
  VoteInfo info;
  info.kind_ = Kind::ByGroup;
  info.groups_ = std::move(groups);
  return info;
}

const VoteTally& VoteInfo::tally() const {
  if (kind_ != Kind::Pooled) {
    throw std::invalid_argument("VoteInfo holds per-group tallies, not a pooled tally.");
  }
  return tally_;
}

const GroupVoteTallies& VoteInfo::groups() const {
  if (kind_ != Kind::ByGroup) {
    throw std::invalid_argument("VoteInfo holds a pooled tally, not per-group tallies.");
  }
  return groups_;
}

VoteTally VoteInfo::combined() const {
  switch (kind_) {
    case Kind::Pooled:
      return tally_;
    case Kind::ByGroup: {
      VoteTally sum;
      for (const auto& entry : groups_) {
        sum = sum + entry.second;
      }
      return sum;
    }
  }
  return tally_;
}

bool VoteInfo::operator==(const VoteInfo& other) const {
  if (kind_ != other.kind_) return false;
  return kind_ == Kind::Pooled ? tally_ == other.tally_ : groups_ == other.groups_;
}

const char* voteInfoKindToString(VoteInfo::Kind kind) {
  switch (kind) {
    case VoteInfo::Kind::Pooled:  return "pooled";
    case VoteInfo::Kind::ByGroup: return "by_group";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// Comment helpers
// ---------------------------------------------------------------------------

VoteCount commentVoteCount(const Comment& comment, bool include_passes) {
  if (!comment.vote_info) return 0;
  return comment.vote_info->combined().totalCount(include_passes);
}

bool hasGroupVotes(const Comment& comment) {
  return comment.vote_info && comment.vote_info->isByGroup();
}

std::string decimalToPercent(double value, int precision) {
  if (precision < 0) precision = 0;
  double scale = std::pow(10.0, precision);
  double rounded = std::floor(value * 100.0 * scale + 0.5) / scale;

  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", precision, rounded);
  std::string result(buf);

  // Drop trailing zeros ("12.50" -> "12.5", "60.0" -> "60").
  if (result.find('.') != std::string::npos) {
    while (!result.empty() && result.back() == '0') result.pop_back();
    if (!result.empty() && result.back() == '.') result.pop_back();
  }
  if (result == "-0") result = "0";
  return result + "%";
}

}  // namespace deliberation
