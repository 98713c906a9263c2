// Scorer thresholds: defaults, validation and JSON overrides.

#include "stats/scorer_config.h"

#include "core/config_reader.h"

namespace deliberation {

const char* scoringStrategyToString(ScoringStrategy strategy) {
  switch (strategy) {
    case ScoringStrategy::GroupAware: return "group_aware";
    case ScoringStrategy::Pooled:     return "pooled";
  }
  return "unknown";
}

ScoringStrategy scoringStrategyFromString(const std::string& str) {
  if (str == "pooled" || str == "majority" || str == "aggregate_vote") {
    return ScoringStrategy::Pooled;
  }
  return ScoringStrategy::GroupAware;
}

ScorerConfig defaultConfigFor(ScoringStrategy strategy) {
  ScorerConfig config;
  if (strategy == ScoringStrategy::Pooled) {
    config.min_common_ground_prob = 0.7;
    // Rankings only see comments above min_vote_count, so the prior is off.
    config.use_estimate = false;
    config.include_passes = false;
  }
  return config;
}

namespace {

bool isProbability(double val) { return val >= 0.0 && val <= 1.0; }

bool setError(std::string* error, const std::string& message) {
  if (error) *error = message;
  return false;
}

}  // namespace

bool validateConfig(const ScorerConfig& config, std::string* error) {
  struct NamedProbability {
    const char* name;
    double value;
  };
  const NamedProbability probabilities[] = {
      {"min_common_ground_prob", config.min_common_ground_prob},
      {"min_agree_prob_difference", config.min_agree_prob_difference},
      {"min_difference_prob", config.min_difference_prob},
      {"max_difference_prob", config.max_difference_prob},
      {"min_uncertainty_prob", config.min_uncertainty_prob},
      {"uncertainty_percentile", config.uncertainty_percentile},
      {"uncertainty_buffer", config.uncertainty_buffer},
  };
  for (const auto& prob : probabilities) {
    if (!isProbability(prob.value)) {
      return setError(error, std::string(prob.name) + " must be within [0, 1]");
    }
  }
  if (config.max_difference_prob < config.min_difference_prob) {
    return setError(error, "max_difference_prob must not be below min_difference_prob");
  }
  if (config.max_sample_size == 0) {
    return setError(error, "max_sample_size must be positive");
  }
  return true;
}

bool applyConfigOverrides(ScorerConfig& config, std::string_view json_text,
                          std::string* error) {
  ConfigValues values;
  std::string parse_error;
  if (!readConfigObject(json_text, values, &parse_error)) {
    return setError(error, "malformed config: " + parse_error);
  }

  ScorerConfig updated = config;
  std::string type_error;

  auto readNumber = [&](const char* name, double& field) {
    auto found = values.find(name);
    if (found == values.end()) return;
    if (!found->second.isNumber()) {
      if (type_error.empty()) type_error = std::string(name) + " must be a number";
      return;
    }
    field = found->second.asDouble();
  };
  auto readCount = [&](const char* name, uint32_t& field) {
    auto found = values.find(name);
    if (found == values.end()) return;
    if (!found->second.isCount()) {
      if (type_error.empty()) {
        type_error = std::string(name) + " must be a whole number between 0 and 4294967295";
      }
      return;
    }
    field = found->second.asUint();
  };
  auto readFlag = [&](const char* name, bool& field) {
    auto found = values.find(name);
    if (found == values.end()) return;
    if (!found->second.isBool()) {
      if (type_error.empty()) type_error = std::string(name) + " must be a boolean";
      return;
    }
    field = found->second.asBool();
  };

  readCount("min_vote_count", updated.min_vote_count);
  readNumber("min_common_ground_prob", updated.min_common_ground_prob);
  readNumber("min_agree_prob_difference", updated.min_agree_prob_difference);
  readNumber("min_difference_prob", updated.min_difference_prob);
  readNumber("max_difference_prob", updated.max_difference_prob);
  readNumber("min_uncertainty_prob", updated.min_uncertainty_prob);
  readNumber("uncertainty_percentile", updated.uncertainty_percentile);
  readNumber("uncertainty_buffer", updated.uncertainty_buffer);
  readCount("max_sample_size", updated.max_sample_size);
  readFlag("include_passes", updated.include_passes);
  readFlag("use_estimate", updated.use_estimate);
  readFlag("verbose", updated.verbose);

  if (!type_error.empty()) return setError(error, type_error);

  std::string invalid;
  if (!validateConfig(updated, &invalid)) return setError(error, invalid);

  config = updated;
  return true;
}

}  // namespace deliberation
