// Implementation of the anti-universality validator.

#include "config/anti_universality.h"

namespace calib {

bool isUniversalMethod(const CalibrationConfig& config, const MethodDeclaration& method,
                       std::string* witness) {
  const double threshold = config.anti_universality_threshold;
  auto score = [&](CanonicalLayer layer, const std::string& key) {
    return config.contextual_tiers.valueOf(method.compatibility(layer, key));
  };

  for (const auto& question : config.domain.questions) {
    double q_score = score(CanonicalLayer::Question, question);
    for (const auto& dimension : config.domain.dimensions) {
      double d_score = score(CanonicalLayer::Dimension, dimension);
      for (const auto& policy : config.domain.policy_areas) {
        double p_score = score(CanonicalLayer::Policy, policy);
        if (q_score < threshold || d_score < threshold || p_score < threshold) {
          if (witness) *witness = question + "/" + dimension + "/" + policy;
          return false;
        }
      }
    }
  }
  // Every combination met the threshold. An empty domain axis is rejected
  // by the loader before this runs.
  return true;
}

std::vector<std::string> checkAntiUniversality(const CalibrationConfig& config) {
  std::vector<std::string> errors;
  for (const auto& entry : config.methods) {
    if (isUniversalMethod(config, entry.second)) {
      errors.push_back("anti-universality violation: method '" + entry.first +
                       "' scores >= " + formatNumber(config.anti_universality_threshold) +
                       " on @q, @d and @p for every question/dimension/policy combination");
    }
  }
  return errors;
}

}  // namespace calib
