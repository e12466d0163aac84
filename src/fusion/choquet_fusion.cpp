// Implementation of Choquet fusion.

#include "fusion/choquet_fusion.h"

#include <algorithm>
#include <cstdio>

namespace calib {

FusionResult fuseLayerScores(const FusionConfiguration& fusion,
                             const std::map<CanonicalLayer, double>& scores) {
  FusionResult result;

  for (CanonicalLayer layer : kAllLayers) {
    auto iter = scores.find(layer);
    if (iter == scores.end()) continue;
    FusionTerm term;
    term.kind = FusionTermKind::Linear;
    term.layer_a = layer;
    term.layer_b = layer;
    term.weight = fusion.linearWeight(layer);
    term.input = iter->second;
    term.contribution = term.weight * term.input;
    term.label = layerToString(layer);
    result.linear_sum += term.contribution;
    result.terms.push_back(std::move(term));
  }

  for (const auto& interaction : fusion.interactions) {
    auto iter_a = scores.find(interaction.layer_a);
    auto iter_b = scores.find(interaction.layer_b);
    if (iter_a == scores.end() || iter_b == scores.end()) continue;
    FusionTerm term;
    term.kind = FusionTermKind::Interaction;
    term.layer_a = interaction.layer_a;
    term.layer_b = interaction.layer_b;
    term.weight = interaction.weight;
    term.input = std::min(iter_a->second, iter_b->second);
    term.contribution = term.weight * term.input;
    term.label = interaction.label();
    term.rationale = interaction.rationale;
    result.interaction_sum += term.contribution;
    result.terms.push_back(std::move(term));
  }

  result.final_score = result.linear_sum + result.interaction_sum;

  if (result.final_score < -kWeightTolerance || result.final_score > 1.0 + kWeightTolerance) {
    std::string weights;
    for (const auto& term : result.terms) {
      if (!weights.empty()) weights += ", ";
      weights += term.label + "=" + formatNumber(term.weight);
    }
    result.error_message = std::string("fusion for role '") + roleToString(fusion.role) +
                           "' produced " + formatNumber(result.final_score, 10) +
                           " outside [0,1]; weights: " + weights;
    std::fprintf(stderr, "[fusion] ERROR: %s\n", result.error_message.c_str());
    return result;
  }

  result.success = true;
  return result;
}

double replayFusionTrace(const std::vector<FusionTerm>& terms, double& linear_sum,
                         double& interaction_sum) {
  linear_sum = 0.0;
  interaction_sum = 0.0;
  for (const auto& term : terms) {
    double contribution = term.weight * term.input;
    switch (term.kind) {
      case FusionTermKind::Linear:
        linear_sum += contribution;
        break;
      case FusionTermKind::Interaction:
        interaction_sum += contribution;
        break;
    }
  }
  return linear_sum + interaction_sum;
}

double marginalGain(const std::vector<FusionTerm>& terms, CanonicalLayer layer,
                    const std::map<CanonicalLayer, double>& scores) {
  auto self = scores.find(layer);
  if (self == scores.end()) return 0.0;

  double gain = 0.0;
  for (const auto& term : terms) {
    if (term.kind == FusionTermKind::Linear) {
      if (term.layer_a == layer) gain += term.weight;
      continue;
    }
    CanonicalLayer other;
    if (term.layer_a == layer) {
      other = term.layer_b;
    } else if (term.layer_b == layer) {
      other = term.layer_a;
    } else {
      continue;
    }
    auto other_iter = scores.find(other);
    if (other_iter != scores.end() && self->second < other_iter->second) {
      gain += term.weight;
    }
  }
  return gain;
}

}  // namespace calib
