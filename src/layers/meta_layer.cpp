// Implementation of the @m evaluator.

#include "layers/meta_layer.h"

#include <algorithm>

namespace calib {

namespace {

int countTrue(bool first, bool second, bool third) {
  return static_cast<int>(first) + static_cast<int>(second) + static_cast<int>(third);
}

}  // namespace

double metaCostScore(const MetaRubric& rubric, double runtime_ms, double memory_mb) {
  double runtime_score = rubric.cost_slow;
  if (runtime_ms < rubric.fast_runtime_ms) {
    runtime_score = rubric.cost_fast;
  } else if (runtime_ms < rubric.acceptable_runtime_ms) {
    runtime_score = rubric.cost_acceptable;
  }
  double memory_score =
      memory_mb <= rubric.memory_budget_mb ? rubric.cost_within_budget : rubric.cost_over_budget;
  return std::min(runtime_score, memory_score);
}

LayerEvaluation evaluateMetaLayer(const LayerContext& ctx) {
  if (!ctx.evidence.meta) {
    return LayerEvaluation::missingEvidence(CanonicalLayer::Meta, "meta",
                                            "transparency, governance and cost evidence "
                                            "is required");
  }
  const MetaEvidence& evidence = *ctx.evidence.meta;
  const MetaRubric& rubric = ctx.config.meta;

  int transparency_met = countTrue(evidence.formula_exported, evidence.trace_complete,
                                   evidence.logs_schema_conformant);
  int governance_met = countTrue(evidence.version_tagged, evidence.config_hash_matches,
                                 evidence.signature_valid);
  double m_transp = rubric.transparency_tiers[static_cast<size_t>(transparency_met)];
  double m_gov = rubric.governance_tiers[static_cast<size_t>(governance_met)];
  double m_cost = metaCostScore(rubric, evidence.runtime_ms, evidence.memory_mb);

  LayerScore score;
  score.layer = CanonicalLayer::Meta;
  score.value = rubric.w_transparency * m_transp + rubric.w_governance * m_gov +
                rubric.w_cost * m_cost;
  score.components["m_transp"] = m_transp;
  score.components["m_gov"] = m_gov;
  score.components["m_cost"] = m_cost;
  score.evidence["transparency_conditions_met"] = std::to_string(transparency_met);
  score.evidence["governance_conditions_met"] = std::to_string(governance_met);
  score.evidence["runtime_ms"] = formatNumber(evidence.runtime_ms);
  score.evidence["memory_mb"] = formatNumber(evidence.memory_mb);
  score.formula = formatNumber(rubric.w_transparency) + "*m_transp + " +
                  formatNumber(rubric.w_governance) + "*m_gov + " +
                  formatNumber(rubric.w_cost) + "*m_cost";
  score.rationale = "transparency " + std::to_string(transparency_met) + "/3, governance " +
                    std::to_string(governance_met) + "/3, cost " + formatNumber(m_cost, 3);
  return LayerEvaluation::scored(std::move(score));
}

}  // namespace calib
