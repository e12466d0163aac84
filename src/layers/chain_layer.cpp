// Implementation of the @chain evaluator.

#include "layers/chain_layer.h"

namespace calib {

const char* chainTierToString(ChainTier tier) {
  switch (tier) {
    case ChainTier::HardMismatch:      return "hard_mismatch";
    case ChainTier::MissingBeneficial: return "missing_beneficial";
    case ChainTier::SchemaDeviation:   return "schema_deviation";
    case ChainTier::PassWithWarnings:  return "warnings";
    case ChainTier::Clean:             return "clean";
  }
  return "unknown";
}

ChainTier classifyChain(const ChainEvidence& evidence) {
  if (evidence.hard_mismatch) return ChainTier::HardMismatch;
  if (evidence.missing_beneficial) return ChainTier::MissingBeneficial;
  if (evidence.schema_deviation) return ChainTier::SchemaDeviation;
  if (evidence.warning_count > 0) return ChainTier::PassWithWarnings;
  return ChainTier::Clean;
}

namespace {

double tierValue(const ChainRubric& rubric, ChainTier tier) {
  switch (tier) {
    case ChainTier::HardMismatch:      return rubric.hard_mismatch;
    case ChainTier::MissingBeneficial: return rubric.missing_beneficial;
    case ChainTier::SchemaDeviation:   return rubric.schema_deviation;
    case ChainTier::PassWithWarnings:  return rubric.warnings;
    case ChainTier::Clean:             return rubric.clean;
  }
  return rubric.hard_mismatch;
}

}  // namespace

LayerEvaluation evaluateChainLayer(const LayerContext& ctx) {
  if (!ctx.evidence.chain) {
    return LayerEvaluation::missingEvidence(CanonicalLayer::Chain, "chain",
                                            "contract-validation evidence is required");
  }
  const ChainEvidence& evidence = *ctx.evidence.chain;
  ChainTier tier = classifyChain(evidence);

  LayerScore score;
  score.layer = CanonicalLayer::Chain;
  score.value = tierValue(ctx.config.chain, tier);
  score.components["tier_value"] = score.value;
  score.evidence["tier"] = chainTierToString(tier);
  score.evidence["hard_mismatch"] = evidence.hard_mismatch ? "true" : "false";
  score.evidence["missing_beneficial"] = evidence.missing_beneficial ? "true" : "false";
  score.evidence["schema_deviation"] = evidence.schema_deviation ? "true" : "false";
  score.evidence["warning_count"] = std::to_string(evidence.warning_count);
  score.formula = std::string("chain_rubric.") + chainTierToString(tier);

  score.rationale = std::string("Chain tier ") + chainTierToString(tier);
  if (!evidence.details.empty()) {
    score.rationale += ": ";
    for (size_t idx = 0; idx < evidence.details.size(); ++idx) {
      if (idx > 0) score.rationale += "; ";
      score.rationale += evidence.details[idx];
    }
  }
  return LayerEvaluation::scored(std::move(score));
}

}  // namespace calib
