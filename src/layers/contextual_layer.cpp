// Implementation of the @q/@d/@p evaluators.

#include "layers/contextual_layer.h"

namespace calib {

namespace {

const std::string& contextKey(const CalibrationContext& context, CanonicalLayer layer) {
  static const std::string kEmpty;
  switch (layer) {
    case CanonicalLayer::Question:  return context.question_id;
    case CanonicalLayer::Dimension: return context.dimension;
    case CanonicalLayer::Policy:    return context.policy_area;
    case CanonicalLayer::Base:
    case CanonicalLayer::Chain:
    case CanonicalLayer::Unit:
    case CanonicalLayer::Congruence:
    case CanonicalLayer::Meta:
      return kEmpty;
  }
  return kEmpty;
}

const char* axisName(CanonicalLayer layer) {
  switch (layer) {
    case CanonicalLayer::Question:  return "question";
    case CanonicalLayer::Dimension: return "dimension";
    case CanonicalLayer::Policy:    return "policy area";
    case CanonicalLayer::Base:
    case CanonicalLayer::Chain:
    case CanonicalLayer::Unit:
    case CanonicalLayer::Congruence:
    case CanonicalLayer::Meta:
      return "context";
  }
  return "context";
}

}  // namespace

LayerEvaluation evaluateContextualLayer(const LayerContext& ctx, CanonicalLayer layer) {
  const std::string& key = contextKey(ctx.subject.context(), layer);
  const MethodDeclaration* method = ctx.config.findMethod(ctx.subject.methodId());
  CompatibilityTier tier =
      method ? method->compatibility(layer, key) : CompatibilityTier::Undeclared;

  LayerScore score;
  score.layer = layer;
  score.value = ctx.config.contextual_tiers.valueOf(tier);
  score.components["tier_value"] = score.value;
  score.evidence["context_key"] = key;
  score.evidence["tier"] = compatibilityTierToString(tier);
  score.evidence["registered"] = method ? "true" : "false";
  score.formula = std::string("contextual_tiers.") + compatibilityTierToString(tier);
  score.rationale = std::string(axisName(layer)) + " '" + key + "' is " +
                    compatibilityTierToString(tier) + " for this method";
  return LayerEvaluation::scored(std::move(score));
}

}  // namespace calib
