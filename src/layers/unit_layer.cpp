// Implementation of the @u evaluator.

#include "layers/unit_layer.h"

namespace calib {

namespace {

LayerScore gated(LayerScore score, const char* gate, const std::string& rationale) {
  score.value = 0.0;
  score.components["gate"] = 1.0;
  score.evidence["gate"] = gate;
  score.formula = "hard gate";
  score.rationale = "HARD GATE: " + rationale;
  return score;
}

}  // namespace

LayerEvaluation evaluateUnitLayer(const LayerContext& ctx) {
  const double unit_quality = ctx.subject.context().unit_quality;
  const UnitTransform* transform = ctx.config.unitTransformFor(ctx.subject.role());

  LayerScore score;
  score.layer = CanonicalLayer::Unit;
  score.components["U"] = unit_quality;
  score.evidence["unit_quality"] = formatNumber(unit_quality);

  if (!transform) {
    score.value = 1.0;
    score.components["gate"] = 0.0;
    score.formula = "g(U) = 1";
    score.rationale = std::string("Role ") + roleToString(ctx.subject.role()) +
                      " is not sensitive to unit quality";
    return LayerEvaluation::scored(std::move(score));
  }

  if (!ctx.evidence.unit) {
    return LayerEvaluation::missingEvidence(CanonicalLayer::Unit, "unit",
                                            "document structure evidence is required");
  }
  const UnitEvidence& evidence = *ctx.evidence.unit;
  const UnitGates& gates = ctx.config.unit_gates;
  score.components["S"] = evidence.structural_compliance;
  score.evidence["structural_compliance"] = formatNumber(evidence.structural_compliance);
  score.evidence["ppi_matrix_present"] = evidence.ppi_matrix_present ? "true" : "false";
  score.evidence["indicator_matrix_present"] =
      evidence.indicator_matrix_present ? "true" : "false";
  score.evidence["transform"] =
      transform->name.empty() ? unitTransformKindToString(transform->kind) : transform->name;

  if (evidence.structural_compliance < gates.min_structural_compliance) {
    return LayerEvaluation::scored(
        gated(std::move(score), "structural",
              "structural compliance S=" + formatNumber(evidence.structural_compliance, 3) +
                  " < " + formatNumber(gates.min_structural_compliance, 3)));
  }
  if (gates.require_ppi_matrix && !evidence.ppi_matrix_present) {
    return LayerEvaluation::scored(
        gated(std::move(score), "ppi_presence", "PPI matrix required but not present"));
  }
  if (gates.require_indicator_matrix && !evidence.indicator_matrix_present) {
    return LayerEvaluation::scored(gated(std::move(score), "indicator_matrix",
                                         "indicator matrix required but not present"));
  }

  score.value = transform->apply(unit_quality);
  score.components["g"] = score.value;
  score.components["gate"] = 0.0;
  score.formula = transform->formula();
  score.rationale = std::string(unitTransformKindToString(transform->kind)) + " g(" +
                    formatNumber(unit_quality) + ") = " + formatNumber(score.value);
  return LayerEvaluation::scored(std::move(score));
}

}  // namespace calib
