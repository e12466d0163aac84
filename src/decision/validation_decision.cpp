// Validation decision implementation.

#include "decision/validation_decision.h"

#include <algorithm>

namespace calib {

// ---------------------------------------------------------------------------
// Enum names
// ---------------------------------------------------------------------------

const char* decisionToString(Decision decision) {
  switch (decision) {
    case Decision::Pass:            return "PASS";
    case Decision::ConditionalPass: return "CONDITIONAL_PASS";
    case Decision::Fail:            return "FAIL";
    case Decision::Skipped:         return "SKIPPED";
  }
  return "UNKNOWN";
}

const char* failureReasonToString(FailureReason reason) {
  switch (reason) {
    case FailureReason::None:                return "NONE";
    case FailureReason::ScoreBelowThreshold: return "SCORE_BELOW_THRESHOLD";
    case FailureReason::BaseLayerLow:        return "BASE_LAYER_LOW";
    case FailureReason::ChainLayerFail:      return "CHAIN_LAYER_FAIL";
    case FailureReason::UnitLayerFail:       return "UNIT_LAYER_FAIL";
    case FailureReason::CongruenceFail:      return "CONGRUENCE_FAIL";
    case FailureReason::ContextualFail:      return "CONTEXTUAL_FAIL";
    case FailureReason::MetaLayerFail:       return "META_LAYER_FAIL";
  }
  return "UNKNOWN";
}

FailureReason failureReasonForLayer(CanonicalLayer layer) {
  switch (layer) {
    case CanonicalLayer::Base:       return FailureReason::BaseLayerLow;
    case CanonicalLayer::Chain:      return FailureReason::ChainLayerFail;
    case CanonicalLayer::Unit:       return FailureReason::UnitLayerFail;
    case CanonicalLayer::Question:
    case CanonicalLayer::Dimension:
    case CanonicalLayer::Policy:     return FailureReason::ContextualFail;
    case CanonicalLayer::Congruence: return FailureReason::CongruenceFail;
    case CanonicalLayer::Meta:       return FailureReason::MetaLayerFail;
  }
  return FailureReason::ScoreBelowThreshold;
}

std::vector<std::string> recommendationsFor(FailureReason reason) {
  switch (reason) {
    case FailureReason::BaseLayerLow:
      return {"Improve code quality: add tests, documentation and type checks",
              "Review the theoretical foundation of the method",
              "Refactor for maintainability before redeploying"};
    case FailureReason::ChainLayerFail:
      return {"Verify that all required inputs are produced upstream",
              "Check the method's declared input signature and types",
              "Ensure upstream methods complete successfully"};
    case FailureReason::UnitLayerFail:
      return {"Improve the structural quality of the analyzed document",
              "Ensure all mandatory sections are present",
              "Validate the indicator and PPI matrices"};
    case FailureReason::CongruenceFail:
      return {"Review the interplay group for semantic compatibility",
              "Check the semantic tags and output ranges of the group members",
              "Supply every input the group's fusion rule expects"};
    case FailureReason::ContextualFail:
      return {"Verify the method suits this question, dimension and policy area",
              "Check the method's compatibility declarations",
              "Consider a different method for this context"};
    case FailureReason::MetaLayerFail:
      return {"Export formulas and complete the execution trace",
              "Tag versions and verify configuration hash and signature",
              "Reduce runtime or memory use"};
    case FailureReason::ScoreBelowThreshold:
      return {"Review all layer scores to identify improvement areas"};
    case FailureReason::None:
      return {};
  }
  return {};
}

// ---------------------------------------------------------------------------
// Attribution
// ---------------------------------------------------------------------------

std::vector<LayerAttribution> normalizedContributions(const CalibrationCertificate& cert) {
  std::vector<LayerAttribution> result;
  for (CanonicalLayer layer : cert.active_layers) {
    const LayerScore* score = cert.findLayerScore(layer);
    if (!score) continue;
    double weighted = 0.0;
    double weight = 0.0;
    for (const auto& term : cert.trace) {
      if (term.layer_a != layer && term.layer_b != layer) continue;
      weighted += term.contribution;
      weight += term.weight;
    }
    LayerAttribution attr;
    attr.layer = layer;
    attr.contribution = weight > 0.0 ? weighted / weight : score->value;
    result.push_back(attr);
  }
  return result;
}

namespace {

std::string layerFailureText(CanonicalLayer layer) {
  switch (layer) {
    case CanonicalLayer::Base:       return "Base layer (intrinsic quality) is low";
    case CanonicalLayer::Chain:      return "Chain layer (data flow) failed";
    case CanonicalLayer::Unit:       return "Unit layer (document quality) is low";
    case CanonicalLayer::Question:
    case CanonicalLayer::Dimension:
    case CanonicalLayer::Policy:
      return std::string("Contextual layer ") + layerToString(layer) + " is incompatible";
    case CanonicalLayer::Congruence: return "Congruence layer (method ensemble) failed";
    case CanonicalLayer::Meta:       return "Meta layer (governance) failed";
  }
  return "Layer failed";
}

}  // namespace

// ---------------------------------------------------------------------------
// decide
// ---------------------------------------------------------------------------

ValidationDecision decide(const CalibrationCertificate& cert, double threshold,
                          const DecisionPolicy& policy) {
  ValidationDecision result;
  result.method_id = cert.method_id;
  result.node_id = cert.node_id;
  result.score = cert.calibration_score;
  result.threshold = threshold;
  result.certificate_id = cert.instance_id;

  switch (cert.status) {
    case CertificateStatus::Skipped:
      result.decision = Decision::Skipped;
      result.skip_reason = cert.skip_reason;
      return result;
    case CertificateStatus::FailClosed:
      result.decision = Decision::Fail;
      result.reason = failureReasonForLayer(cert.evidence_error.layer);
      result.has_failed_layer = true;
      result.failed_layer = cert.evidence_error.layer;
      result.failure_details = "Missing evidence: " + cert.evidence_error.toString();
      result.recommendations = recommendationsFor(result.reason);
      return result;
    case CertificateStatus::Scored:
      break;
  }

  // A required layer that never ran fails the subject whatever the score.
  if (!cert.completeness.passed) {
    result.decision = Decision::Fail;
    if (!cert.completeness.missing_layers.empty()) {
      CanonicalLayer missing = cert.completeness.missing_layers.front();
      result.reason = failureReasonForLayer(missing);
      result.has_failed_layer = true;
      result.failed_layer = missing;
    } else {
      result.reason = FailureReason::ScoreBelowThreshold;
    }
    result.failure_details = "Incomplete calibration: " + cert.completeness.detail;
    result.recommendations = recommendationsFor(result.reason);
    return result;
  }

  if (cert.calibration_score >= threshold) {
    result.decision = Decision::Pass;
    return result;
  }
  if (cert.calibration_score >= threshold - policy.conditional_band) {
    result.decision = Decision::ConditionalPass;
    return result;
  }

  result.decision = Decision::Fail;
  std::vector<LayerAttribution> below;
  for (const auto& attr : normalizedContributions(cert)) {
    if (attr.contribution < policy.layer_floor) below.push_back(attr);
  }
  // Ascending contribution; stable keeps canonical order on ties.
  std::stable_sort(below.begin(), below.end(),
                   [](const LayerAttribution& lhs, const LayerAttribution& rhs) {
                     return lhs.contribution < rhs.contribution;
                   });

  if (below.empty()) {
    result.reason = FailureReason::ScoreBelowThreshold;
    result.failure_details = "Overall score " + formatNumber(cert.calibration_score, 4) +
                             " < " + formatNumber(threshold, 4) +
                             "; no layer below floor " + formatNumber(policy.layer_floor, 4);
    result.recommendations = recommendationsFor(result.reason);
    return result;
  }

  const LayerAttribution& cause = below.front();
  result.reason = failureReasonForLayer(cause.layer);
  result.has_failed_layer = true;
  result.failed_layer = cause.layer;
  result.failure_details = layerFailureText(cause.layer) + ": contribution " +
                           formatNumber(cause.contribution, 4) + " below floor " +
                           formatNumber(policy.layer_floor, 4);
  if (const LayerScore* score = cert.findLayerScore(cause.layer)) {
    if (!score->rationale.empty()) result.failure_details += ". " + score->rationale;
  }

  std::vector<FailureReason> seen;
  for (const auto& attr : below) {
    FailureReason reason = failureReasonForLayer(attr.layer);
    if (std::find(seen.begin(), seen.end(), reason) != seen.end()) continue;
    seen.push_back(reason);
    for (auto& text : recommendationsFor(reason)) {
      result.recommendations.push_back(std::move(text));
    }
  }
  return result;
}

void writeDecisionJson(JsonWriter& writer, const ValidationDecision& decision) {
  writer.beginObject();
  writer.key("method");
  writer.value(std::string_view(decision.method_id));
  writer.key("node");
  writer.value(std::string_view(decision.node_id));
  writer.key("decision");
  writer.value(decisionToString(decision.decision));
  writer.key("score");
  writer.value(decision.score);
  writer.key("threshold");
  writer.value(decision.threshold);
  if (decision.decision == Decision::Fail) {
    writer.key("failure_reason");
    writer.value(failureReasonToString(decision.reason));
    writer.key("failed_layer");
    if (decision.has_failed_layer) {
      writer.value(layerToString(decision.failed_layer));
    } else {
      writer.valueNull();
    }
    writer.key("failure_details");
    writer.value(std::string_view(decision.failure_details));
    writer.key("recommendations");
    writer.beginArray();
    for (const auto& text : decision.recommendations) writer.value(std::string_view(text));
    writer.endArray();
  }
  if (decision.decision == Decision::Skipped) {
    writer.key("skip_reason");
    writer.value(std::string_view(decision.skip_reason));
  }
  writer.key("certificate_id");
  writer.value(std::string_view(decision.certificate_id));
  writer.endObject();
}

}  // namespace calib
