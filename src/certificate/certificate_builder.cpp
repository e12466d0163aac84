// Implementation of certificate assembly.

#include "certificate/certificate_builder.h"

#include <algorithm>
#include <cmath>
#include <map>

#include "config/layer_requirements.h"
#include "core/sha256.h"

namespace calib {

std::string computeGraphHash(const CalibrationConfig& config, const CalibrationSubject& subject) {
  std::string content = "node=" + subject.nodeId();
  if (subject.inInterplayGroup()) {
    std::vector<std::string> members;
    if (const InterplayGroup* group = config.findGroup(subject.interplayGroup())) {
      members = group->members;
    }
    if (std::find(members.begin(), members.end(), subject.methodId()) == members.end()) {
      members.push_back(subject.methodId());
    }
    std::sort(members.begin(), members.end());
    content += ";group=" + subject.interplayGroup() + ";members=";
    for (size_t idx = 0; idx < members.size(); ++idx) {
      if (idx > 0) content += ",";
      content += members[idx];
    }
  }
  return sha256Tagged(content);
}

namespace {

/// Subject identity, audit trail and the checks that do not depend on fusion.
CalibrationCertificate makeSkeleton(const CertificateContext& ctx,
                                    const CalibrationSubject& subject, const LayerSet& active,
                                    CertificateStatus status) {
  CalibrationCertificate cert;
  cert.status = status;
  cert.method_id = subject.methodId();
  cert.node_id = subject.nodeId();
  cert.interplay_group = subject.interplayGroup();
  cert.role = subject.role();
  cert.context = subject.context();
  cert.active_layers = active;
  cert.symbolic_formula = kSymbolicFusionFormula;
  cert.timestamp = ctx.timestamp;
  cert.config_hash = ctx.config.config_hash;
  cert.graph_hash = computeGraphHash(ctx.config, subject);
  cert.registry_version = ctx.registry_version;
  cert.validator_version = kValidatorVersion;
  return cert;
}

ValidationCheck checkBoundedness(const CalibrationCertificate& cert) {
  ValidationCheck check;
  for (const auto& score : cert.layer_scores) {
    if (!(score.value >= 0.0 && score.value <= 1.0)) {
      check.detail = std::string(layerToString(score.layer)) + " = " +
                     formatNumber(score.value) + " outside [0,1]";
      return check;
    }
  }
  if (!(cert.calibration_score >= 0.0 && cert.calibration_score <= 1.0)) {
    check.detail = "final score " + formatNumber(cert.calibration_score) + " outside [0,1]";
    return check;
  }
  check.passed = true;
  check.detail = "all layer scores and the final score lie in [0,1]";
  return check;
}

ValidationCheck checkNormalization(const FusionConfiguration& fusion) {
  ValidationCheck check;
  double total = fusion.totalWeight();
  check.passed = std::fabs(total - 1.0) <= kWeightTolerance;
  check.detail = "sum(linear) + sum(interaction) = " + formatNumber(fusion.linearTotal()) +
                 " + " + formatNumber(fusion.interactionTotal()) + " = " + formatNumber(total);
  return check;
}

ValidationCheck checkCompleteness(const CalibrationConfig& config,
                                  const CalibrationCertificate& cert) {
  ValidationCheck check;
  const MethodDeclaration* method = config.findMethod(cert.method_id);
  std::string missing;
  for (CanonicalLayer layer : requiredLayers(config, cert.role)) {
    if (layerSetContains(cert.active_layers, layer)) continue;
    if (method && isOmissionJustified(*method, layer)) continue;
    if (!missing.empty()) missing += ", ";
    missing += layerToString(layer);
    check.missing_layers.push_back(layer);
  }
  if (!missing.empty()) {
    check.detail = "required layers without justification: " + missing;
    return check;
  }
  for (CanonicalLayer layer : cert.active_layers) {
    if (!cert.findLayerScore(layer)) {
      check.detail = std::string("active layer ") + layerToString(layer) + " has no score";
      return check;
    }
  }
  check.passed = true;
  check.detail = std::to_string(cert.active_layers.size()) +
                 " active layers scored; required layers covered";
  return check;
}

SensitivityAnalysis analyzeSensitivity(const CalibrationCertificate& cert) {
  std::map<CanonicalLayer, double> values;
  for (const auto& score : cert.layer_scores) values[score.layer] = score.value;

  SensitivityAnalysis sens;
  for (CanonicalLayer layer : cert.active_layers) {
    double gain = marginalGain(cert.trace, layer, values);
    if (!sens.has_layer || gain > sens.layer_marginal_gain) {
      sens.has_layer = true;
      sens.most_impactful_layer = layer;
      sens.layer_marginal_gain = gain;
    }
  }

  double best_weight = 0.0;
  for (const auto& term : cert.trace) {
    if (term.kind != FusionTermKind::Interaction) continue;
    double gain = term.weight * (1.0 - term.input);
    if (!sens.has_interaction || gain > sens.interaction_attainable_gain ||
        (gain == sens.interaction_attainable_gain && term.weight > best_weight)) {
      sens.has_interaction = true;
      sens.most_impactful_interaction = term.label;
      sens.interaction_attainable_gain = gain;
      best_weight = term.weight;
    }
  }
  return sens;
}

std::string expandFormula(const FusionResult& fused, const std::vector<LayerScore>& scores) {
  auto valueOf = [&scores](CanonicalLayer layer) {
    for (const auto& score : scores) {
      if (score.layer == layer) return score.value;
    }
    return 0.0;
  };
  std::string text = "Cal(I) = ";
  bool first = true;
  for (const auto& term : fused.terms) {
    if (!first) text += " + ";
    first = false;
    switch (term.kind) {
      case FusionTermKind::Linear:
        text += formatNumber(term.weight) + "*" + formatNumber(term.input);
        break;
      case FusionTermKind::Interaction:
        text += formatNumber(term.weight) + "*min(" + formatNumber(valueOf(term.layer_a)) +
                ", " + formatNumber(valueOf(term.layer_b)) + ")";
        break;
    }
  }
  if (first) text += "0";
  text += " = " + formatNumber(fused.final_score);
  return text;
}

void finish(CalibrationCertificate& cert) {
  cert.instance_id = computeInstanceId(cert);
}

}  // namespace

CalibrationCertificate buildScoredCertificate(const CertificateContext& ctx,
                                              const CalibrationSubject& subject,
                                              const LayerSet& active,
                                              std::vector<LayerScore> scores,
                                              const FusionConfiguration& fusion,
                                              const FusionResult& fused) {
  CalibrationCertificate cert = makeSkeleton(ctx, subject, active, CertificateStatus::Scored);
  cert.expanded_formula = expandFormula(fused, scores);
  cert.layer_scores = std::move(scores);
  cert.trace = fused.terms;
  cert.linear_sum = fused.linear_sum;
  cert.interaction_sum = fused.interaction_sum;
  cert.calibration_score = fused.final_score;

  const std::string fusion_source = fusion.source.empty() ? "config" : fusion.source;
  const std::string fusion_version = fusion.version.empty() ? ctx.config.version : fusion.version;
  for (const auto& term : cert.trace) {
    ParameterProvenance param;
    param.name = (term.kind == FusionTermKind::Linear ? "linear." : "interaction.") + term.label;
    param.value = term.weight;
    param.source = fusion_source;
    param.version = fusion_version;
    cert.provenance.push_back(std::move(param));
  }
  if (layerSetContains(active, CanonicalLayer::Base)) {
    const BaseWeights& base = ctx.config.base_weights;
    cert.provenance.push_back({"base_weights.theory", base.theory, "config", ctx.config.version});
    cert.provenance.push_back({"base_weights.impl", base.impl, "config", ctx.config.version});
    cert.provenance.push_back({"base_weights.deploy", base.deploy, "config", ctx.config.version});
  }

  cert.boundedness = checkBoundedness(cert);
  cert.normalization = checkNormalization(fusion);
  cert.completeness = checkCompleteness(ctx.config, cert);
  cert.sensitivity = analyzeSensitivity(cert);
  finish(cert);
  return cert;
}

CalibrationCertificate buildFailClosedCertificate(const CertificateContext& ctx,
                                                  const CalibrationSubject& subject,
                                                  const LayerSet& active,
                                                  std::vector<LayerScore> evaluated,
                                                  const EvidenceError& error) {
  CalibrationCertificate cert =
      makeSkeleton(ctx, subject, active, CertificateStatus::FailClosed);
  cert.layer_scores = std::move(evaluated);
  cert.evidence_error = error;
  cert.expanded_formula = "Cal(I) = 0 (fail closed: " + error.toString() + ")";

  cert.boundedness = checkBoundedness(cert);
  if (const FusionConfiguration* fusion = ctx.config.findFusion(subject.role())) {
    cert.normalization = checkNormalization(*fusion);
  } else {
    cert.normalization.detail = "no fusion configuration for role";
  }
  cert.completeness.detail = "evidence missing: " + error.toString();
  finish(cert);
  return cert;
}

CalibrationCertificate buildSkippedCertificate(const CertificateContext& ctx,
                                               const CalibrationSubject& subject,
                                               const LayerSet& active, const std::string& reason) {
  CalibrationCertificate cert = makeSkeleton(ctx, subject, active, CertificateStatus::Skipped);
  cert.skip_reason = reason;
  cert.expanded_formula = "Cal(I) = 0 (skipped: " + reason + ")";
  cert.boundedness.passed = true;
  cert.boundedness.detail = "not evaluated";
  cert.normalization.detail = "not evaluated";
  cert.completeness.detail = "not evaluated";
  finish(cert);
  return cert;
}

}  // namespace calib
