// Certificate serialization and verification.

#include "certificate/calibration_certificate.h"

#include <algorithm>

#include "core/json_helpers.h"
#include "core/sha256.h"

namespace calib {

const char* certificateStatusToString(CertificateStatus status) {
  switch (status) {
    case CertificateStatus::Scored:     return "scored";
    case CertificateStatus::FailClosed: return "fail_closed";
    case CertificateStatus::Skipped:    return "skipped";
  }
  return "unknown";
}

const LayerScore* CalibrationCertificate::findLayerScore(CanonicalLayer layer) const {
  for (const auto& score : layer_scores) {
    if (score.layer == layer) return &score;
  }
  return nullptr;
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

namespace {

void writeCheck(JsonWriter& writer, const char* name, const ValidationCheck& check) {
  writer.key(name);
  writer.beginObject();
  writer.key("passed");
  writer.value(check.passed);
  writer.key("detail");
  writer.value(std::string_view(check.detail));
  if (!check.missing_layers.empty()) {
    writer.key("missing_layers");
    writer.beginArray();
    for (CanonicalLayer layer : check.missing_layers) writer.value(layerToString(layer));
    writer.endArray();
  }
  writer.endObject();
}

void writeLayerScore(JsonWriter& writer, const LayerScore& score) {
  writer.key(layerToString(score.layer));
  writer.beginObject();
  writer.key("score");
  writer.value(score.value);
  writer.key("evidence");
  writer.beginObject();
  for (const auto& [name, text] : score.evidence) {
    writer.key(name);
    writer.value(std::string_view(text));
  }
  writer.endObject();
  writer.key("formula");
  writer.value(std::string_view(score.formula));
  writer.key("rationale");
  writer.value(std::string_view(score.rationale));
  writer.key("components");
  writer.beginObject();
  for (const auto& [name, component] : score.components) {
    writer.key(name);
    writer.value(component);
  }
  writer.endObject();
  writer.endObject();
}

std::string interactionFormula(const CalibrationCertificate& cert, const FusionTerm& term) {
  const LayerScore* score_a = cert.findLayerScore(term.layer_a);
  const LayerScore* score_b = cert.findLayerScore(term.layer_b);
  return formatNumber(term.weight) + "*min(" + formatNumber(score_a ? score_a->value : 0.0) +
         ", " + formatNumber(score_b ? score_b->value : 0.0) + ")";
}

void writeCertificate(JsonWriter& writer, const CalibrationCertificate& cert) {
  writer.beginObject();
  writer.key("instance_id");
  writer.value(std::string_view(cert.instance_id));
  writer.key("status");
  writer.value(certificateStatusToString(cert.status));
  writer.key("method");
  writer.value(std::string_view(cert.method_id));
  writer.key("node");
  writer.value(std::string_view(cert.node_id));
  writer.key("role");
  writer.value(roleToString(cert.role));
  if (!cert.interplay_group.empty()) {
    writer.key("interplay_group");
    writer.value(std::string_view(cert.interplay_group));
  }

  writer.key("context");
  writer.beginObject();
  writer.key("question");
  writer.value(std::string_view(cert.context.question_id));
  writer.key("dimension");
  writer.value(std::string_view(cert.context.dimension));
  writer.key("policy");
  writer.value(std::string_view(cert.context.policy_area));
  writer.key("unit_quality");
  writer.value(cert.context.unit_quality);
  writer.endObject();

  writer.key("calibration_score");
  writer.value(cert.calibration_score);

  writer.key("active_layers");
  writer.beginArray();
  for (CanonicalLayer layer : cert.active_layers) writer.value(layerToString(layer));
  writer.endArray();

  writer.key("layer_breakdown");
  writer.beginObject();
  for (const auto& score : cert.layer_scores) writeLayerScore(writer, score);
  writer.endObject();

  writer.key("interaction_breakdown");
  writer.beginObject();
  for (const auto& term : cert.trace) {
    if (term.kind != FusionTermKind::Interaction) continue;
    writer.key(term.label);
    writer.beginObject();
    writer.key("contribution");
    writer.value(term.contribution);
    writer.key("formula");
    writer.value(interactionFormula(cert, term));
    writer.key("interpretation");
    writer.value(std::string_view(term.rationale));
    writer.endObject();
  }
  writer.endObject();

  writer.key("fusion_formula");
  writer.beginObject();
  writer.key("symbolic");
  writer.value(std::string_view(cert.symbolic_formula));
  writer.key("expanded");
  writer.value(std::string_view(cert.expanded_formula));
  writer.key("linear_sum");
  writer.value(cert.linear_sum);
  writer.key("interaction_sum");
  writer.value(cert.interaction_sum);
  writer.key("computation_trace");
  writer.beginArray();
  for (const auto& term : cert.trace) {
    writer.beginObject();
    writer.key("term");
    writer.value(std::string_view(term.label));
    writer.key("kind");
    writer.value(term.kind == FusionTermKind::Linear ? "linear" : "interaction");
    writer.key("weight");
    writer.value(term.weight);
    writer.key("input");
    writer.value(term.input);
    writer.key("contribution");
    writer.value(term.contribution);
    writer.endObject();
  }
  writer.endArray();
  writer.endObject();

  writer.key("parameter_provenance");
  writer.beginObject();
  for (const auto& param : cert.provenance) {
    writer.key(param.name);
    writer.beginObject();
    writer.key("value");
    writer.value(param.value);
    writer.key("source");
    writer.value(std::string_view(param.source));
    writer.key("version");
    writer.value(std::string_view(param.version));
    writer.endObject();
  }
  writer.endObject();

  writer.key("validation_checks");
  writer.beginObject();
  writeCheck(writer, "boundedness", cert.boundedness);
  writeCheck(writer, "normalization", cert.normalization);
  writeCheck(writer, "completeness", cert.completeness);
  writer.endObject();

  writer.key("sensitivity_analysis");
  writer.beginObject();
  writer.key("most_impactful_layer");
  if (cert.sensitivity.has_layer) {
    writer.value(layerToString(cert.sensitivity.most_impactful_layer));
  } else {
    writer.valueNull();
  }
  writer.key("layer_marginal_gain");
  writer.value(cert.sensitivity.layer_marginal_gain);
  writer.key("most_impactful_interaction");
  if (cert.sensitivity.has_interaction) {
    writer.value(std::string_view(cert.sensitivity.most_impactful_interaction));
  } else {
    writer.valueNull();
  }
  writer.key("interaction_attainable_gain");
  writer.value(cert.sensitivity.interaction_attainable_gain);
  writer.endObject();

  if (cert.status == CertificateStatus::FailClosed) {
    writer.key("evidence_error");
    writer.beginObject();
    writer.key("layer");
    writer.value(layerToString(cert.evidence_error.layer));
    writer.key("field");
    writer.value(std::string_view(cert.evidence_error.field));
    writer.key("message");
    writer.value(std::string_view(cert.evidence_error.message));
    writer.endObject();
  }
  if (cert.status == CertificateStatus::Skipped) {
    writer.key("skip_reason");
    writer.value(std::string_view(cert.skip_reason));
  }

  writer.key("audit_trail");
  writer.beginObject();
  writer.key("timestamp");
  writer.value(std::string_view(cert.timestamp));
  writer.key("config_hash");
  writer.value(std::string_view(cert.config_hash));
  writer.key("graph_hash");
  writer.value(std::string_view(cert.graph_hash));
  writer.key("registry_version");
  writer.value(std::string_view(cert.registry_version));
  writer.key("validator_version");
  writer.value(std::string_view(cert.validator_version));
  writer.endObject();

  writer.endObject();
}

}  // namespace

std::string certificateToJson(const CalibrationCertificate& cert, bool pretty) {
  JsonWriter writer;
  writeCertificate(writer, cert);
  return pretty ? writer.toPrettyString() : writer.toString();
}

std::string computeInstanceId(const CalibrationCertificate& cert) {
  CalibrationCertificate content = cert;
  content.instance_id.clear();
  return sha256Tagged(certificateToJson(content, false));
}

// ---------------------------------------------------------------------------
// Verification
// ---------------------------------------------------------------------------

CertificateVerification verifyCertificate(const CalibrationCertificate& cert) {
  CertificateVerification result;

  if (cert.status != CertificateStatus::Scored) {
    if (cert.calibration_score != 0.0 || !cert.trace.empty()) {
      result.error_message = std::string(certificateStatusToString(cert.status)) +
                             " certificate must have score 0 and an empty trace";
      return result;
    }
  }

  for (const auto& term : cert.trace) {
    switch (term.kind) {
      case FusionTermKind::Linear: {
        const LayerScore* score = cert.findLayerScore(term.layer_a);
        if (!score || score->value != term.input) {
          result.error_message = "linear term " + term.label + " does not match its layer score";
          return result;
        }
        break;
      }
      case FusionTermKind::Interaction: {
        const LayerScore* score_a = cert.findLayerScore(term.layer_a);
        const LayerScore* score_b = cert.findLayerScore(term.layer_b);
        if (!score_a || !score_b ||
            term.input != std::min(score_a->value, score_b->value)) {
          result.error_message = "interaction term " + term.label +
                                 " does not match min of its layer scores";
          return result;
        }
        break;
      }
    }
  }

  double linear_sum = 0.0;
  double interaction_sum = 0.0;
  double replayed = replayFusionTrace(cert.trace, linear_sum, interaction_sum);
  if (linear_sum != cert.linear_sum || interaction_sum != cert.interaction_sum) {
    result.error_message = "replayed sums differ from recorded sums";
    return result;
  }
  if (replayed != cert.calibration_score) {
    result.error_message = "replayed score " + formatNumber(replayed, 17) +
                           " differs from recorded " + formatNumber(cert.calibration_score, 17);
    return result;
  }

  if (computeInstanceId(cert) != cert.instance_id) {
    result.error_message = "instance_id does not match certificate content";
    return result;
  }

  result.success = true;
  return result;
}

}  // namespace calib
