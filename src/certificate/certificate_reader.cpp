// Certificate JSON reader.

#include "certificate/certificate_reader.h"

#include <fstream>
#include <sstream>
#include <utility>

#include "core/json_parser.h"

namespace calib {

namespace {

bool statusFromString(const std::string& str, CertificateStatus& out) {
  for (CertificateStatus status :
       {CertificateStatus::Scored, CertificateStatus::FailClosed, CertificateStatus::Skipped}) {
    if (str == certificateStatusToString(status)) {
      out = status;
      return true;
    }
  }
  return false;
}

/// Walks the certificate tree and keeps the first path-tagged error.
class CertificateReader {
 public:
  explicit CertificateReader(std::string& error) : error_(error) { error_.clear(); }

  bool ok() const { return error_.empty(); }

  void fail(const std::string& path, const std::string& message) {
    if (ok()) error_ = path + ": " + message;
  }

  const JsonValue* require(const JsonValue& obj, const std::string& path, const char* key,
                           JsonValue::Type type, const char* expected) {
    if (!ok()) return nullptr;
    const JsonValue* val = obj.find(key);
    if (!val) {
      fail(path + "." + key, "required field is absent");
      return nullptr;
    }
    if (val->type != type) {
      fail(path + "." + key, std::string("expected ") + expected);
      return nullptr;
    }
    return val;
  }

  const JsonValue* object(const JsonValue& obj, const std::string& path, const char* key) {
    return require(obj, path, key, JsonValue::Object, "an object");
  }

  void readString(const JsonValue& obj, const std::string& path, const char* key,
                  std::string& out) {
    if (const JsonValue* val = require(obj, path, key, JsonValue::String, "a string")) {
      out = val->string_val;
    }
  }

  void readNumber(const JsonValue& obj, const std::string& path, const char* key, double& out) {
    if (const JsonValue* val = require(obj, path, key, JsonValue::Number, "a number")) {
      out = val->number_val;
    }
  }

  void readBool(const JsonValue& obj, const std::string& path, const char* key, bool& out) {
    if (const JsonValue* val = require(obj, path, key, JsonValue::Bool, "a boolean")) {
      out = val->bool_val;
    }
  }

  void readLayer(const std::string& text, const std::string& path, CanonicalLayer& out) {
    if (!ok()) return;
    if (!layerFromString(text, out)) fail(path, "unknown layer '" + text + "'");
  }

  void readLayerList(const JsonValue& obj, const std::string& path, const char* key,
                     LayerSet& out) {
    const JsonValue* list = require(obj, path, key, JsonValue::Array, "an array");
    if (!list) return;
    std::string list_path = path + "." + key;
    for (size_t idx = 0; idx < list->array_items.size() && ok(); ++idx) {
      const JsonValue& item = list->array_items[idx];
      std::string item_path = list_path + "[" + std::to_string(idx) + "]";
      if (!item.isString()) {
        fail(item_path, "expected a layer name");
        return;
      }
      CanonicalLayer layer = CanonicalLayer::Base;
      readLayer(item.string_val, item_path, layer);
      out.push_back(layer);
    }
  }

  void readCheck(const JsonValue& checks, const std::string& path, const char* key,
                 ValidationCheck& out) {
    const JsonValue* check = object(checks, path, key);
    if (!check) return;
    std::string check_path = path + "." + key;
    readBool(*check, check_path, "passed", out.passed);
    readString(*check, check_path, "detail", out.detail);
    if (check->has("missing_layers")) {
      readLayerList(*check, check_path, "missing_layers", out.missing_layers);
    }
  }

 private:
  std::string& error_;
};

void readLayerBreakdown(CertificateReader& reader, const JsonValue& root,
                        CalibrationCertificate& cert) {
  const JsonValue* breakdown = reader.object(root, "certificate", "layer_breakdown");
  if (!breakdown) return;
  for (const auto& [name, entry] : breakdown->members) {
    std::string path = "certificate.layer_breakdown." + name;
    if (!entry.isObject()) return reader.fail(path, "expected an object");
    LayerScore score;
    reader.readLayer(name, path, score.layer);
    reader.readNumber(entry, path, "score", score.value);
    reader.readString(entry, path, "formula", score.formula);
    reader.readString(entry, path, "rationale", score.rationale);
    if (const JsonValue* evidence = reader.object(entry, path, "evidence")) {
      for (const auto& [field, text] : evidence->members) {
        if (!text.isString()) return reader.fail(path + ".evidence." + field, "expected a string");
        score.evidence[field] = text.string_val;
      }
    }
    if (const JsonValue* components = reader.object(entry, path, "components")) {
      for (const auto& [field, val] : components->members) {
        if (!val.isNumber()) {
          return reader.fail(path + ".components." + field, "expected a number");
        }
        score.components[field] = val.number_val;
      }
    }
    if (!reader.ok()) return;
    cert.layer_scores.push_back(std::move(score));
  }
}

/// "(@a,@b)" -> the two layers.
void readInteractionLabel(CertificateReader& reader, const std::string& label,
                          const std::string& path, FusionTerm& term) {
  size_t comma = label.find(',');
  if (label.size() < 5 || label.front() != '(' || label.back() != ')' ||
      comma == std::string::npos) {
    return reader.fail(path, "malformed interaction label '" + label + "'");
  }
  reader.readLayer(label.substr(1, comma - 1), path, term.layer_a);
  reader.readLayer(label.substr(comma + 1, label.size() - comma - 2), path, term.layer_b);
}

void readFusion(CertificateReader& reader, const JsonValue& root, CalibrationCertificate& cert) {
  const JsonValue* fusion = reader.object(root, "certificate", "fusion_formula");
  const JsonValue* interactions = reader.object(root, "certificate", "interaction_breakdown");
  if (!fusion || !interactions) return;
  const std::string path = "certificate.fusion_formula";
  reader.readString(*fusion, path, "symbolic", cert.symbolic_formula);
  reader.readString(*fusion, path, "expanded", cert.expanded_formula);
  reader.readNumber(*fusion, path, "linear_sum", cert.linear_sum);
  reader.readNumber(*fusion, path, "interaction_sum", cert.interaction_sum);

  const JsonValue* trace =
      reader.require(*fusion, path, "computation_trace", JsonValue::Array, "an array");
  if (!trace) return;
  for (size_t idx = 0; idx < trace->array_items.size() && reader.ok(); ++idx) {
    const JsonValue& entry = trace->array_items[idx];
    std::string term_path = path + ".computation_trace[" + std::to_string(idx) + "]";
    if (!entry.isObject()) return reader.fail(term_path, "expected an object");
    FusionTerm term;
    std::string kind;
    reader.readString(entry, term_path, "term", term.label);
    reader.readString(entry, term_path, "kind", kind);
    reader.readNumber(entry, term_path, "weight", term.weight);
    reader.readNumber(entry, term_path, "input", term.input);
    reader.readNumber(entry, term_path, "contribution", term.contribution);
    if (!reader.ok()) return;

    if (kind == "linear") {
      term.kind = FusionTermKind::Linear;
      reader.readLayer(term.label, term_path + ".term", term.layer_a);
      term.layer_b = term.layer_a;
    } else if (kind == "interaction") {
      term.kind = FusionTermKind::Interaction;
      readInteractionLabel(reader, term.label, term_path + ".term", term);
      const JsonValue* detail = interactions->find(term.label);
      if (!detail || !detail->isObject()) {
        return reader.fail("certificate.interaction_breakdown." + term.label,
                           "missing entry for traced interaction");
      }
      reader.readString(*detail, "certificate.interaction_breakdown." + term.label,
                        "interpretation", term.rationale);
    } else {
      return reader.fail(term_path + ".kind", "unknown term kind '" + kind + "'");
    }
    cert.trace.push_back(std::move(term));
  }
}

void readProvenance(CertificateReader& reader, const JsonValue& root,
                    CalibrationCertificate& cert) {
  const JsonValue* provenance = reader.object(root, "certificate", "parameter_provenance");
  if (!provenance) return;
  for (const auto& [name, entry] : provenance->members) {
    std::string path = "certificate.parameter_provenance." + name;
    if (!entry.isObject()) return reader.fail(path, "expected an object");
    ParameterProvenance param;
    param.name = name;
    reader.readNumber(entry, path, "value", param.value);
    reader.readString(entry, path, "source", param.source);
    reader.readString(entry, path, "version", param.version);
    if (!reader.ok()) return;
    cert.provenance.push_back(std::move(param));
  }
}

void readSensitivity(CertificateReader& reader, const JsonValue& root,
                     CalibrationCertificate& cert) {
  const JsonValue* sens = reader.object(root, "certificate", "sensitivity_analysis");
  if (!sens) return;
  const std::string path = "certificate.sensitivity_analysis";
  SensitivityAnalysis& out = cert.sensitivity;

  const JsonValue* layer = sens->find("most_impactful_layer");
  if (!layer) return reader.fail(path + ".most_impactful_layer", "required field is absent");
  if (layer->isString()) {
    out.has_layer = true;
    reader.readLayer(layer->string_val, path + ".most_impactful_layer",
                     out.most_impactful_layer);
  } else if (!layer->isNull()) {
    return reader.fail(path + ".most_impactful_layer", "expected a layer name or null");
  }
  reader.readNumber(*sens, path, "layer_marginal_gain", out.layer_marginal_gain);

  const JsonValue* pair = sens->find("most_impactful_interaction");
  if (!pair) return reader.fail(path + ".most_impactful_interaction", "required field is absent");
  if (pair->isString()) {
    out.has_interaction = true;
    out.most_impactful_interaction = pair->string_val;
  } else if (!pair->isNull()) {
    return reader.fail(path + ".most_impactful_interaction", "expected a string or null");
  }
  reader.readNumber(*sens, path, "interaction_attainable_gain", out.interaction_attainable_gain);
}

}  // namespace

bool parseCertificateJson(const std::string& text, CalibrationCertificate& out,
                          std::string& error) {
  JsonValue root;
  std::string parse_error;
  if (!parseJson(text, root, parse_error)) {
    error = "certificate: " + parse_error;
    return false;
  }
  if (!root.isObject()) {
    error = "certificate: expected an object";
    return false;
  }

  CalibrationCertificate cert;
  CertificateReader reader(error);
  const std::string path = "certificate";

  std::string status;
  std::string role;
  reader.readString(root, path, "instance_id", cert.instance_id);
  reader.readString(root, path, "status", status);
  if (reader.ok() && !statusFromString(status, cert.status)) {
    reader.fail(path + ".status", "unknown status '" + status + "'");
  }
  reader.readString(root, path, "method", cert.method_id);
  reader.readString(root, path, "node", cert.node_id);
  reader.readString(root, path, "role", role);
  if (reader.ok() && !roleFromString(role, cert.role)) {
    reader.fail(path + ".role", "unknown role '" + role + "'");
  }
  if (root.has("interplay_group")) {
    reader.readString(root, path, "interplay_group", cert.interplay_group);
  }

  if (const JsonValue* context = reader.object(root, path, "context")) {
    const std::string ctx_path = path + ".context";
    reader.readString(*context, ctx_path, "question", cert.context.question_id);
    reader.readString(*context, ctx_path, "dimension", cert.context.dimension);
    reader.readString(*context, ctx_path, "policy", cert.context.policy_area);
    reader.readNumber(*context, ctx_path, "unit_quality", cert.context.unit_quality);
  }

  reader.readNumber(root, path, "calibration_score", cert.calibration_score);
  reader.readLayerList(root, path, "active_layers", cert.active_layers);
  readLayerBreakdown(reader, root, cert);
  readFusion(reader, root, cert);
  readProvenance(reader, root, cert);

  if (const JsonValue* checks = reader.object(root, path, "validation_checks")) {
    const std::string checks_path = path + ".validation_checks";
    reader.readCheck(*checks, checks_path, "boundedness", cert.boundedness);
    reader.readCheck(*checks, checks_path, "normalization", cert.normalization);
    reader.readCheck(*checks, checks_path, "completeness", cert.completeness);
  }
  readSensitivity(reader, root, cert);

  if (reader.ok() && cert.status == CertificateStatus::FailClosed) {
    if (const JsonValue* evidence = reader.object(root, path, "evidence_error")) {
      const std::string err_path = path + ".evidence_error";
      std::string layer;
      reader.readString(*evidence, err_path, "layer", layer);
      reader.readLayer(layer, err_path + ".layer", cert.evidence_error.layer);
      reader.readString(*evidence, err_path, "field", cert.evidence_error.field);
      reader.readString(*evidence, err_path, "message", cert.evidence_error.message);
    }
  }
  if (reader.ok() && cert.status == CertificateStatus::Skipped) {
    reader.readString(root, path, "skip_reason", cert.skip_reason);
  }

  if (const JsonValue* audit = reader.object(root, path, "audit_trail")) {
    const std::string audit_path = path + ".audit_trail";
    reader.readString(*audit, audit_path, "timestamp", cert.timestamp);
    reader.readString(*audit, audit_path, "config_hash", cert.config_hash);
    reader.readString(*audit, audit_path, "graph_hash", cert.graph_hash);
    reader.readString(*audit, audit_path, "registry_version", cert.registry_version);
    reader.readString(*audit, audit_path, "validator_version", cert.validator_version);
  }

  if (!reader.ok()) return false;
  out = std::move(cert);
  return true;
}

bool loadCertificateFile(const std::string& path, CalibrationCertificate& out,
                         std::string& error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "cannot open " + path;
    return false;
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  if (!parseCertificateJson(contents.str(), out, error)) {
    error = path + ": " + error;
    return false;
  }
  return true;
}

}  // namespace calib
