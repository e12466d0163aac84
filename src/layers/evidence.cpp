// Implementation of evidence parsing and chain-contract derivation.

#include "layers/evidence.h"

#include <cmath>
#include <limits>
#include <utility>

namespace calib {

std::string EvidenceError::toString() const {
  return std::string(layerToString(layer)) + "." + field + ": " + message;
}

// ---------------------------------------------------------------------------
// Chain derivation
// ---------------------------------------------------------------------------

namespace {

/// Declared type conflicts with the provided one (untyped never conflicts).
bool typeConflict(const InputSignature& signature, const std::string& input,
                  const std::string& provided_type) {
  auto iter = signature.input_types.find(input);
  if (iter == signature.input_types.end() || iter->second.empty()) return false;
  if (provided_type.empty()) return false;
  return iter->second != provided_type;
}

}  // namespace

ChainEvidence deriveChainEvidence(const InputSignature* signature,
                                  const std::map<std::string, std::string>& provided) {
  ChainEvidence evidence;
  if (!signature) {
    evidence.hard_mismatch = true;
    evidence.details.push_back("no declared input signature");
    return evidence;
  }

  for (const auto& input : signature->required_inputs) {
    auto iter = provided.find(input);
    if (iter == provided.end()) {
      evidence.hard_mismatch = true;
      evidence.details.push_back("required input '" + input + "' missing");
    } else if (typeConflict(*signature, input, iter->second)) {
      evidence.hard_mismatch = true;
      evidence.details.push_back("required input '" + input + "' has type '" + iter->second +
                                 "', expected '" + signature->input_types.at(input) + "'");
    }
  }

  for (const auto& input : signature->beneficial_inputs) {
    auto iter = provided.find(input);
    if (iter == provided.end()) {
      evidence.missing_beneficial = true;
      evidence.details.push_back("beneficial input '" + input + "' missing");
    } else if (typeConflict(*signature, input, iter->second)) {
      evidence.schema_deviation = true;
      evidence.details.push_back("input '" + input + "' deviates from declared type");
    }
  }

  for (const auto& input : signature->optional_inputs) {
    auto iter = provided.find(input);
    if (iter == provided.end()) {
      ++evidence.warning_count;
      evidence.details.push_back("optional input '" + input + "' missing");
    } else if (typeConflict(*signature, input, iter->second)) {
      evidence.schema_deviation = true;
      evidence.details.push_back("input '" + input + "' deviates from declared type");
    }
  }
  return evidence;
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

namespace {

/// Collects the first missing or mistyped field as an EvidenceError.
class SectionReader {
 public:
  SectionReader(const JsonValue& section, CanonicalLayer layer, EvidenceParseResult& result)
      : section_(section), layer_(layer), result_(result) {}

  bool ok() const { return result_.success; }

  void readBool(const char* field, bool& out) {
    if (!ok()) return;
    const JsonValue* val = section_.find(field);
    if (!val) return fail(field, "required field is absent");
    if (!val->isBool()) return fail(field, "expected a boolean");
    out = val->bool_val;
  }

  void readNumber(const char* field, double& out) {
    if (!ok()) return;
    const JsonValue* val = section_.find(field);
    if (!val) return fail(field, "required field is absent");
    if (!val->isNumber()) return fail(field, "expected a number");
    out = val->number_val;
  }

  void readCount(const char* field, int& out) {
    double val = 0.0;
    readNumber(field, val);
    if (!ok()) return;
    if (val < 0.0) return fail(field, "expected a non-negative count");
    if (val != std::floor(val)) return fail(field, "expected a whole count");
    if (val > static_cast<double>(std::numeric_limits<int>::max())) {
      return fail(field, "count is out of range");
    }
    out = static_cast<int>(val);
  }

  void fail(const char* field, const std::string& message) {
    result_.success = false;
    result_.error.layer = layer_;
    result_.error.field = field;
    result_.error.message = message;
  }

 private:
  const JsonValue& section_;
  CanonicalLayer layer_;
  EvidenceParseResult& result_;
};

void parseChain(const JsonValue& section, const MethodDeclaration* method,
                EvidenceParseResult& result) {
  SectionReader reader(section, CanonicalLayer::Chain, result);
  ChainEvidence chain;
  if (const JsonValue* provided = section.find("provided_inputs")) {
    if (!provided->isObject()) return reader.fail("provided_inputs", "expected an object");
    std::map<std::string, std::string> inputs;
    for (const auto& member : provided->members) inputs[member.first] = member.second.asString();
    chain = deriveChainEvidence(method ? &method->signature : nullptr, inputs);
  } else {
    reader.readBool("hard_mismatch", chain.hard_mismatch);
    reader.readBool("missing_beneficial", chain.missing_beneficial);
    reader.readBool("schema_deviation", chain.schema_deviation);
    reader.readCount("warning_count", chain.warning_count);
  }
  if (reader.ok()) result.bundle.chain = std::move(chain);
}

void parseUnit(const JsonValue& section, EvidenceParseResult& result) {
  SectionReader reader(section, CanonicalLayer::Unit, result);
  UnitEvidence unit;
  reader.readNumber("structural_compliance", unit.structural_compliance);
  reader.readBool("indicator_matrix_present", unit.indicator_matrix_present);
  reader.readBool("ppi_matrix_present", unit.ppi_matrix_present);
  if (reader.ok() && !(unit.structural_compliance >= 0.0 && unit.structural_compliance <= 1.0)) {
    reader.fail("structural_compliance", "expected a value in [0, 1]");
  }
  if (reader.ok()) result.bundle.unit = unit;
}

void parseCongruence(const JsonValue& section, EvidenceParseResult& result) {
  SectionReader reader(section, CanonicalLayer::Congruence, result);
  const JsonValue* inputs = section.find("provided_inputs");
  if (!inputs) return reader.fail("provided_inputs", "required field is absent");
  if (!inputs->isArray()) return reader.fail("provided_inputs", "expected an array of strings");
  CongruenceEvidence congruence;
  for (const auto& item : inputs->array_items) {
    if (!item.isString()) return reader.fail("provided_inputs", "expected an array of strings");
    congruence.provided_inputs.push_back(item.string_val);
  }
  result.bundle.congruence = std::move(congruence);
}

void parseMeta(const JsonValue& section, EvidenceParseResult& result) {
  SectionReader reader(section, CanonicalLayer::Meta, result);
  MetaEvidence meta;
  reader.readBool("formula_exported", meta.formula_exported);
  reader.readBool("trace_complete", meta.trace_complete);
  reader.readBool("logs_schema_conformant", meta.logs_schema_conformant);
  reader.readBool("version_tagged", meta.version_tagged);
  reader.readBool("config_hash_matches", meta.config_hash_matches);
  reader.readBool("signature_valid", meta.signature_valid);
  reader.readNumber("runtime_ms", meta.runtime_ms);
  reader.readNumber("memory_mb", meta.memory_mb);
  if (reader.ok()) result.bundle.meta = meta;
}

}  // namespace

EvidenceParseResult parseEvidenceBundle(const JsonValue& value,
                                        const MethodDeclaration* method) {
  EvidenceParseResult result;
  result.success = true;
  if (value.isNull()) return result;
  if (!value.isObject()) {
    result.success = false;
    result.error.field = "evidence";
    result.error.message = "expected an object";
    return result;
  }

  struct Section {
    const char* key;
    CanonicalLayer layer;
  };
  const Section sections[] = {{"chain", CanonicalLayer::Chain},
                              {"unit", CanonicalLayer::Unit},
                              {"congruence", CanonicalLayer::Congruence},
                              {"meta", CanonicalLayer::Meta}};
  for (const auto& entry : sections) {
    const JsonValue* section = value.find(entry.key);
    if (!section) continue;
    if (!section->isObject()) {
      result.success = false;
      result.error.layer = entry.layer;
      result.error.field = entry.key;
      result.error.message = "expected an object";
      return result;
    }
    switch (entry.layer) {
      case CanonicalLayer::Chain:      parseChain(*section, method, result); break;
      case CanonicalLayer::Unit:       parseUnit(*section, result); break;
      case CanonicalLayer::Congruence: parseCongruence(*section, result); break;
      case CanonicalLayer::Meta:       parseMeta(*section, result); break;
      case CanonicalLayer::Base:
      case CanonicalLayer::Question:
      case CanonicalLayer::Dimension:
      case CanonicalLayer::Policy:
        break;
    }
    if (!result.success) return result;
  }
  return result;
}

}  // namespace calib
