// Implementation of configuration helpers and canonical serialization.

#include "config/calibration_config.h"

#include <algorithm>
#include <cmath>

#include "core/json_helpers.h"

namespace calib {

// ---------------------------------------------------------------------------
// Enum conversions
// ---------------------------------------------------------------------------

const char* unitTransformKindToString(UnitTransformKind kind) {
  switch (kind) {
    case UnitTransformKind::Identity:        return "identity";
    case UnitTransformKind::PiecewiseLinear: return "piecewise_linear";
    case UnitTransformKind::Sigmoidal:       return "sigmoidal";
    case UnitTransformKind::Constant:        return "constant";
  }
  return "unknown";
}

bool unitTransformKindFromString(const std::string& str, UnitTransformKind& out) {
  if (str == "identity") {
    out = UnitTransformKind::Identity;
  } else if (str == "piecewise_linear") {
    out = UnitTransformKind::PiecewiseLinear;
  } else if (str == "sigmoidal") {
    out = UnitTransformKind::Sigmoidal;
  } else if (str == "constant") {
    out = UnitTransformKind::Constant;
  } else {
    return false;
  }
  return true;
}

const char* compatibilityTierToString(CompatibilityTier tier) {
  switch (tier) {
    case CompatibilityTier::Primary:      return "primary";
    case CompatibilityTier::Secondary:    return "secondary";
    case CompatibilityTier::Compatible:   return "compatible";
    case CompatibilityTier::Undeclared:   return "undeclared";
    case CompatibilityTier::Incompatible: return "incompatible";
  }
  return "unknown";
}

bool compatibilityTierFromString(const std::string& str, CompatibilityTier& out) {
  if (str == "primary") {
    out = CompatibilityTier::Primary;
  } else if (str == "secondary") {
    out = CompatibilityTier::Secondary;
  } else if (str == "compatible") {
    out = CompatibilityTier::Compatible;
  } else if (str == "undeclared") {
    out = CompatibilityTier::Undeclared;
  } else if (str == "incompatible") {
    out = CompatibilityTier::Incompatible;
  } else {
    return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// Rubric helpers
// ---------------------------------------------------------------------------

double UnitTransform::apply(double unit_quality) const {
  switch (kind) {
    case UnitTransformKind::Identity:
      return unit_quality;
    case UnitTransformKind::PiecewiseLinear:
      if (unit_quality < abort_threshold) return 0.0;
      if (unit_quality >= saturation_threshold) return 1.0;
      return slope * unit_quality + offset;
    case UnitTransformKind::Sigmoidal:
      // Floored at 0 for U below the midpoint.
      return std::max(0.0, 1.0 - std::exp(-k * (unit_quality - x0)));
    case UnitTransformKind::Constant:
      return value;
  }
  return 0.0;
}

std::string UnitTransform::formula() const {
  switch (kind) {
    case UnitTransformKind::Identity:
      return "g(U) = U";
    case UnitTransformKind::PiecewiseLinear:
      return "g(U) = 0 if U < " + formatNumber(abort_threshold) + "; 1 if U >= " +
             formatNumber(saturation_threshold) + "; else " + formatNumber(slope) +
             "*U + " + formatNumber(offset);
    case UnitTransformKind::Sigmoidal:
      return "g(U) = max(0, 1 - exp(-" + formatNumber(k) + "*(U - " + formatNumber(x0) +
             ")))";
    case UnitTransformKind::Constant:
      return "g(U) = " + formatNumber(value);
  }
  return "";
}

double ContextualTiers::valueOf(CompatibilityTier tier) const {
  switch (tier) {
    case CompatibilityTier::Primary:      return primary;
    case CompatibilityTier::Secondary:    return secondary;
    case CompatibilityTier::Compatible:   return compatible;
    case CompatibilityTier::Undeclared:   return undeclared;
    case CompatibilityTier::Incompatible: return incompatible;
  }
  return undeclared;
}

// ---------------------------------------------------------------------------
// Fusion
// ---------------------------------------------------------------------------

std::string InteractionTerm::label() const {
  return std::string("(") + layerToString(layer_a) + "," + layerToString(layer_b) + ")";
}

double FusionConfiguration::linearWeight(CanonicalLayer layer) const {
  auto iter = linear_weights.find(layer);
  return iter == linear_weights.end() ? 0.0 : iter->second;
}

double FusionConfiguration::linearTotal() const {
  double total = 0.0;
  for (const auto& entry : linear_weights) total += entry.second;
  return total;
}

double FusionConfiguration::interactionTotal() const {
  double total = 0.0;
  for (const auto& term : interactions) total += term.weight;
  return total;
}

// ---------------------------------------------------------------------------
// Decision policy and declarations
// ---------------------------------------------------------------------------

double DecisionPolicy::thresholdFor(const std::string& method_id, MethodRole role) const {
  auto method_iter = method_thresholds.find(method_id);
  if (method_iter != method_thresholds.end()) return method_iter->second;
  auto role_iter = role_thresholds.find(role);
  if (role_iter != role_thresholds.end()) return role_iter->second;
  return default_threshold;
}

std::string OutputRange::toString() const {
  return "[" + formatNumber(min) + "," + formatNumber(max) + "]";
}

CompatibilityTier MethodDeclaration::compatibility(CanonicalLayer layer,
                                                   const std::string& key) const {
  const std::map<std::string, CompatibilityTier>* table = nullptr;
  switch (layer) {
    case CanonicalLayer::Question:  table = &question_compat; break;
    case CanonicalLayer::Dimension: table = &dimension_compat; break;
    case CanonicalLayer::Policy:    table = &policy_compat; break;
    case CanonicalLayer::Base:
    case CanonicalLayer::Chain:
    case CanonicalLayer::Unit:
    case CanonicalLayer::Congruence:
    case CanonicalLayer::Meta:
      return CompatibilityTier::Undeclared;
  }
  auto iter = table->find(key);
  return iter == table->end() ? CompatibilityTier::Undeclared : iter->second;
}

const MethodDeclaration* CalibrationConfig::findMethod(const std::string& method_id) const {
  auto iter = methods.find(method_id);
  return iter == methods.end() ? nullptr : &iter->second;
}

const FusionConfiguration* CalibrationConfig::findFusion(MethodRole role) const {
  auto iter = fusion.find(role);
  return iter == fusion.end() ? nullptr : &iter->second;
}

const InterplayGroup* CalibrationConfig::findGroup(const std::string& group_id) const {
  auto iter = interplay_groups.find(group_id);
  return iter == interplay_groups.end() ? nullptr : &iter->second;
}

const UnitTransform* CalibrationConfig::unitTransformFor(MethodRole role) const {
  for (const auto& transform : unit_transforms) {
    if (std::find(transform.roles.begin(), transform.roles.end(), role) !=
        transform.roles.end()) {
      return &transform;
    }
  }
  return nullptr;
}

bool CalibrationConfig::hasRangeTransform(const OutputRange& from,
                                          const OutputRange& to) const {
  for (const auto& transform : range_transforms) {
    if (transform.from == from && transform.to == to) return true;
  }
  return false;
}

// ---------------------------------------------------------------------------
// Canonical serialization
// ---------------------------------------------------------------------------

namespace {

void writeStringList(JsonWriter& writer, const std::vector<std::string>& items) {
  writer.beginArray();
  for (const auto& item : items) writer.value(item);
  writer.endArray();
}

void writeLayerList(JsonWriter& writer, const LayerSet& layers) {
  writer.beginArray();
  for (CanonicalLayer layer : layers) writer.value(layerToString(layer));
  writer.endArray();
}

void writeRange(JsonWriter& writer, const OutputRange& range) {
  writer.beginArray();
  writer.value(range.min);
  writer.value(range.max);
  writer.endArray();
}

void writeCompatTable(JsonWriter& writer,
                      const std::map<std::string, CompatibilityTier>& table) {
  writer.beginObject();
  for (const auto& entry : table) {
    writer.key(entry.first);
    writer.value(compatibilityTierToString(entry.second));
  }
  writer.endObject();
}

void writeTiers(JsonWriter& writer, const std::array<double, 4>& tiers) {
  writer.beginArray();
  for (double tier : tiers) writer.value(tier);
  writer.endArray();
}

void writeUnitTransform(JsonWriter& writer, const UnitTransform& transform) {
  writer.beginObject();
  writer.key("name");
  writer.value(transform.name);
  writer.key("kind");
  writer.value(unitTransformKindToString(transform.kind));
  writer.key("roles");
  writer.beginArray();
  for (MethodRole role : transform.roles) writer.value(roleToString(role));
  writer.endArray();
  switch (transform.kind) {
    case UnitTransformKind::Identity:
      break;
    case UnitTransformKind::PiecewiseLinear:
      writer.key("abort_threshold");
      writer.value(transform.abort_threshold);
      writer.key("slope");
      writer.value(transform.slope);
      writer.key("offset");
      writer.value(transform.offset);
      writer.key("saturation_threshold");
      writer.value(transform.saturation_threshold);
      break;
    case UnitTransformKind::Sigmoidal:
      writer.key("k");
      writer.value(transform.k);
      writer.key("x0");
      writer.value(transform.x0);
      break;
    case UnitTransformKind::Constant:
      writer.key("value");
      writer.value(transform.value);
      break;
  }
  writer.endObject();
}

void writeFusion(JsonWriter& writer, const FusionConfiguration& fusion) {
  writer.beginObject();
  writer.key("version");
  writer.value(fusion.version);
  writer.key("source");
  writer.value(fusion.source);
  writer.key("linear");
  writer.beginObject();
  for (const auto& entry : fusion.linear_weights) {
    writer.key(layerToString(entry.first));
    writer.value(entry.second);
  }
  writer.endObject();
  writer.key("interactions");
  writer.beginArray();
  for (const auto& term : fusion.interactions) {
    writer.beginObject();
    writer.key("layers");
    writer.beginArray();
    writer.value(layerToString(term.layer_a));
    writer.value(layerToString(term.layer_b));
    writer.endArray();
    writer.key("weight");
    writer.value(term.weight);
    writer.key("rationale");
    writer.value(term.rationale);
    writer.endObject();
  }
  writer.endArray();
  writer.endObject();
}

void writeMethod(JsonWriter& writer, const MethodDeclaration& method) {
  writer.beginObject();
  writer.key("role");
  writer.value(roleToString(method.role));
  writer.key("active_layers");
  writeLayerList(writer, method.active_layers);
  writer.key("justifications");
  writer.beginObject();
  for (const auto& entry : method.justifications) {
    writer.key(layerToString(entry.first));
    writer.value(entry.second);
  }
  writer.endObject();
  writer.key("question_compat");
  writeCompatTable(writer, method.question_compat);
  writer.key("dimension_compat");
  writeCompatTable(writer, method.dimension_compat);
  writer.key("policy_compat");
  writeCompatTable(writer, method.policy_compat);
  writer.key("output_range");
  writeRange(writer, method.output_range);
  writer.key("semantic_tags");
  writeStringList(writer, method.semantic_tags);
  writer.key("signature");
  writer.beginObject();
  writer.key("required_inputs");
  writeStringList(writer, method.signature.required_inputs);
  writer.key("beneficial_inputs");
  writeStringList(writer, method.signature.beneficial_inputs);
  writer.key("optional_inputs");
  writeStringList(writer, method.signature.optional_inputs);
  writer.key("input_types");
  writer.beginObject();
  for (const auto& entry : method.signature.input_types) {
    writer.key(entry.first);
    writer.value(entry.second);
  }
  writer.endObject();
  writer.endObject();
  writer.endObject();
}

}  // namespace

std::string canonicalConfigJson(const CalibrationConfig& config) {
  JsonWriter writer;
  writer.beginObject();

  writer.key("version");
  writer.value(config.version);

  writer.key("domain");
  writer.beginObject();
  writer.key("questions");
  writeStringList(writer, config.domain.questions);
  writer.key("dimensions");
  writeStringList(writer, config.domain.dimensions);
  writer.key("policy_areas");
  writeStringList(writer, config.domain.policy_areas);
  writer.endObject();

  writer.key("base_weights");
  writer.beginObject();
  writer.key("theory");
  writer.value(config.base_weights.theory);
  writer.key("impl");
  writer.value(config.base_weights.impl);
  writer.key("deploy");
  writer.value(config.base_weights.deploy);
  writer.endObject();

  writer.key("intrinsic_fallbacks");
  writer.beginObject();
  writer.key("pending");
  writer.value(config.intrinsic_fallbacks.pending);
  writer.key("none");
  writer.value(config.intrinsic_fallbacks.none);
  writer.endObject();

  writer.key("chain_rubric");
  writer.beginObject();
  writer.key("hard_mismatch");
  writer.value(config.chain.hard_mismatch);
  writer.key("missing_beneficial");
  writer.value(config.chain.missing_beneficial);
  writer.key("schema_deviation");
  writer.value(config.chain.schema_deviation);
  writer.key("warnings");
  writer.value(config.chain.warnings);
  writer.key("clean");
  writer.value(config.chain.clean);
  writer.endObject();

  writer.key("unit_transforms");
  writer.beginArray();
  for (const auto& transform : config.unit_transforms) writeUnitTransform(writer, transform);
  writer.endArray();

  writer.key("unit_gates");
  writer.beginObject();
  writer.key("min_structural_compliance");
  writer.value(config.unit_gates.min_structural_compliance);
  writer.key("require_ppi_matrix");
  writer.value(config.unit_gates.require_ppi_matrix);
  writer.key("require_indicator_matrix");
  writer.value(config.unit_gates.require_indicator_matrix);
  writer.endObject();

  writer.key("contextual_tiers");
  writer.beginObject();
  writer.key("primary");
  writer.value(config.contextual_tiers.primary);
  writer.key("secondary");
  writer.value(config.contextual_tiers.secondary);
  writer.key("compatible");
  writer.value(config.contextual_tiers.compatible);
  writer.key("undeclared");
  writer.value(config.contextual_tiers.undeclared);
  writer.key("incompatible");
  writer.value(config.contextual_tiers.incompatible);
  writer.endObject();

  const CongruenceRubric& cong = config.congruence;
  writer.key("congruence_rubric");
  writer.beginObject();
  writer.key("standalone_registered");
  writer.value(cong.standalone_registered);
  writer.key("standalone_unregistered");
  writer.value(cong.standalone_unregistered);
  writer.key("same_range");
  writer.value(cong.same_range);
  writer.key("convertible");
  writer.value(cong.convertible);
  writer.key("incompatible");
  writer.value(cong.incompatible);
  writer.key("fusion_complete");
  writer.value(cong.fusion_complete);
  writer.key("fusion_partial");
  writer.value(cong.fusion_partial);
  writer.key("fusion_missing");
  writer.value(cong.fusion_missing);
  writer.endObject();

  const MetaRubric& meta = config.meta;
  writer.key("meta_rubric");
  writer.beginObject();
  writer.key("w_transparency");
  writer.value(meta.w_transparency);
  writer.key("w_governance");
  writer.value(meta.w_governance);
  writer.key("w_cost");
  writer.value(meta.w_cost);
  writer.key("transparency_tiers");
  writeTiers(writer, meta.transparency_tiers);
  writer.key("governance_tiers");
  writeTiers(writer, meta.governance_tiers);
  writer.key("fast_runtime_ms");
  writer.value(meta.fast_runtime_ms);
  writer.key("acceptable_runtime_ms");
  writer.value(meta.acceptable_runtime_ms);
  writer.key("cost_fast");
  writer.value(meta.cost_fast);
  writer.key("cost_acceptable");
  writer.value(meta.cost_acceptable);
  writer.key("cost_slow");
  writer.value(meta.cost_slow);
  writer.key("memory_budget_mb");
  writer.value(meta.memory_budget_mb);
  writer.key("cost_within_budget");
  writer.value(meta.cost_within_budget);
  writer.key("cost_over_budget");
  writer.value(meta.cost_over_budget);
  writer.endObject();

  writer.key("anti_universality_threshold");
  writer.value(config.anti_universality_threshold);

  writer.key("layer_requirements");
  writer.beginObject();
  for (const auto& entry : config.layer_requirements) {
    writer.key(roleToString(entry.first));
    writeLayerList(writer, entry.second);
  }
  writer.endObject();

  writer.key("fusion");
  writer.beginObject();
  for (const auto& entry : config.fusion) {
    writer.key(roleToString(entry.first));
    writeFusion(writer, entry.second);
  }
  writer.endObject();

  const DecisionPolicy& policy = config.decision;
  writer.key("decision_policy");
  writer.beginObject();
  writer.key("default_threshold");
  writer.value(policy.default_threshold);
  writer.key("role_thresholds");
  writer.beginObject();
  for (const auto& entry : policy.role_thresholds) {
    writer.key(roleToString(entry.first));
    writer.value(entry.second);
  }
  writer.endObject();
  writer.key("method_thresholds");
  writer.beginObject();
  for (const auto& entry : policy.method_thresholds) {
    writer.key(entry.first);
    writer.value(entry.second);
  }
  writer.endObject();
  writer.key("conditional_band");
  writer.value(policy.conditional_band);
  writer.key("layer_floor");
  writer.value(policy.layer_floor);
  writer.key("plan_conditional_pass_rate");
  writer.value(policy.plan_conditional_pass_rate);
  writer.endObject();

  writer.key("methods");
  writer.beginObject();
  for (const auto& entry : config.methods) {
    writer.key(entry.first);
    writeMethod(writer, entry.second);
  }
  writer.endObject();

  writer.key("interplay_groups");
  writer.beginObject();
  for (const auto& entry : config.interplay_groups) {
    writer.key(entry.first);
    writer.beginObject();
    writer.key("members");
    writeStringList(writer, entry.second.members);
    writer.key("fusion_rule");
    writer.value(entry.second.fusion_rule);
    writer.key("expected_inputs");
    writeStringList(writer, entry.second.expected_inputs);
    writer.endObject();
  }
  writer.endObject();

  writer.key("range_transforms");
  writer.beginArray();
  for (const auto& transform : config.range_transforms) {
    writer.beginObject();
    writer.key("name");
    writer.value(transform.name);
    writer.key("from");
    writeRange(writer, transform.from);
    writer.key("to");
    writeRange(writer, transform.to);
    writer.endObject();
  }
  writer.endArray();

  writer.endObject();
  return writer.toString();
}

}  // namespace calib
