// Implementation of configuration parsing and load-time validation.

#include "config/config_loader.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <set>
#include <utility>

#include "config/anti_universality.h"
#include "config/layer_requirements.h"
#include "core/json_parser.h"
#include "core/sha256.h"

namespace calib {

namespace {

// ---------------------------------------------------------------------------
// JSON reading helpers
// ---------------------------------------------------------------------------

/// @brief Typed field access that records a path-qualified error per problem.
class ConfigReader {
 public:
  explicit ConfigReader(std::vector<std::string>& errors) : errors_(errors) {}

  void error(const std::string& path, const std::string& message) {
    errors_.push_back(path + ": " + message);
  }

  const JsonValue* requireObject(const JsonValue& parent, const char* key,
                                 const std::string& path) {
    const JsonValue* val = parent.find(key);
    if (!val) {
      error(path + "." + key, "missing section");
      return nullptr;
    }
    if (!val->isObject()) {
      error(path + "." + key, "expected an object");
      return nullptr;
    }
    return val;
  }

  bool readNumber(const JsonValue& parent, const char* key, const std::string& path,
                  double& out) {
    const JsonValue* val = parent.find(key);
    if (!val) {
      error(path + "." + key, "missing number");
      return false;
    }
    if (!val->isNumber()) {
      error(path + "." + key, "expected a number");
      return false;
    }
    out = val->number_val;
    return true;
  }

  bool readBool(const JsonValue& parent, const char* key, const std::string& path,
                bool& out) {
    const JsonValue* val = parent.find(key);
    if (!val) {
      error(path + "." + key, "missing boolean");
      return false;
    }
    if (!val->isBool()) {
      error(path + "." + key, "expected a boolean");
      return false;
    }
    out = val->bool_val;
    return true;
  }

  /// Optional string; absent leaves `out` unchanged.
  void readOptionalString(const JsonValue& parent, const char* key, const std::string& path,
                          std::string& out) {
    const JsonValue* val = parent.find(key);
    if (!val) return;
    if (!val->isString()) {
      error(path + "." + key, "expected a string");
      return;
    }
    out = val->string_val;
  }

  /// Optional array of strings; absent leaves `out` empty.
  void readStringList(const JsonValue& parent, const char* key, const std::string& path,
                      std::vector<std::string>& out) {
    const JsonValue* val = parent.find(key);
    if (!val) return;
    if (!val->isArray()) {
      error(path + "." + key, "expected an array of strings");
      return;
    }
    for (const auto& item : val->array_items) {
      if (!item.isString()) {
        error(path + "." + key, "expected an array of strings");
        return;
      }
      out.push_back(item.string_val);
    }
  }

  bool parseLayer(const JsonValue& val, const std::string& path, CanonicalLayer& out) {
    if (!val.isString() || !layerFromString(val.string_val, out)) {
      error(path, "unknown layer '" + val.asString() + "'");
      return false;
    }
    return true;
  }

  bool parseLayerName(const std::string& name, const std::string& path, CanonicalLayer& out) {
    if (!layerFromString(name, out)) {
      error(path, "unknown layer '" + name + "'");
      return false;
    }
    return true;
  }

  bool parseRoleName(const std::string& name, const std::string& path, MethodRole& out) {
    if (!roleFromString(name, out)) {
      error(path, "unknown role '" + name + "'");
      return false;
    }
    return true;
  }

  void readLayerList(const JsonValue& val, const std::string& path, LayerSet& out) {
    if (!val.isArray()) {
      error(path, "expected an array of layer names");
      return;
    }
    for (size_t idx = 0; idx < val.array_items.size(); ++idx) {
      CanonicalLayer layer;
      if (parseLayer(val.array_items[idx], path + "[" + std::to_string(idx) + "]", layer)) {
        layerSetInsert(out, layer);
      }
    }
  }

  bool readRange(const JsonValue& val, const std::string& path, OutputRange& out) {
    if (!val.isArray() || val.array_items.size() != 2 || !val.array_items[0].isNumber() ||
        !val.array_items[1].isNumber()) {
      error(path, "expected [min, max]");
      return false;
    }
    out.min = val.array_items[0].number_val;
    out.max = val.array_items[1].number_val;
    if (!(out.min <= out.max)) {
      error(path, "range minimum exceeds maximum");
      return false;
    }
    return true;
  }

  void readCompatTable(const JsonValue& parent, const char* key, const std::string& path,
                       std::map<std::string, CompatibilityTier>& out) {
    const JsonValue* table = parent.find(key);
    if (!table) return;
    if (!table->isObject()) {
      error(path + "." + key, "expected an object of tier names");
      return;
    }
    for (const auto& member : table->members) {
      CompatibilityTier tier;
      if (!member.second.isString() ||
          !compatibilityTierFromString(member.second.string_val, tier)) {
        error(path + "." + key + "." + member.first,
              "unknown compatibility tier '" + member.second.asString() + "'");
        continue;
      }
      out[member.first] = tier;
    }
  }

 private:
  std::vector<std::string>& errors_;
};

// ---------------------------------------------------------------------------
// Section parsers
// ---------------------------------------------------------------------------

void parseUnitTransforms(ConfigReader& reader, const JsonValue& root,
                         CalibrationConfig& config) {
  const JsonValue* list = root.find("unit_transforms");
  if (!list) {
    reader.error("$.unit_transforms", "missing section");
    return;
  }
  if (!list->isArray()) {
    reader.error("$.unit_transforms", "expected an array");
    return;
  }
  for (size_t idx = 0; idx < list->array_items.size(); ++idx) {
    const JsonValue& item = list->array_items[idx];
    std::string path = "$.unit_transforms[" + std::to_string(idx) + "]";
    if (!item.isObject()) {
      reader.error(path, "expected an object");
      continue;
    }
    UnitTransform transform;
    reader.readOptionalString(item, "name", path, transform.name);
    std::string kind_name;
    reader.readOptionalString(item, "kind", path, kind_name);
    if (!unitTransformKindFromString(kind_name, transform.kind)) {
      reader.error(path + ".kind", "unknown unit transform kind '" + kind_name + "'");
      continue;
    }
    std::vector<std::string> role_names;
    reader.readStringList(item, "roles", path, role_names);
    for (const auto& name : role_names) {
      MethodRole role;
      if (reader.parseRoleName(name, path + ".roles", role)) transform.roles.push_back(role);
    }
    switch (transform.kind) {
      case UnitTransformKind::Identity:
        break;
      case UnitTransformKind::PiecewiseLinear:
        reader.readNumber(item, "abort_threshold", path, transform.abort_threshold);
        reader.readNumber(item, "slope", path, transform.slope);
        reader.readNumber(item, "offset", path, transform.offset);
        reader.readNumber(item, "saturation_threshold", path, transform.saturation_threshold);
        break;
      case UnitTransformKind::Sigmoidal:
        reader.readNumber(item, "k", path, transform.k);
        reader.readNumber(item, "x0", path, transform.x0);
        break;
      case UnitTransformKind::Constant:
        reader.readNumber(item, "value", path, transform.value);
        break;
    }
    config.unit_transforms.push_back(std::move(transform));
  }
}

void parseMetaRubric(ConfigReader& reader, const JsonValue& root, CalibrationConfig& config) {
  const JsonValue* meta = reader.requireObject(root, "meta_rubric", "$");
  if (!meta) return;
  const std::string path = "$.meta_rubric";
  MetaRubric& rubric = config.meta;
  reader.readNumber(*meta, "w_transparency", path, rubric.w_transparency);
  reader.readNumber(*meta, "w_governance", path, rubric.w_governance);
  reader.readNumber(*meta, "w_cost", path, rubric.w_cost);

  auto read_tiers = [&](const char* key, std::array<double, 4>& out) {
    const JsonValue* tiers = meta->find(key);
    if (!tiers || !tiers->isArray() || tiers->array_items.size() != out.size()) {
      reader.error(path + "." + key, "expected an array of 4 numbers (0..3 conditions met)");
      return;
    }
    for (size_t idx = 0; idx < out.size(); ++idx) {
      if (!tiers->array_items[idx].isNumber()) {
        reader.error(path + "." + key, "expected an array of 4 numbers (0..3 conditions met)");
        return;
      }
      out[idx] = tiers->array_items[idx].number_val;
    }
  };
  read_tiers("transparency_tiers", rubric.transparency_tiers);
  read_tiers("governance_tiers", rubric.governance_tiers);

  reader.readNumber(*meta, "fast_runtime_ms", path, rubric.fast_runtime_ms);
  reader.readNumber(*meta, "acceptable_runtime_ms", path, rubric.acceptable_runtime_ms);
  reader.readNumber(*meta, "cost_fast", path, rubric.cost_fast);
  reader.readNumber(*meta, "cost_acceptable", path, rubric.cost_acceptable);
  reader.readNumber(*meta, "cost_slow", path, rubric.cost_slow);
  reader.readNumber(*meta, "memory_budget_mb", path, rubric.memory_budget_mb);
  reader.readNumber(*meta, "cost_within_budget", path, rubric.cost_within_budget);
  reader.readNumber(*meta, "cost_over_budget", path, rubric.cost_over_budget);
}

void parseFusion(ConfigReader& reader, const JsonValue& root, CalibrationConfig& config) {
  const JsonValue* fusion = reader.requireObject(root, "fusion", "$");
  if (!fusion) return;
  for (const auto& member : fusion->members) {
    std::string path = "$.fusion." + member.first;
    FusionConfiguration role_fusion;
    if (!reader.parseRoleName(member.first, path, role_fusion.role)) continue;
    const JsonValue& body = member.second;
    if (!body.isObject()) {
      reader.error(path, "expected an object");
      continue;
    }
    role_fusion.source = "fusion." + member.first;
    reader.readOptionalString(body, "version", path, role_fusion.version);
    reader.readOptionalString(body, "source", path, role_fusion.source);

    const JsonValue* linear = reader.requireObject(body, "linear", path);
    if (linear) {
      for (const auto& weight : linear->members) {
        CanonicalLayer layer;
        if (!reader.parseLayerName(weight.first, path + ".linear", layer)) continue;
        if (!weight.second.isNumber()) {
          reader.error(path + ".linear." + weight.first, "expected a number");
          continue;
        }
        role_fusion.linear_weights[layer] = weight.second.number_val;
      }
    }

    const JsonValue* interactions = body.find("interactions");
    if (interactions && !interactions->isArray()) {
      reader.error(path + ".interactions", "expected an array");
    } else if (interactions) {
      for (size_t idx = 0; idx < interactions->array_items.size(); ++idx) {
        const JsonValue& item = interactions->array_items[idx];
        std::string term_path = path + ".interactions[" + std::to_string(idx) + "]";
        const JsonValue* layers = item.find("layers");
        if (!layers || !layers->isArray() || layers->array_items.size() != 2) {
          reader.error(term_path + ".layers", "expected a pair of layer names");
          continue;
        }
        InteractionTerm term;
        if (!reader.parseLayer(layers->array_items[0], term_path + ".layers[0]", term.layer_a) ||
            !reader.parseLayer(layers->array_items[1], term_path + ".layers[1]", term.layer_b)) {
          continue;
        }
        if (!reader.readNumber(item, "weight", term_path, term.weight)) continue;
        reader.readOptionalString(item, "rationale", term_path, term.rationale);
        role_fusion.interactions.push_back(std::move(term));
      }
    }
    config.fusion[role_fusion.role] = std::move(role_fusion);
  }
}

void parseDecisionPolicy(ConfigReader& reader, const JsonValue& root,
                         CalibrationConfig& config) {
  const JsonValue* policy = reader.requireObject(root, "decision_policy", "$");
  if (!policy) return;
  const std::string path = "$.decision_policy";
  DecisionPolicy& out = config.decision;
  reader.readNumber(*policy, "default_threshold", path, out.default_threshold);
  reader.readNumber(*policy, "conditional_band", path, out.conditional_band);
  reader.readNumber(*policy, "layer_floor", path, out.layer_floor);
  reader.readNumber(*policy, "plan_conditional_pass_rate", path,
                    out.plan_conditional_pass_rate);

  const JsonValue* roles = policy->find("role_thresholds");
  if (roles && roles->isObject()) {
    for (const auto& member : roles->members) {
      MethodRole role;
      if (!reader.parseRoleName(member.first, path + ".role_thresholds", role)) continue;
      if (!member.second.isNumber()) {
        reader.error(path + ".role_thresholds." + member.first, "expected a number");
        continue;
      }
      out.role_thresholds[role] = member.second.number_val;
    }
  } else if (roles) {
    reader.error(path + ".role_thresholds", "expected an object");
  }

  const JsonValue* methods = policy->find("method_thresholds");
  if (methods && methods->isObject()) {
    for (const auto& member : methods->members) {
      if (!member.second.isNumber()) {
        reader.error(path + ".method_thresholds." + member.first, "expected a number");
        continue;
      }
      out.method_thresholds[member.first] = member.second.number_val;
    }
  } else if (methods) {
    reader.error(path + ".method_thresholds", "expected an object");
  }
}

void parseMethods(ConfigReader& reader, const JsonValue& root, CalibrationConfig& config) {
  const JsonValue* methods = root.find("methods");
  if (!methods) return;
  if (!methods->isObject()) {
    reader.error("$.methods", "expected an object");
    return;
  }
  for (const auto& member : methods->members) {
    std::string path = "$.methods." + member.first;
    const JsonValue& body = member.second;
    if (member.first.empty()) {
      reader.error(path, "empty method id");
      continue;
    }
    if (!body.isObject()) {
      reader.error(path, "expected an object");
      continue;
    }
    MethodDeclaration method;
    method.method_id = member.first;
    std::string role_name;
    reader.readOptionalString(body, "role", path, role_name);
    if (!reader.parseRoleName(role_name, path + ".role", method.role)) continue;

    const JsonValue* active = body.find("active_layers");
    if (active) {
      reader.readLayerList(*active, path + ".active_layers", method.active_layers);
    } else {
      method.active_layers = requiredLayers(config, method.role);
    }

    const JsonValue* justifications = body.find("justifications");
    if (justifications && justifications->isObject()) {
      for (const auto& entry : justifications->members) {
        CanonicalLayer layer;
        if (!reader.parseLayerName(entry.first, path + ".justifications", layer)) continue;
        method.justifications[layer] = entry.second.asString();
      }
    } else if (justifications) {
      reader.error(path + ".justifications", "expected an object");
    }

    reader.readCompatTable(body, "question_compat", path, method.question_compat);
    reader.readCompatTable(body, "dimension_compat", path, method.dimension_compat);
    reader.readCompatTable(body, "policy_compat", path, method.policy_compat);

    const JsonValue* range = body.find("output_range");
    if (range) reader.readRange(*range, path + ".output_range", method.output_range);
    reader.readStringList(body, "semantic_tags", path, method.semantic_tags);

    const JsonValue* signature = body.find("signature");
    if (signature && signature->isObject()) {
      std::string sig_path = path + ".signature";
      reader.readStringList(*signature, "required_inputs", sig_path,
                            method.signature.required_inputs);
      reader.readStringList(*signature, "beneficial_inputs", sig_path,
                            method.signature.beneficial_inputs);
      reader.readStringList(*signature, "optional_inputs", sig_path,
                            method.signature.optional_inputs);
      const JsonValue* types = signature->find("input_types");
      if (types && types->isObject()) {
        for (const auto& entry : types->members) {
          method.signature.input_types[entry.first] = entry.second.asString();
        }
      }
    } else if (signature) {
      reader.error(path + ".signature", "expected an object");
    }

    config.methods[method.method_id] = std::move(method);
  }
}

void parseInterplay(ConfigReader& reader, const JsonValue& root, CalibrationConfig& config) {
  const JsonValue* groups = root.find("interplay_groups");
  if (groups && groups->isObject()) {
    for (const auto& member : groups->members) {
      std::string path = "$.interplay_groups." + member.first;
      if (!member.second.isObject()) {
        reader.error(path, "expected an object");
        continue;
      }
      InterplayGroup group;
      group.group_id = member.first;
      reader.readStringList(member.second, "members", path, group.members);
      reader.readOptionalString(member.second, "fusion_rule", path, group.fusion_rule);
      reader.readStringList(member.second, "expected_inputs", path, group.expected_inputs);
      config.interplay_groups[group.group_id] = std::move(group);
    }
  } else if (groups) {
    reader.error("$.interplay_groups", "expected an object");
  }

  const JsonValue* transforms = root.find("range_transforms");
  if (transforms && transforms->isArray()) {
    for (size_t idx = 0; idx < transforms->array_items.size(); ++idx) {
      const JsonValue& item = transforms->array_items[idx];
      std::string path = "$.range_transforms[" + std::to_string(idx) + "]";
      RangeTransform transform;
      reader.readOptionalString(item, "name", path, transform.name);
      const JsonValue* from = item.find("from");
      const JsonValue* to = item.find("to");
      if (!from || !to) {
        reader.error(path, "expected 'from' and 'to' ranges");
        continue;
      }
      if (reader.readRange(*from, path + ".from", transform.from) &&
          reader.readRange(*to, path + ".to", transform.to)) {
        config.range_transforms.push_back(std::move(transform));
      }
    }
  } else if (transforms) {
    reader.error("$.range_transforms", "expected an array");
  }
}

bool parseConfigTree(const JsonValue& root, CalibrationConfig& config,
                     std::vector<std::string>& errors) {
  ConfigReader reader(errors);
  if (!root.isObject()) {
    reader.error("$", "configuration must be a JSON object");
    return false;
  }

  reader.readOptionalString(root, "version", "$", config.version);
  if (config.version.empty()) reader.error("$.version", "missing version");

  if (const JsonValue* domain = reader.requireObject(root, "domain", "$")) {
    reader.readStringList(*domain, "questions", "$.domain", config.domain.questions);
    reader.readStringList(*domain, "dimensions", "$.domain", config.domain.dimensions);
    reader.readStringList(*domain, "policy_areas", "$.domain", config.domain.policy_areas);
  }

  if (const JsonValue* base = reader.requireObject(root, "base_weights", "$")) {
    reader.readNumber(*base, "theory", "$.base_weights", config.base_weights.theory);
    reader.readNumber(*base, "impl", "$.base_weights", config.base_weights.impl);
    reader.readNumber(*base, "deploy", "$.base_weights", config.base_weights.deploy);
  }

  if (const JsonValue* fallbacks = reader.requireObject(root, "intrinsic_fallbacks", "$")) {
    reader.readNumber(*fallbacks, "pending", "$.intrinsic_fallbacks",
                      config.intrinsic_fallbacks.pending);
    reader.readNumber(*fallbacks, "none", "$.intrinsic_fallbacks",
                      config.intrinsic_fallbacks.none);
  }

  if (const JsonValue* chain = reader.requireObject(root, "chain_rubric", "$")) {
    const std::string path = "$.chain_rubric";
    reader.readNumber(*chain, "hard_mismatch", path, config.chain.hard_mismatch);
    reader.readNumber(*chain, "missing_beneficial", path, config.chain.missing_beneficial);
    reader.readNumber(*chain, "schema_deviation", path, config.chain.schema_deviation);
    reader.readNumber(*chain, "warnings", path, config.chain.warnings);
    reader.readNumber(*chain, "clean", path, config.chain.clean);
  }

  parseUnitTransforms(reader, root, config);

  if (const JsonValue* gates = reader.requireObject(root, "unit_gates", "$")) {
    const std::string path = "$.unit_gates";
    reader.readNumber(*gates, "min_structural_compliance", path,
                      config.unit_gates.min_structural_compliance);
    reader.readBool(*gates, "require_ppi_matrix", path, config.unit_gates.require_ppi_matrix);
    reader.readBool(*gates, "require_indicator_matrix", path,
                    config.unit_gates.require_indicator_matrix);
  }

  if (const JsonValue* tiers = reader.requireObject(root, "contextual_tiers", "$")) {
    const std::string path = "$.contextual_tiers";
    ContextualTiers& out = config.contextual_tiers;
    reader.readNumber(*tiers, "primary", path, out.primary);
    reader.readNumber(*tiers, "secondary", path, out.secondary);
    reader.readNumber(*tiers, "compatible", path, out.compatible);
    reader.readNumber(*tiers, "undeclared", path, out.undeclared);
    reader.readNumber(*tiers, "incompatible", path, out.incompatible);
  }

  if (const JsonValue* cong = reader.requireObject(root, "congruence_rubric", "$")) {
    const std::string path = "$.congruence_rubric";
    CongruenceRubric& out = config.congruence;
    reader.readNumber(*cong, "standalone_registered", path, out.standalone_registered);
    reader.readNumber(*cong, "standalone_unregistered", path, out.standalone_unregistered);
    reader.readNumber(*cong, "same_range", path, out.same_range);
    reader.readNumber(*cong, "convertible", path, out.convertible);
    reader.readNumber(*cong, "incompatible", path, out.incompatible);
    reader.readNumber(*cong, "fusion_complete", path, out.fusion_complete);
    reader.readNumber(*cong, "fusion_partial", path, out.fusion_partial);
    reader.readNumber(*cong, "fusion_missing", path, out.fusion_missing);
  }

  parseMetaRubric(reader, root, config);

  reader.readNumber(root, "anti_universality_threshold", "$",
                    config.anti_universality_threshold);

  const JsonValue* requirements = root.find("layer_requirements");
  if (requirements && requirements->isObject()) {
    for (const auto& member : requirements->members) {
      MethodRole role;
      std::string path = "$.layer_requirements." + member.first;
      if (!reader.parseRoleName(member.first, path, role)) continue;
      LayerSet layers;
      reader.readLayerList(member.second, path, layers);
      config.layer_requirements[role] = std::move(layers);
    }
  } else if (requirements) {
    reader.error("$.layer_requirements", "expected an object");
  }

  parseFusion(reader, root, config);
  parseDecisionPolicy(reader, root, config);
  // Methods default their active layers from the profiles parsed above.
  parseMethods(reader, root, config);
  parseInterplay(reader, root, config);

  return errors.empty();
}

// ---------------------------------------------------------------------------
// Validation helpers
// ---------------------------------------------------------------------------

bool inUnitInterval(double val) { return val >= 0.0 && val <= 1.0; }

void checkUnit(std::vector<std::string>& errors, const std::string& name, double val) {
  if (!inUnitInterval(val)) {
    errors.push_back(name + " = " + formatNumber(val) + " is outside [0, 1]");
  }
}

void checkNormalized(std::vector<std::string>& errors, const std::string& name,
                     double total) {
  if (!(std::fabs(total - 1.0) <= kWeightTolerance)) {
    errors.push_back(name + " sum to " + formatNumber(total, 10) + ", expected 1 +/- 1e-6");
  }
}

void checkUnitTransforms(const CalibrationConfig& config, std::vector<std::string>& errors) {
  std::set<MethodRole> seen_roles;
  for (size_t idx = 0; idx < config.unit_transforms.size(); ++idx) {
    const UnitTransform& transform = config.unit_transforms[idx];
    std::string name = "unit_transforms[" + std::to_string(idx) + "]";
    if (!transform.name.empty()) name += " (" + transform.name + ")";

    for (MethodRole role : transform.roles) {
      if (!seen_roles.insert(role).second) {
        errors.push_back(name + ": role " + roleToString(role) +
                         " is already mapped by an earlier unit transform");
      }
    }
    if (transform.kind == UnitTransformKind::PiecewiseLinear) {
      if (!(transform.abort_threshold <= transform.saturation_threshold)) {
        errors.push_back(name + ": abort_threshold exceeds saturation_threshold");
        continue;
      }
    }
    if (transform.kind == UnitTransformKind::Sigmoidal && !(transform.k >= 0.0)) {
      errors.push_back(name + ": k must be non-negative");
      continue;
    }

    // Sample g on a fine grid plus the breakpoints: it must stay in [0, 1]
    // and never decrease.
    std::vector<double> samples;
    constexpr int kSteps = 1000;
    for (int step = 0; step <= kSteps; ++step) samples.push_back(static_cast<double>(step) / kSteps);
    if (transform.kind == UnitTransformKind::PiecewiseLinear) {
      samples.push_back(transform.abort_threshold);
      samples.push_back(transform.saturation_threshold);
      std::sort(samples.begin(), samples.end());
    }
    double prev = -1.0;
    for (double unit_quality : samples) {
      if (!inUnitInterval(unit_quality)) continue;
      double val = transform.apply(unit_quality);
      if (!inUnitInterval(val)) {
        errors.push_back(name + ": g(" + formatNumber(unit_quality) + ") = " +
                         formatNumber(val) + " is outside [0, 1]");
        break;
      }
      if (val < prev) {
        errors.push_back(name + ": g is not monotonic non-decreasing at U = " +
                         formatNumber(unit_quality));
        break;
      }
      prev = val;
    }
  }
}

void checkFusion(const FusionConfiguration& fusion, std::vector<std::string>& errors) {
  std::string name = std::string("fusion.") + roleToString(fusion.role);
  for (const auto& entry : fusion.linear_weights) {
    if (!(entry.second >= 0.0) || !std::isfinite(entry.second)) {
      errors.push_back(name + ": linear weight for " + layerToString(entry.first) + " = " +
                       formatNumber(entry.second) + " must be a non-negative number");
    }
  }
  std::set<std::pair<CanonicalLayer, CanonicalLayer>> pairs;
  for (const auto& term : fusion.interactions) {
    if (term.layer_a == term.layer_b) {
      errors.push_back(name + ": interaction " + term.label() + " pairs a layer with itself");
    }
    auto key = layerIndex(term.layer_a) < layerIndex(term.layer_b)
                   ? std::make_pair(term.layer_a, term.layer_b)
                   : std::make_pair(term.layer_b, term.layer_a);
    if (!pairs.insert(key).second) {
      errors.push_back(name + ": interaction " + term.label() + " is declared twice");
    }
    if (!(term.weight >= 0.0) || !std::isfinite(term.weight)) {
      errors.push_back(name + ": interaction weight for " + term.label() + " = " +
                       formatNumber(term.weight) + " must be a non-negative number");
    }
  }
  double total = fusion.totalWeight();
  if (!(std::fabs(total - 1.0) <= kWeightTolerance)) {
    errors.push_back(name + ": linear (" + formatNumber(fusion.linearTotal(), 10) +
                     ") + interaction (" + formatNumber(fusion.interactionTotal(), 10) +
                     ") weights sum to " + formatNumber(total, 10) +
                     ", expected 1 +/- 1e-6; weights are never renormalized");
  }
}

}  // namespace

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

std::vector<std::string> validateCalibrationConfig(const CalibrationConfig& config) {
  std::vector<std::string> errors;

  if (config.domain.questions.empty()) errors.push_back("domain.questions is empty");
  if (config.domain.dimensions.empty()) errors.push_back("domain.dimensions is empty");
  if (config.domain.policy_areas.empty()) errors.push_back("domain.policy_areas is empty");

  const BaseWeights& base = config.base_weights;
  checkUnit(errors, "base_weights.theory", base.theory);
  checkUnit(errors, "base_weights.impl", base.impl);
  checkUnit(errors, "base_weights.deploy", base.deploy);
  checkNormalized(errors, "base_weights", base.theory + base.impl + base.deploy);

  checkUnit(errors, "intrinsic_fallbacks.pending", config.intrinsic_fallbacks.pending);
  checkUnit(errors, "intrinsic_fallbacks.none", config.intrinsic_fallbacks.none);

  const ChainRubric& chain = config.chain;
  checkUnit(errors, "chain_rubric.hard_mismatch", chain.hard_mismatch);
  checkUnit(errors, "chain_rubric.missing_beneficial", chain.missing_beneficial);
  checkUnit(errors, "chain_rubric.schema_deviation", chain.schema_deviation);
  checkUnit(errors, "chain_rubric.warnings", chain.warnings);
  checkUnit(errors, "chain_rubric.clean", chain.clean);
  if (!(chain.hard_mismatch <= chain.missing_beneficial &&
        chain.missing_beneficial <= chain.schema_deviation &&
        chain.schema_deviation <= chain.warnings && chain.warnings <= chain.clean)) {
    errors.push_back("chain_rubric tiers must be non-decreasing from hard_mismatch to clean");
  }

  checkUnitTransforms(config, errors);
  checkUnit(errors, "unit_gates.min_structural_compliance",
            config.unit_gates.min_structural_compliance);

  const ContextualTiers& tiers = config.contextual_tiers;
  checkUnit(errors, "contextual_tiers.primary", tiers.primary);
  checkUnit(errors, "contextual_tiers.secondary", tiers.secondary);
  checkUnit(errors, "contextual_tiers.compatible", tiers.compatible);
  checkUnit(errors, "contextual_tiers.undeclared", tiers.undeclared);
  checkUnit(errors, "contextual_tiers.incompatible", tiers.incompatible);
  if (!(tiers.incompatible <= tiers.undeclared && tiers.undeclared <= tiers.compatible &&
        tiers.compatible <= tiers.secondary && tiers.secondary <= tiers.primary)) {
    errors.push_back("contextual_tiers must be non-decreasing from incompatible to primary");
  }

  const CongruenceRubric& cong = config.congruence;
  checkUnit(errors, "congruence_rubric.standalone_registered", cong.standalone_registered);
  checkUnit(errors, "congruence_rubric.standalone_unregistered", cong.standalone_unregistered);
  checkUnit(errors, "congruence_rubric.same_range", cong.same_range);
  checkUnit(errors, "congruence_rubric.convertible", cong.convertible);
  checkUnit(errors, "congruence_rubric.incompatible", cong.incompatible);
  checkUnit(errors, "congruence_rubric.fusion_complete", cong.fusion_complete);
  checkUnit(errors, "congruence_rubric.fusion_partial", cong.fusion_partial);
  checkUnit(errors, "congruence_rubric.fusion_missing", cong.fusion_missing);

  const MetaRubric& meta = config.meta;
  checkUnit(errors, "meta_rubric.w_transparency", meta.w_transparency);
  checkUnit(errors, "meta_rubric.w_governance", meta.w_governance);
  checkUnit(errors, "meta_rubric.w_cost", meta.w_cost);
  checkNormalized(errors, "meta_rubric weights",
                  meta.w_transparency + meta.w_governance + meta.w_cost);
  for (size_t idx = 0; idx < meta.transparency_tiers.size(); ++idx) {
    checkUnit(errors, "meta_rubric.transparency_tiers[" + std::to_string(idx) + "]",
              meta.transparency_tiers[idx]);
    checkUnit(errors, "meta_rubric.governance_tiers[" + std::to_string(idx) + "]",
              meta.governance_tiers[idx]);
    if (idx > 0 && (meta.transparency_tiers[idx] < meta.transparency_tiers[idx - 1] ||
                    meta.governance_tiers[idx] < meta.governance_tiers[idx - 1])) {
      errors.push_back("meta_rubric tiers must be non-decreasing in conditions met");
    }
  }
  if (!(meta.fast_runtime_ms >= 0.0 && meta.fast_runtime_ms <= meta.acceptable_runtime_ms)) {
    errors.push_back("meta_rubric: require 0 <= fast_runtime_ms <= acceptable_runtime_ms");
  }
  if (!(meta.memory_budget_mb >= 0.0)) {
    errors.push_back("meta_rubric.memory_budget_mb must be non-negative");
  }
  checkUnit(errors, "meta_rubric.cost_fast", meta.cost_fast);
  checkUnit(errors, "meta_rubric.cost_acceptable", meta.cost_acceptable);
  checkUnit(errors, "meta_rubric.cost_slow", meta.cost_slow);
  checkUnit(errors, "meta_rubric.cost_within_budget", meta.cost_within_budget);
  checkUnit(errors, "meta_rubric.cost_over_budget", meta.cost_over_budget);

  if (!(config.anti_universality_threshold > 0.0 && config.anti_universality_threshold <= 1.0)) {
    errors.push_back("anti_universality_threshold must lie in (0, 1]");
  }

  for (MethodRole role : kAllRoles) {
    LayerSet required = requiredLayers(config, role);
    if (!layerSetContains(required, CanonicalLayer::Base)) {
      errors.push_back(std::string("layer_requirements.") + roleToString(role) +
                       " does not contain @b");
    }
  }

  for (const auto& entry : config.fusion) checkFusion(entry.second, errors);

  const DecisionPolicy& policy = config.decision;
  checkUnit(errors, "decision_policy.default_threshold", policy.default_threshold);
  for (const auto& entry : policy.role_thresholds) {
    checkUnit(errors, std::string("decision_policy.role_thresholds.") + roleToString(entry.first),
              entry.second);
  }
  for (const auto& entry : policy.method_thresholds) {
    checkUnit(errors, "decision_policy.method_thresholds." + entry.first, entry.second);
  }
  checkUnit(errors, "decision_policy.conditional_band", policy.conditional_band);
  checkUnit(errors, "decision_policy.layer_floor", policy.layer_floor);
  checkUnit(errors, "decision_policy.plan_conditional_pass_rate",
            policy.plan_conditional_pass_rate);

  for (const auto& entry : config.methods) {
    const MethodDeclaration& method = entry.second;
    if (!config.findFusion(method.role)) {
      errors.push_back("method '" + method.method_id + "': no fusion configuration for role " +
                       roleToString(method.role));
    }
    for (auto& message : checkDeclaredLayers(config, method)) errors.push_back(message);
  }

  for (const auto& entry : config.interplay_groups) {
    if (entry.second.members.empty()) {
      errors.push_back("interplay group '" + entry.first + "' has no members");
    }
  }

  // Only meaningful once the domain and tiers are sound.
  if (errors.empty()) {
    for (auto& message : checkAntiUniversality(config)) errors.push_back(message);
  }
  return errors;
}

// ---------------------------------------------------------------------------
// Loading
// ---------------------------------------------------------------------------

namespace {

ConfigLoadResult failLoad(std::vector<std::string> errors) {
  ConfigLoadResult result;
  result.errors = std::move(errors);
  for (const auto& message : result.errors) {
    std::fprintf(stderr, "[config] ERROR: %s\n", message.c_str());
    if (!result.error_message.empty()) result.error_message += "; ";
    result.error_message += message;
  }
  return result;
}

}  // namespace

ConfigLoadResult finalizeCalibrationConfig(CalibrationConfig config) {
  for (MethodRole role : kAllRoles) {
    if (config.layer_requirements.find(role) == config.layer_requirements.end()) {
      config.layer_requirements[role] = defaultRequiredLayers(role);
    }
  }

  std::vector<std::string> errors = validateCalibrationConfig(config);
  if (!errors.empty()) return failLoad(std::move(errors));

  config.config_hash = sha256Tagged(canonicalConfigJson(config));
  if (config.config_hash.empty()) {
    return failLoad({"cannot compute configuration hash"});
  }

  ConfigLoadResult result;
  result.success = true;
  result.config = std::make_shared<const CalibrationConfig>(std::move(config));
  return result;
}

ConfigLoadResult parseCalibrationConfig(const std::string& json_text) {
  JsonValue root;
  std::string parse_error;
  if (!parseJson(json_text, root, parse_error)) {
    return failLoad({"malformed configuration JSON: " + parse_error});
  }

  CalibrationConfig config;
  std::vector<std::string> errors;
  if (!parseConfigTree(root, config, errors)) return failLoad(std::move(errors));
  return finalizeCalibrationConfig(std::move(config));
}

ConfigLoadResult loadCalibrationConfig(const std::string& path) {
  JsonValue root;
  std::string parse_error;
  if (!parseJsonFile(path, root, parse_error)) {
    return failLoad({"cannot load configuration: " + parse_error});
  }
  CalibrationConfig config;
  std::vector<std::string> errors;
  if (!parseConfigTree(root, config, errors)) return failLoad(std::move(errors));
  return finalizeCalibrationConfig(std::move(config));
}

}  // namespace calib
