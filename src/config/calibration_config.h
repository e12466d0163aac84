// Immutable calibration configuration: rubrics, weights, profiles, methods.

#ifndef CALIB_CONFIG_CALIBRATION_CONFIG_H
#define CALIB_CONFIG_CALIBRATION_CONFIG_H

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace calib {

/// Tolerance for every "weights sum to 1" check.
constexpr double kWeightTolerance = 1e-6;

// ---------------------------------------------------------------------------
// Rubrics (every calibration constant lives here, never in evaluators)
// ---------------------------------------------------------------------------

/// Context domain scanned by the anti-universality check.
struct DomainSpec {
  std::vector<std::string> questions;
  std::vector<std::string> dimensions;
  std::vector<std::string> policy_areas;
};

/// Weights of the three intrinsic components in the @b composite.
struct BaseWeights {
  double theory = 0.0;
  double impl = 0.0;
  double deploy = 0.0;
};

/// Component values substituted for non-computed registry records.
struct IntrinsicFallbacks {
  double pending = 0.0;
  double none = 0.0;
};

/// @chain tier values, highest priority first.
struct ChainRubric {
  double hard_mismatch = 0.0;
  double missing_beneficial = 0.0;
  double schema_deviation = 0.0;
  double warnings = 0.0;
  double clean = 0.0;
};

/// Shape of a unit-quality transform g(U).
enum class UnitTransformKind : uint8_t {
  Identity,
  PiecewiseLinear,
  Sigmoidal,
  Constant
};

const char* unitTransformKindToString(UnitTransformKind kind);
bool unitTransformKindFromString(const std::string& str, UnitTransformKind& out);

/// @brief g(U) for a family of roles.
///
/// Only the parameters of the selected kind are meaningful.
struct UnitTransform {
  std::string name;
  UnitTransformKind kind = UnitTransformKind::Identity;
  std::vector<MethodRole> roles;
  double abort_threshold = 0.0;       ///< PiecewiseLinear: 0 below.
  double slope = 0.0;                 ///< PiecewiseLinear.
  double offset = 0.0;                ///< PiecewiseLinear.
  double saturation_threshold = 0.0;  ///< PiecewiseLinear: 1 at or above.
  double k = 0.0;                     ///< Sigmoidal steepness.
  double x0 = 0.0;                    ///< Sigmoidal midpoint.
  double value = 0.0;                 ///< Constant.

  /// @brief Evaluate g at the given unit quality.
  double apply(double unit_quality) const;

  /// @brief Symbolic form for traces, e.g. "2*U + -0.6".
  std::string formula() const;
};

/// Hard gates applied by @u for unit-sensitive roles.
struct UnitGates {
  double min_structural_compliance = 0.0;
  bool require_ppi_matrix = false;
  bool require_indicator_matrix = false;
};

/// Declared compatibility of a method with one context value.
enum class CompatibilityTier : uint8_t {
  Primary,
  Secondary,
  Compatible,
  Undeclared,
  Incompatible
};

const char* compatibilityTierToString(CompatibilityTier tier);
bool compatibilityTierFromString(const std::string& str, CompatibilityTier& out);

/// Score of each compatibility tier for @q, @d and @p.
struct ContextualTiers {
  double primary = 0.0;
  double secondary = 0.0;
  double compatible = 0.0;
  double undeclared = 0.0;
  double incompatible = 0.0;

  double valueOf(CompatibilityTier tier) const;
};

/// @C sub-score values.
struct CongruenceRubric {
  double standalone_registered = 0.0;
  double standalone_unregistered = 0.0;
  double same_range = 0.0;
  double convertible = 0.0;
  double incompatible = 0.0;
  double fusion_complete = 0.0;
  double fusion_partial = 0.0;
  double fusion_missing = 0.0;
};

/// @m weights, count-indexed tiers and cost thresholds.
struct MetaRubric {
  double w_transparency = 0.0;
  double w_governance = 0.0;
  double w_cost = 0.0;
  std::array<double, 4> transparency_tiers = {};  ///< Indexed by conditions met.
  std::array<double, 4> governance_tiers = {};
  double fast_runtime_ms = 0.0;        ///< Runtime below this is "fast".
  double acceptable_runtime_ms = 0.0;  ///< Below this is "acceptable", else "slow".
  double cost_fast = 0.0;
  double cost_acceptable = 0.0;
  double cost_slow = 0.0;
  double memory_budget_mb = 0.0;
  double cost_within_budget = 0.0;
  double cost_over_budget = 0.0;
};

// ---------------------------------------------------------------------------
// Fusion
// ---------------------------------------------------------------------------

/// Declared synergy between two layers, weighted on min(a, b).
struct InteractionTerm {
  CanonicalLayer layer_a = CanonicalLayer::Base;
  CanonicalLayer layer_b = CanonicalLayer::Base;
  double weight = 0.0;
  std::string rationale;

  /// @brief Pair label, e.g. "(@u,@chain)".
  std::string label() const;
};

/// @brief Choquet weights for one role.
///
/// Invariant after load: all weights >= 0 and
/// sum(linear) + sum(interaction) = 1 within kWeightTolerance.
struct FusionConfiguration {
  MethodRole role = MethodRole::Utility;
  std::map<CanonicalLayer, double> linear_weights;
  std::vector<InteractionTerm> interactions;
  std::string version;
  std::string source;

  double linearWeight(CanonicalLayer layer) const;
  double linearTotal() const;
  double interactionTotal() const;
  double totalWeight() const { return linearTotal() + interactionTotal(); }
};

// ---------------------------------------------------------------------------
// Decision policy
// ---------------------------------------------------------------------------

/// Thresholds and bands used by the validation decision layer.
struct DecisionPolicy {
  double default_threshold = 0.0;
  std::map<MethodRole, double> role_thresholds;
  std::map<std::string, double> method_thresholds;
  double conditional_band = 0.0;  ///< Width below threshold for CONDITIONAL_PASS.
  double layer_floor = 0.0;       ///< Contributions below this are attributable.
  double plan_conditional_pass_rate = 0.0;

  /// @brief Method override, then role threshold, then default.
  double thresholdFor(const std::string& method_id, MethodRole role) const;
};

// ---------------------------------------------------------------------------
// Method declarations
// ---------------------------------------------------------------------------

/// Closed numeric range a method's output lies in.
struct OutputRange {
  double min = 0.0;
  double max = 1.0;

  bool operator==(const OutputRange& other) const {
    return min == other.min && max == other.max;
  }
  bool operator!=(const OutputRange& other) const { return !(*this == other); }

  /// @brief "[min,max]".
  std::string toString() const;
};

/// Declared conversion between two output ranges.
struct RangeTransform {
  std::string name;
  OutputRange from;
  OutputRange to;
};

/// Inputs a method consumes, by contract strength.
struct InputSignature {
  std::vector<std::string> required_inputs;
  std::vector<std::string> beneficial_inputs;
  std::vector<std::string> optional_inputs;
  std::map<std::string, std::string> input_types;  ///< Input name -> type name.
};

/// Everything the configuration declares about one method.
struct MethodDeclaration {
  std::string method_id;
  MethodRole role = MethodRole::Utility;
  LayerSet active_layers;
  std::map<CanonicalLayer, std::string> justifications;  ///< For omitted required layers.
  std::map<std::string, CompatibilityTier> question_compat;
  std::map<std::string, CompatibilityTier> dimension_compat;
  std::map<std::string, CompatibilityTier> policy_compat;
  OutputRange output_range;
  std::vector<std::string> semantic_tags;
  InputSignature signature;

  /// @brief Declared tier for a context key of the given contextual layer.
  /// @return Undeclared if the key has no entry or the layer is not contextual.
  CompatibilityTier compatibility(CanonicalLayer layer, const std::string& key) const;
};

/// Co-acting methods whose outputs are fused toward one target.
struct InterplayGroup {
  std::string group_id;
  std::vector<std::string> members;
  std::string fusion_rule;  ///< Empty = no fusion rule declared.
  std::vector<std::string> expected_inputs;
};

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

/// @brief The single immutable configuration object.
///
/// Built and validated by the loader, then shared as
/// std::shared_ptr<const CalibrationConfig> for the process lifetime.
struct CalibrationConfig {
  std::string version;
  DomainSpec domain;
  BaseWeights base_weights;
  IntrinsicFallbacks intrinsic_fallbacks;
  ChainRubric chain;
  std::vector<UnitTransform> unit_transforms;
  UnitGates unit_gates;
  ContextualTiers contextual_tiers;
  CongruenceRubric congruence;
  MetaRubric meta;
  double anti_universality_threshold = 0.0;
  std::map<MethodRole, LayerSet> layer_requirements;
  std::map<MethodRole, FusionConfiguration> fusion;
  DecisionPolicy decision;
  std::map<std::string, MethodDeclaration> methods;
  std::map<std::string, InterplayGroup> interplay_groups;
  std::vector<RangeTransform> range_transforms;

  /// "sha256:<hex>" of canonicalConfigJson(); set by the loader.
  std::string config_hash;

  const MethodDeclaration* findMethod(const std::string& method_id) const;
  const FusionConfiguration* findFusion(MethodRole role) const;
  const InterplayGroup* findGroup(const std::string& group_id) const;

  /// @brief First transform whose role list names the role, or nullptr.
  const UnitTransform* unitTransformFor(MethodRole role) const;

  /// @brief True if a declared transform converts from one range to another.
  bool hasRangeTransform(const OutputRange& from, const OutputRange& to) const;
};

/// @brief Deterministic JSON form of a configuration (config_hash excluded).
///
/// Map-backed sections serialize in key order and list sections in declared
/// order, so equal configurations always produce identical bytes.
std::string canonicalConfigJson(const CalibrationConfig& config);

}  // namespace calib

#endif  // CALIB_CONFIG_CALIBRATION_CONFIG_H
