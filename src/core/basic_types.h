// Basic types for method calibration: layers, roles, context and subject.

#ifndef CALIB_CORE_BASIC_TYPES_H
#define CALIB_CORE_BASIC_TYPES_H

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace calib {

// ---------------------------------------------------------------------------
// Canonical layers
// ---------------------------------------------------------------------------

/// @brief The eight canonical scoring layers.
///
/// Closed set. Every dispatch over this enum is a switch without a default
/// label so that adding a value is flagged by -Wswitch everywhere it matters.
enum class CanonicalLayer : uint8_t {
  Base,        ///< @b: intrinsic quality from the registry.
  Chain,       ///< @chain: data-flow contract compatibility.
  Unit,        ///< @u: unit-of-analysis quality sensitivity.
  Question,    ///< @q: question compatibility.
  Dimension,   ///< @d: dimension compatibility.
  Policy,      ///< @p: policy-area compatibility.
  Congruence,  ///< @C: interplay congruence.
  Meta         ///< @m: transparency, governance and cost.
};

/// Number of canonical layers.
constexpr size_t kLayerCount = 8;

/// All layers in canonical order.
constexpr std::array<CanonicalLayer, kLayerCount> kAllLayers = {
    CanonicalLayer::Base,     CanonicalLayer::Chain,     CanonicalLayer::Unit,
    CanonicalLayer::Question, CanonicalLayer::Dimension, CanonicalLayer::Policy,
    CanonicalLayer::Congruence, CanonicalLayer::Meta};

/// @brief Wire name of a layer ("@b", "@chain", ...).
const char* layerToString(CanonicalLayer layer);

/// @brief Descriptive lowercase name ("base", "chain", ...).
const char* layerDisplayName(CanonicalLayer layer);

/// @brief Parse a layer from its wire name.
/// @param str Wire name such as "@q".
/// @param out Receives the parsed layer on success.
/// @return False if the name is not one of the eight canonical names.
bool layerFromString(const std::string& str, CanonicalLayer& out);

/// @brief Position of a layer in canonical order (0..7).
constexpr size_t layerIndex(CanonicalLayer layer) {
  return static_cast<size_t>(layer);
}

/// @brief True for the three contextual layers (@q, @d, @p).
bool isContextualLayer(CanonicalLayer layer);

/// Ordered set of layers, kept sorted in canonical order without duplicates.
using LayerSet = std::vector<CanonicalLayer>;

/// @brief Insert a layer keeping canonical order; no-op if present.
void layerSetInsert(LayerSet& set, CanonicalLayer layer);

/// @brief Membership test for a LayerSet.
bool layerSetContains(const LayerSet& set, CanonicalLayer layer);

// ---------------------------------------------------------------------------
// Method roles
// ---------------------------------------------------------------------------

/// @brief Functional category of an analysis method.
enum class MethodRole : uint8_t {
  Analyzer,
  Processor,
  Ingest,
  Structure,
  Extract,
  Aggregate,
  Report,
  Utility,
  Orchestrator,
  Meta,
  Transform
};

/// Number of catalogued roles.
constexpr size_t kRoleCount = 11;

/// All roles in declaration order.
constexpr std::array<MethodRole, kRoleCount> kAllRoles = {
    MethodRole::Analyzer,  MethodRole::Processor, MethodRole::Ingest,
    MethodRole::Structure, MethodRole::Extract,   MethodRole::Aggregate,
    MethodRole::Report,    MethodRole::Utility,   MethodRole::Orchestrator,
    MethodRole::Meta,      MethodRole::Transform};

/// @brief Convert MethodRole to its lowercase configuration name.
const char* roleToString(MethodRole role);

/// @brief Parse a role from its configuration name (e.g. "analyzer").
/// @return False on unrecognized input.
bool roleFromString(const std::string& str, MethodRole& out);

// ---------------------------------------------------------------------------
// Subject
// ---------------------------------------------------------------------------

/// Execution context a method is calibrated for.
struct CalibrationContext {
  std::string question_id;
  std::string dimension;
  std::string policy_area;
  double unit_quality = 0.0;  ///< U in [0, 1].
};

/// @brief Mutable description of a subject, used while parsing input.
struct SubjectSpec {
  std::string method_id;
  MethodRole role = MethodRole::Utility;
  std::string node_id;           ///< Empty = same as method_id.
  std::string interplay_group;   ///< Empty = method acts alone.
  CalibrationContext context;
};

/// @brief What is being scored: a method bound to a role and context.
///
/// Immutable. Only create() constructs one, after validating the spec.
class CalibrationSubject {
 public:
  /// @brief Validate a SubjectSpec and build a subject.
  /// @param spec Subject description.
  /// @param error Receives the reason on failure (may be nullptr).
  /// @return Subject, or std::nullopt if method_id is empty or
  ///         unit_quality lies outside [0, 1].
  static std::optional<CalibrationSubject> create(const SubjectSpec& spec,
                                                  std::string* error = nullptr);

  const std::string& methodId() const { return method_id_; }
  MethodRole role() const { return role_; }
  const std::string& nodeId() const { return node_id_; }
  const std::string& interplayGroup() const { return interplay_group_; }
  bool inInterplayGroup() const { return !interplay_group_.empty(); }
  const CalibrationContext& context() const { return context_; }

 private:
  CalibrationSubject() = default;

  std::string method_id_;
  MethodRole role_ = MethodRole::Utility;
  std::string node_id_;
  std::string interplay_group_;
  CalibrationContext context_;
};

// ---------------------------------------------------------------------------
// Layer score
// ---------------------------------------------------------------------------

/// @brief Result of one layer evaluator for one subject.
///
/// Produced once per layer per subject; never modified afterwards.
struct LayerScore {
  CanonicalLayer layer = CanonicalLayer::Base;
  double value = 0.0;                          ///< In [0, 1].
  std::map<std::string, double> components;    ///< Named sub-scores.
  std::map<std::string, std::string> evidence; ///< Snapshot of inputs used.
  std::string formula;                         ///< Formula that produced value.
  std::string rationale;                       ///< Human-readable explanation.
};

/// @brief Format a double with fixed significant digits for traces.
/// @param val Value to format.
/// @param precision Significant digits (default: 6).
std::string formatNumber(double val, int precision = 6);

}  // namespace calib

#endif  // CALIB_CORE_BASIC_TYPES_H
