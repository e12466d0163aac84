// Validation decision for one calibration certificate.

#ifndef CALIB_DECISION_VALIDATION_DECISION_H
#define CALIB_DECISION_VALIDATION_DECISION_H

#include <cstdint>
#include <string>
#include <vector>

#include "certificate/calibration_certificate.h"
#include "config/calibration_config.h"
#include "core/json_helpers.h"

namespace calib {

/// Gate outcome for one method.
enum class Decision : uint8_t {
  Pass,
  ConditionalPass,  ///< Within the conditional band below threshold.
  Fail,
  Skipped           ///< Not evaluated; see skip_reason.
};

/// @brief "PASS", "CONDITIONAL_PASS", "FAIL" or "SKIPPED".
const char* decisionToString(Decision decision);

/// Attributed cause of a FAIL.
enum class FailureReason : uint8_t {
  None,
  ScoreBelowThreshold,  ///< No layer fell below the floor.
  BaseLayerLow,
  ChainLayerFail,
  UnitLayerFail,
  CongruenceFail,
  ContextualFail,
  MetaLayerFail
};

/// @brief Taxonomy name, e.g. "CHAIN_LAYER_FAIL".
const char* failureReasonToString(FailureReason reason);

/// @brief Failure reason attributed to a layer.
FailureReason failureReasonForLayer(CanonicalLayer layer);

/// @brief Remediation advice for a failure reason, most useful first.
std::vector<std::string> recommendationsFor(FailureReason reason);

/// Share of the fused score carried by one layer.
struct LayerAttribution {
  CanonicalLayer layer = CanonicalLayer::Base;
  double contribution = 0.0;  ///< Weighted mean of the terms involving the layer.
};

/// @brief Normalized contribution of every active layer.
///
/// For layer l: (a_l*x_l + sum of interaction contributions involving l)
/// divided by (a_l + sum of those interaction weights). When that weight is
/// zero the layer's own score is used. Returned in canonical order.
std::vector<LayerAttribution> normalizedContributions(const CalibrationCertificate& cert);

/// @brief Decision for one subject, with attribution on FAIL.
struct ValidationDecision {
  std::string method_id;
  std::string node_id;
  Decision decision = Decision::Fail;
  double score = 0.0;
  double threshold = 0.0;
  FailureReason reason = FailureReason::None;
  bool has_failed_layer = false;
  CanonicalLayer failed_layer = CanonicalLayer::Base;
  std::string failure_details;
  std::vector<std::string> recommendations;
  std::string skip_reason;      ///< Registry status, "timeout" or "cancelled".
  std::string certificate_id;   ///< instance_id of the certificate decided on.
};

/// @brief Decide PASS / CONDITIONAL_PASS / FAIL / SKIPPED for a certificate.
///
/// score >= threshold passes; threshold - conditional_band <= score passes
/// conditionally; anything lower fails and is attributed to the active
/// layer with the lowest normalized contribution below layer_floor.
/// Fail-closed certificates fail with the reason of the layer whose
/// evidence was missing. A scored certificate that failed its completeness
/// check fails with the reason of its first uncovered required layer.
///
/// @param cert Certificate to decide on.
/// @param threshold Resolved threshold for the subject.
/// @param policy Bands and floors.
ValidationDecision decide(const CalibrationCertificate& cert, double threshold,
                          const DecisionPolicy& policy);

/// @brief Append one decision as a JSON object.
void writeDecisionJson(JsonWriter& writer, const ValidationDecision& decision);

}  // namespace calib

#endif  // CALIB_DECISION_VALIDATION_DECISION_H
