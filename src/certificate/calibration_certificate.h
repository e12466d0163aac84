// Immutable, self-verifying audit record of one calibration.

#ifndef CALIB_CERTIFICATE_CALIBRATION_CERTIFICATE_H
#define CALIB_CERTIFICATE_CALIBRATION_CERTIFICATE_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "fusion/choquet_fusion.h"
#include "layers/evidence.h"

namespace calib {

/// Version string stamped into every certificate's audit trail.
constexpr const char* kValidatorVersion = "calib-validator/1.0.0";

/// How the certificate's score came about.
enum class CertificateStatus : uint8_t {
  Scored,      ///< Every active layer was evaluated and fused.
  FailClosed,  ///< A layer lacked required evidence; score forced to 0.
  Skipped      ///< Not evaluated (registry exclusion, timeout, cancellation).
};

const char* certificateStatusToString(CertificateStatus status);

/// Where one weight or constant used by the calculation came from.
struct ParameterProvenance {
  std::string name;     ///< e.g. "linear.@b", "interaction.(@u,@chain)".
  double value = 0.0;
  std::string source;
  std::string version;
};

/// Outcome of one post-hoc validation check.
struct ValidationCheck {
  bool passed = false;
  std::string detail;
  LayerSet missing_layers;  ///< Completeness: required layers neither active nor justified.
};

/// @brief Which input moves the score most.
struct SensitivityAnalysis {
  bool has_layer = false;
  CanonicalLayer most_impactful_layer = CanonicalLayer::Base;
  double layer_marginal_gain = 0.0;       ///< d(final)/d(x_l).
  bool has_interaction = false;
  std::string most_impactful_interaction; ///< Pair label.
  double interaction_attainable_gain = 0.0;  ///< w * (1 - min).
};

/// @brief Complete record of how one subject's score was produced.
///
/// Built once by the certificate builder and never modified. instance_id
/// is the SHA-256 of the rest of the content, so two certificates built
/// from identical inputs (timestamp included) are byte-identical.
struct CalibrationCertificate {
  std::string instance_id;
  CertificateStatus status = CertificateStatus::Scored;

  std::string method_id;
  std::string node_id;
  std::string interplay_group;
  MethodRole role = MethodRole::Utility;
  CalibrationContext context;

  LayerSet active_layers;
  std::vector<LayerScore> layer_scores;  ///< Canonical order.
  std::vector<FusionTerm> trace;         ///< Fusion terms in evaluation order.
  double linear_sum = 0.0;
  double interaction_sum = 0.0;
  double calibration_score = 0.0;

  std::string symbolic_formula;
  std::string expanded_formula;
  std::vector<ParameterProvenance> provenance;

  ValidationCheck boundedness;
  ValidationCheck normalization;
  ValidationCheck completeness;
  SensitivityAnalysis sensitivity;

  EvidenceError evidence_error;  ///< Meaningful for FailClosed.
  std::string skip_reason;       ///< Meaningful for Skipped.

  std::string timestamp;
  std::string config_hash;
  std::string graph_hash;
  std::string registry_version;
  std::string validator_version;

  /// @brief Score of a layer, or nullptr if it was not evaluated.
  const LayerScore* findLayerScore(CanonicalLayer layer) const;
};

/// @brief Serialize a certificate.
/// @param cert Certificate to write.
/// @param pretty Indented output when true.
std::string certificateToJson(const CalibrationCertificate& cert, bool pretty = true);

/// @brief SHA-256 of the certificate content with instance_id left empty.
std::string computeInstanceId(const CalibrationCertificate& cert);

/// Result of replaying a certificate.
struct CertificateVerification {
  bool success = false;
  std::string error_message;
};

/// @brief Replay the computation trace and compare with the recorded values.
///
/// The replayed linear sum, interaction sum and final score must equal the
/// recorded ones exactly; every linear term must match its layer score and
/// every interaction input must be the minimum of its two layer scores; the
/// instance id must match the content. Skipped and fail-closed certificates
/// verify when their score is 0 and their trace is empty.
CertificateVerification verifyCertificate(const CalibrationCertificate& cert);

}  // namespace calib

#endif  // CALIB_CERTIFICATE_CALIBRATION_CERTIFICATE_H
