// Assembly of calibration certificates from layer scores and fusion output.

#ifndef CALIB_CERTIFICATE_CERTIFICATE_BUILDER_H
#define CALIB_CERTIFICATE_CERTIFICATE_BUILDER_H

#include <string>
#include <vector>

#include "certificate/calibration_certificate.h"
#include "config/calibration_config.h"

namespace calib {

/// Symbolic form of the 2-additive Choquet integral.
constexpr const char* kSymbolicFusionFormula =
    "Cal(I) = sum_l a_l*x_l + sum_(l,k) a_lk*min(x_l, x_k)";

/// @brief Audit fields shared by every certificate of a run.
struct CertificateContext {
  const CalibrationConfig& config;
  std::string registry_version;
  std::string timestamp;  ///< Supplied by the caller so runs are reproducible.
};

/// @brief SHA-256 over the subject's node id and its interplay group.
///
/// Group members are sorted (the subject included) so that member order in
/// the configuration does not change the hash.
std::string computeGraphHash(const CalibrationConfig& config, const CalibrationSubject& subject);

/// @brief Certificate for a subject whose layers were all evaluated and fused.
/// @param ctx Audit fields.
/// @param subject Calibrated subject.
/// @param active Active layers.
/// @param scores One score per active layer, canonical order.
/// @param fusion Weights used.
/// @param fused Successful fusion result for `scores`.
CalibrationCertificate buildScoredCertificate(const CertificateContext& ctx,
                                              const CalibrationSubject& subject,
                                              const LayerSet& active,
                                              std::vector<LayerScore> scores,
                                              const FusionConfiguration& fusion,
                                              const FusionResult& fused);

/// @brief Certificate for a subject that failed closed on missing evidence.
///
/// Keeps the scores of the layers evaluated before the failure; the final
/// score is 0 and the trace is empty.
CalibrationCertificate buildFailClosedCertificate(const CertificateContext& ctx,
                                                  const CalibrationSubject& subject,
                                                  const LayerSet& active,
                                                  std::vector<LayerScore> evaluated,
                                                  const EvidenceError& error);

/// @brief Certificate for a subject that was not evaluated.
/// @param reason Registry status ("excluded"), "timeout" or "cancelled".
CalibrationCertificate buildSkippedCertificate(const CertificateContext& ctx,
                                               const CalibrationSubject& subject,
                                               const LayerSet& active, const std::string& reason);

}  // namespace calib

#endif  // CALIB_CERTIFICATE_CERTIFICATE_BUILDER_H
