// Calibration engine: resolve layers, evaluate, fuse, certify, decide.

#ifndef CALIB_ENGINE_CALIBRATION_ENGINE_H
#define CALIB_ENGINE_CALIBRATION_ENGINE_H

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "certificate/calibration_certificate.h"
#include "config/calibration_config.h"
#include "decision/plan_report.h"
#include "decision/validation_decision.h"
#include "engine/evidence_supplier.h"
#include "registry/intrinsic_registry.h"

namespace calib {

/// @brief Result of calibrating one subject.
///
/// success is false only for configuration errors (no fusion weights for
/// the role, or a fused score outside [0, 1]). Evidence problems and
/// registry exclusions are successful outcomes with a fail-closed or
/// skipped certificate.
struct CalibrationOutcome {
  bool success = false;
  std::string error_message;
  CalibrationCertificate certificate;
  ValidationDecision decision;
};

/// Options for validatePlan().
struct PlanOptions {
  std::string timestamp;                      ///< Stamped into every certificate.
  unsigned threads = 1;                       ///< Worker count (at least 1 is used).
  std::chrono::milliseconds timeout{0};       ///< Per-subject budget; 0 = unlimited.
  const CancellationToken* cancel = nullptr;  ///< Optional.
};

/// @brief Stateless facade over the shared configuration and registry.
///
/// Holds only immutable shared state, so one engine may serve any number of
/// threads at once.
class CalibrationEngine {
 public:
  CalibrationEngine(std::shared_ptr<const CalibrationConfig> config,
                    std::shared_ptr<const IIntrinsicRegistry> registry);

  /// @brief Calibrate one subject with the evidence given.
  /// @param subject Subject to score.
  /// @param evidence Per-layer evidence for the subject.
  /// @param timestamp Audit timestamp for the certificate.
  CalibrationOutcome calibrate(const CalibrationSubject& subject, const EvidenceBundle& evidence,
                               const std::string& timestamp) const;

  /// @brief Calibrate every subject and aggregate the decisions.
  ///
  /// Subjects are processed by `options.threads` workers; the report lists
  /// decisions in input order. A subject that exceeds the timeout, or has
  /// not started when cancellation is requested, is SKIPPED with reason
  /// "timeout" or "cancelled". With a timeout set, each subject runs on its
  /// own thread and its worker stops waiting once the budget is spent, so a
  /// blocked supplier never delays the next subject. The supplier receives
  /// the deadline and token and should give up cooperatively; any subject
  /// still running is joined before this returns.
  ///
  /// @param subjects Subjects in plan order.
  /// @param supplier Evidence source, called once per subject.
  /// @param options Threads, timeout, cancellation and timestamp.
  /// @param certificates If non-null, receives one certificate per subject
  ///        in input order.
  PlanReport validatePlan(const std::vector<CalibrationSubject>& subjects,
                          const IEvidenceSupplier& supplier, const PlanOptions& options,
                          std::vector<CalibrationCertificate>* certificates = nullptr) const;

  /// @brief Threshold applying to a subject.
  double thresholdFor(const CalibrationSubject& subject) const;

  const CalibrationConfig& config() const { return *config_; }

 private:
  CalibrationOutcome skippedOutcome(const CalibrationSubject& subject,
                                    const std::string& reason,
                                    const std::string& timestamp) const;

  CalibrationOutcome runSubject(const CalibrationSubject& subject,
                                const IEvidenceSupplier& supplier, const PlanOptions& options,
                                const SupplyBudget& budget) const;

  std::shared_ptr<const CalibrationConfig> config_;
  std::shared_ptr<const IIntrinsicRegistry> registry_;
};

}  // namespace calib

#endif  // CALIB_ENGINE_CALIBRATION_ENGINE_H
