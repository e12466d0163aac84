// Per-subject evidence sources for the calibration engine.

#ifndef CALIB_ENGINE_EVIDENCE_SUPPLIER_H
#define CALIB_ENGINE_EVIDENCE_SUPPLIER_H

#include <atomic>
#include <chrono>
#include <map>
#include <string>

#include "core/basic_types.h"
#include "layers/evidence.h"

namespace calib {

/// @brief Cooperative cancellation shared between a caller and plan workers.
class CancellationToken {
 public:
  void cancel() { cancelled_.store(true, std::memory_order_release); }
  bool isCancelled() const { return cancelled_.load(std::memory_order_acquire); }

 private:
  std::atomic<bool> cancelled_{false};
};

/// @brief Time and cancellation limits a supplier should respect.
///
/// A supplier that blocks should poll exhausted() and give up once it is
/// true; its result is discarded by then anyway.
struct SupplyBudget {
  bool has_deadline = false;
  std::chrono::steady_clock::time_point deadline;
  const CancellationToken* cancel = nullptr;

  bool timedOut() const {
    return has_deadline && std::chrono::steady_clock::now() >= deadline;
  }
  bool cancelled() const { return cancel && cancel->isCancelled(); }
  bool exhausted() const { return timedOut() || cancelled(); }
};

/// Evidence for one subject, or the reason it could not be produced.
struct EvidenceSupplyResult {
  bool success = false;
  EvidenceBundle bundle;
  EvidenceError error;
};

/// @brief Source of evidence bundles.
///
/// supply() may block (e.g. while upstream contract checks run) and is
/// called concurrently from plan workers; implementations must be
/// thread-safe.
class IEvidenceSupplier {
 public:
  virtual ~IEvidenceSupplier() = default;

  /// @brief Evidence for a subject.
  /// @param subject Subject whose evidence is wanted.
  /// @param budget Deadline and cancellation for this call.
  virtual EvidenceSupplyResult supply(const CalibrationSubject& subject,
                                      const SupplyBudget& budget) const = 0;
};

/// @brief Fixed bundles (or evidence errors) keyed by node id.
///
/// A subject whose node has no entry receives an empty bundle, so every
/// layer that needs evidence fails closed.
class StaticEvidenceSupplier : public IEvidenceSupplier {
 public:
  StaticEvidenceSupplier() = default;

  /// @brief Register the bundle for a node. Replaces an earlier one.
  void add(const std::string& node_id, EvidenceBundle bundle);

  /// @brief Record that a node's evidence could not be read.
  void addError(const std::string& node_id, EvidenceError error);

  EvidenceSupplyResult supply(const CalibrationSubject& subject,
                              const SupplyBudget& budget) const override;

  size_t size() const { return bundles_.size(); }

 private:
  std::map<std::string, EvidenceSupplyResult> bundles_;
};

}  // namespace calib

#endif  // CALIB_ENGINE_EVIDENCE_SUPPLIER_H
