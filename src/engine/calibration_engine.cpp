// Calibration engine implementation.

#include "engine/calibration_engine.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdio>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

#include "certificate/certificate_builder.h"
#include "config/layer_requirements.h"
#include "fusion/choquet_fusion.h"
#include "layers/layer_catalog.h"

namespace calib {

CalibrationEngine::CalibrationEngine(std::shared_ptr<const CalibrationConfig> config,
                                     std::shared_ptr<const IIntrinsicRegistry> registry)
    : config_(std::move(config)), registry_(std::move(registry)) {}

double CalibrationEngine::thresholdFor(const CalibrationSubject& subject) const {
  return config_->decision.thresholdFor(subject.methodId(), subject.role());
}

CalibrationOutcome CalibrationEngine::calibrate(const CalibrationSubject& subject,
                                                const EvidenceBundle& evidence,
                                                const std::string& timestamp) const {
  CalibrationOutcome outcome;
  const CalibrationConfig& config = *config_;

  const FusionConfiguration* fusion = config.findFusion(subject.role());
  if (!fusion) {
    outcome.error_message = std::string("no fusion configuration for role '") +
                            roleToString(subject.role()) + "' (method " +
                            subject.methodId() + ")";
    std::fprintf(stderr, "[engine] ERROR: %s\n", outcome.error_message.c_str());
    return outcome;
  }

  ActiveLayerResolution resolution =
      resolveActiveLayers(config, subject.methodId(), subject.role());
  CertificateContext cert_ctx{config, registry_->version(), timestamp};
  LayerContext layer_ctx{subject, evidence, config, *registry_};
  double threshold = thresholdFor(subject);

  // Exclusion skips the subject before any layer runs, whatever its layers.
  IntrinsicRecord intrinsic = registry_->getIntrinsic(subject.methodId());
  if (intrinsic.status == IntrinsicStatus::Excluded) {
    outcome.success = true;
    outcome.certificate = buildSkippedCertificate(cert_ctx, subject, resolution.active,
                                                  intrinsicStatusToString(intrinsic.status));
    outcome.decision = decide(outcome.certificate, threshold, config.decision);
    return outcome;
  }

  std::vector<LayerScore> scores;
  std::map<CanonicalLayer, double> values;
  for (CanonicalLayer layer : resolution.active) {
    LayerEvaluation eval = evaluateLayer(layer, layer_ctx);
    if (eval.skipped) {
      outcome.success = true;
      outcome.certificate =
          buildSkippedCertificate(cert_ctx, subject, resolution.active, eval.skip_reason);
      outcome.decision = decide(outcome.certificate, threshold, config.decision);
      return outcome;
    }
    if (!eval.success) {
      outcome.success = true;
      outcome.certificate = buildFailClosedCertificate(cert_ctx, subject, resolution.active,
                                                       std::move(scores), eval.error);
      outcome.decision = decide(outcome.certificate, threshold, config.decision);
      return outcome;
    }
    values[layer] = eval.score.value;
    scores.push_back(std::move(eval.score));
  }

  FusionResult fused = fuseLayerScores(*fusion, values);
  if (!fused.success) {
    outcome.error_message = subject.methodId() + ": " + fused.error_message;
    return outcome;
  }

  outcome.success = true;
  outcome.certificate = buildScoredCertificate(cert_ctx, subject, resolution.active,
                                               std::move(scores), *fusion, fused);
  outcome.decision = decide(outcome.certificate, threshold, config.decision);
  return outcome;
}

// ---------------------------------------------------------------------------
// Plan validation
// ---------------------------------------------------------------------------

CalibrationOutcome CalibrationEngine::skippedOutcome(const CalibrationSubject& subject,
                                                     const std::string& reason,
                                                     const std::string& timestamp) const {
  CalibrationOutcome outcome;
  outcome.success = true;
  CertificateContext cert_ctx{*config_, registry_->version(), timestamp};
  LayerSet active = resolveActiveLayers(*config_, subject.methodId(), subject.role()).active;
  outcome.certificate = buildSkippedCertificate(cert_ctx, subject, active, reason);
  outcome.decision = decide(outcome.certificate, thresholdFor(subject), config_->decision);
  return outcome;
}

CalibrationOutcome CalibrationEngine::runSubject(const CalibrationSubject& subject,
                                                 const IEvidenceSupplier& supplier,
                                                 const PlanOptions& options,
                                                 const SupplyBudget& budget) const {
  if (budget.cancelled()) return skippedOutcome(subject, "cancelled", options.timestamp);

  EvidenceSupplyResult supplied = supplier.supply(subject, budget);
  if (budget.timedOut()) return skippedOutcome(subject, "timeout", options.timestamp);
  // A supplier that gave up on cancellation has no evidence to fail on.
  if (!supplied.success && budget.cancelled()) {
    return skippedOutcome(subject, "cancelled", options.timestamp);
  }

  CalibrationOutcome outcome;
  if (!supplied.success) {
    CertificateContext cert_ctx{*config_, registry_->version(), options.timestamp};
    LayerSet active = resolveActiveLayers(*config_, subject.methodId(), subject.role()).active;
    outcome.success = true;
    outcome.certificate =
        buildFailClosedCertificate(cert_ctx, subject, active, {}, supplied.error);
    outcome.decision = decide(outcome.certificate, thresholdFor(subject), config_->decision);
  } else {
    outcome = calibrate(subject, supplied.bundle, options.timestamp);
  }

  if (outcome.success && budget.timedOut()) {
    return skippedOutcome(subject, "timeout", options.timestamp);
  }
  return outcome;
}

namespace {

/// Outcome handoff between a timed subject thread and the worker waiting on it.
struct TimedTask {
  std::mutex mutex;
  std::condition_variable done_cv;
  bool done = false;
  CalibrationOutcome outcome;
};

}  // namespace

PlanReport CalibrationEngine::validatePlan(const std::vector<CalibrationSubject>& subjects,
                                           const IEvidenceSupplier& supplier,
                                           const PlanOptions& options,
                                           std::vector<CalibrationCertificate>* certificates) const {
  std::vector<CalibrationOutcome> slots(subjects.size());
  std::atomic<size_t> next_index{0};
  bool timed = options.timeout.count() > 0;

  // Subjects still running past their budget. Their results are discarded,
  // but they read caller-owned data and are joined before returning.
  std::mutex stragglers_mutex;
  std::vector<std::thread> stragglers;

  auto runTimed = [&](size_t idx, const SupplyBudget& budget) {
    auto task = std::make_shared<TimedTask>();
    std::thread runner([this, task, idx, budget, &subjects, &supplier, &options]() {
      CalibrationOutcome outcome = runSubject(subjects[idx], supplier, options, budget);
      std::lock_guard<std::mutex> lock(task->mutex);
      task->outcome = std::move(outcome);
      task->done = true;
      task->done_cv.notify_one();
    });

    std::unique_lock<std::mutex> lock(task->mutex);
    if (task->done_cv.wait_until(lock, budget.deadline, [&task]() { return task->done; })) {
      slots[idx] = std::move(task->outcome);
      lock.unlock();
      runner.join();
      return;
    }
    lock.unlock();
    std::fprintf(stderr, "[engine] WARNING: %s exceeded its %lld ms budget\n",
                 subjects[idx].nodeId().c_str(),
                 static_cast<long long>(options.timeout.count()));
    slots[idx] = skippedOutcome(subjects[idx], "timeout", options.timestamp);
    std::lock_guard<std::mutex> guard(stragglers_mutex);
    stragglers.push_back(std::move(runner));
  };

  auto worker = [&]() {
    for (;;) {
      size_t idx = next_index.fetch_add(1, std::memory_order_relaxed);
      if (idx >= subjects.size()) return;
      SupplyBudget budget;
      budget.cancel = options.cancel;
      if (!timed || budget.cancelled()) {
        slots[idx] = runSubject(subjects[idx], supplier, options, budget);
        continue;
      }
      budget.has_deadline = true;
      budget.deadline = std::chrono::steady_clock::now() + options.timeout;
      runTimed(idx, budget);
    }
  };

  size_t worker_count = std::max<size_t>(1, options.threads);
  worker_count = std::min(worker_count, std::max<size_t>(1, subjects.size()));
  if (worker_count == 1) {
    worker();
  } else {
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t idx = 0; idx < worker_count; ++idx) workers.emplace_back(worker);
    for (auto& thread : workers) {
      if (thread.joinable()) thread.join();
    }
  }
  for (auto& thread : stragglers) {
    if (thread.joinable()) thread.join();
  }

  std::vector<ValidationDecision> decisions;
  decisions.reserve(slots.size());
  std::string config_errors;
  for (auto& slot : slots) {
    if (!slot.success) {
      if (!config_errors.empty()) config_errors += "; ";
      config_errors += slot.error_message;
      continue;
    }
    decisions.push_back(slot.decision);
    if (certificates) certificates->push_back(std::move(slot.certificate));
  }

  PlanReport report = buildPlanReport(std::move(decisions), config_->decision);
  if (!config_errors.empty()) {
    report.success = false;
    report.error_message = config_errors;
    std::fprintf(stderr, "[engine] ERROR: plan aborted by configuration error: %s\n",
                 config_errors.c_str());
  }
  return report;
}

}  // namespace calib
