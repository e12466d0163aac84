// Aggregate report over the decisions of a validation plan.

#ifndef CALIB_DECISION_PLAN_REPORT_H
#define CALIB_DECISION_PLAN_REPORT_H

#include <cstdint>
#include <string>
#include <vector>

#include "decision/validation_decision.h"

namespace calib {

/// Counts of decisions by kind.
struct PlanSummary {
  uint32_t total = 0;
  uint32_t passed = 0;
  uint32_t failed = 0;
  uint32_t conditional_pass = 0;
  uint32_t skipped = 0;
};

/// @brief Outcome of validating a whole plan.
///
/// success is false only when the plan could not be evaluated at all
/// (configuration error); per-method failures are ordinary decisions.
struct PlanReport {
  bool success = false;
  std::string error_message;
  Decision overall_decision = Decision::Skipped;
  PlanSummary summary;
  double pass_rate = 0.0;  ///< passed / total.
  std::vector<ValidationDecision> per_method;  ///< Input order.

  /// @brief Human-readable summary for the console.
  std::string toTextSummary() const;

  /// @brief Serialize to a JSON string.
  std::string toJson() const;
};

/// @brief Count decisions.
PlanSummary summarizeDecisions(const std::vector<ValidationDecision>& decisions);

/// @brief Overall plan decision from decision counts.
///
/// SKIPPED when nothing was evaluated; PASS when nothing failed or passed
/// conditionally; CONDITIONAL_PASS when passed / evaluated reaches
/// `conditional_pass_rate`; FAIL otherwise.
Decision overallDecision(const PlanSummary& summary, double conditional_pass_rate);

/// @brief Build a successful report from per-method decisions.
PlanReport buildPlanReport(std::vector<ValidationDecision> decisions,
                           const DecisionPolicy& policy);

}  // namespace calib

#endif  // CALIB_DECISION_PLAN_REPORT_H
