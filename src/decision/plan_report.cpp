// Plan report implementation.

#include "decision/plan_report.h"

#include <cstdio>
#include <sstream>

namespace calib {

PlanSummary summarizeDecisions(const std::vector<ValidationDecision>& decisions) {
  PlanSummary result;
  for (const auto& decision : decisions) {
    ++result.total;
    switch (decision.decision) {
      case Decision::Pass:
        ++result.passed;
        break;
      case Decision::ConditionalPass:
        ++result.conditional_pass;
        break;
      case Decision::Fail:
        ++result.failed;
        break;
      case Decision::Skipped:
        ++result.skipped;
        break;
    }
  }
  return result;
}

Decision overallDecision(const PlanSummary& summary, double conditional_pass_rate) {
  uint32_t evaluated = summary.total - summary.skipped;
  if (evaluated == 0) return Decision::Skipped;
  if (summary.failed == 0 && summary.conditional_pass == 0) return Decision::Pass;
  double evaluated_rate = static_cast<double>(summary.passed) / static_cast<double>(evaluated);
  if (evaluated_rate >= conditional_pass_rate) return Decision::ConditionalPass;
  return Decision::Fail;
}

PlanReport buildPlanReport(std::vector<ValidationDecision> decisions,
                           const DecisionPolicy& policy) {
  PlanReport report;
  report.success = true;
  report.summary = summarizeDecisions(decisions);
  report.pass_rate = report.summary.total == 0
                         ? 0.0
                         : static_cast<double>(report.summary.passed) /
                               static_cast<double>(report.summary.total);
  report.overall_decision = overallDecision(report.summary, policy.plan_conditional_pass_rate);
  report.per_method = std::move(decisions);
  return report;
}

std::string PlanReport::toTextSummary() const {
  std::ostringstream oss;
  if (!success) {
    oss << "Plan not evaluated: " << error_message << "\n";
    return oss.str();
  }
  oss << "=== Plan Validation ===\n";
  oss << "Overall: " << decisionToString(overall_decision) << "\n";
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f%%", pass_rate * 100.0);
  oss << "Total: " << summary.total << " | Passed: " << summary.passed
      << " | Conditional: " << summary.conditional_pass << " | Failed: " << summary.failed
      << " | Skipped: " << summary.skipped << " | Pass rate: " << buf << "\n";
  for (const auto& decision : per_method) {
    std::snprintf(buf, sizeof(buf), "%.4f", decision.score);
    oss << "  " << decisionToString(decision.decision) << "  " << decision.method_id;
    if (decision.node_id != decision.method_id) oss << " @" << decision.node_id;
    oss << "  score=" << buf;
    if (decision.decision == Decision::Fail) {
      oss << "  " << failureReasonToString(decision.reason);
    } else if (decision.decision == Decision::Skipped) {
      oss << "  (" << decision.skip_reason << ")";
    }
    oss << "\n";
  }
  return oss.str();
}

std::string PlanReport::toJson() const {
  JsonWriter writer;
  writer.beginObject();
  if (!success) {
    writer.key("error");
    writer.value(std::string_view(error_message));
    writer.endObject();
    return writer.toPrettyString();
  }
  writer.key("overall_decision");
  writer.value(decisionToString(overall_decision));
  writer.key("pass_rate");
  writer.value(pass_rate);
  writer.key("passed");
  writer.value(summary.passed);
  writer.key("failed");
  writer.value(summary.failed);
  writer.key("conditional_pass");
  writer.value(summary.conditional_pass);
  writer.key("skipped");
  writer.value(summary.skipped);
  writer.key("total");
  writer.value(summary.total);
  writer.key("per_method");
  writer.beginArray();
  for (const auto& decision : per_method) writeDecisionJson(writer, decision);
  writer.endArray();
  writer.endObject();
  return writer.toPrettyString();
}

}  // namespace calib
