// Tests for decision/plan_report.h -- plan aggregation and reporting.

#include "decision/plan_report.h"

#include <gtest/gtest.h>

#include "core/json_parser.h"

namespace calib {
namespace {

ValidationDecision makeDecision(const std::string& method, Decision kind, double score) {
  ValidationDecision decision;
  decision.method_id = method;
  decision.node_id = method;
  decision.decision = kind;
  decision.score = score;
  decision.threshold = 0.7;
  if (kind == Decision::Fail) decision.reason = FailureReason::ScoreBelowThreshold;
  if (kind == Decision::Skipped) decision.skip_reason = "excluded";
  return decision;
}

class PlanReportTest : public ::testing::Test {
 protected:
  void SetUp() override { policy_.plan_conditional_pass_rate = 0.8; }

  DecisionPolicy policy_;
};

TEST_F(PlanReportTest, SummarizeCountsEachKind) {
  PlanSummary summary = summarizeDecisions({makeDecision("a", Decision::Pass, 0.9),
                                            makeDecision("b", Decision::Fail, 0.4),
                                            makeDecision("c", Decision::ConditionalPass, 0.68),
                                            makeDecision("d", Decision::Skipped, 0.0),
                                            makeDecision("e", Decision::Pass, 0.95)});
  EXPECT_EQ(summary.total, 5u);
  EXPECT_EQ(summary.passed, 2u);
  EXPECT_EQ(summary.failed, 1u);
  EXPECT_EQ(summary.conditional_pass, 1u);
  EXPECT_EQ(summary.skipped, 1u);
}

TEST_F(PlanReportTest, OverallDecision) {
  PlanSummary all_skipped{3, 0, 0, 0, 3};
  EXPECT_EQ(overallDecision(all_skipped, 0.8), Decision::Skipped);
  PlanSummary empty;
  EXPECT_EQ(overallDecision(empty, 0.8), Decision::Skipped);

  PlanSummary all_pass{3, 2, 0, 0, 1};
  EXPECT_EQ(overallDecision(all_pass, 0.8), Decision::Pass);

  // 4 of 5 evaluated passed.
  PlanSummary mostly{6, 4, 1, 0, 1};
  EXPECT_EQ(overallDecision(mostly, 0.8), Decision::ConditionalPass);

  PlanSummary conditional_only{2, 1, 0, 1, 0};
  EXPECT_EQ(overallDecision(conditional_only, 0.8), Decision::Fail);
  EXPECT_EQ(overallDecision(conditional_only, 0.5), Decision::ConditionalPass);

  PlanSummary poor{4, 2, 1, 0, 1};
  EXPECT_EQ(overallDecision(poor, 0.8), Decision::Fail);
}

TEST_F(PlanReportTest, PassRateCountsSkippedInTotal) {
  PlanReport report = buildPlanReport({makeDecision("a", Decision::Pass, 0.98),
                                       makeDecision("b", Decision::Fail, 0.61),
                                       makeDecision("c", Decision::Pass, 0.52),
                                       makeDecision("d", Decision::Skipped, 0.0)},
                                      policy_);
  ASSERT_TRUE(report.success);
  EXPECT_DOUBLE_EQ(report.pass_rate, 0.5);
  EXPECT_EQ(report.overall_decision, Decision::Fail);
  ASSERT_EQ(report.per_method.size(), 4u);
  EXPECT_EQ(report.per_method[1].method_id, "b");
}

TEST_F(PlanReportTest, EmptyPlan) {
  PlanReport report = buildPlanReport({}, policy_);
  EXPECT_TRUE(report.success);
  EXPECT_DOUBLE_EQ(report.pass_rate, 0.0);
  EXPECT_EQ(report.overall_decision, Decision::Skipped);
}

TEST_F(PlanReportTest, JsonLayout) {
  PlanReport report = buildPlanReport({makeDecision("a", Decision::Pass, 0.9),
                                       makeDecision("d", Decision::Skipped, 0.0)},
                                      policy_);
  std::string json = report.toJson();
  for (const char* key : {"\"overall_decision\": \"PASS\"", "\"pass_rate\": 0.5",
                          "\"passed\": 1", "\"failed\": 0", "\"conditional_pass\": 0",
                          "\"skipped\": 1", "\"total\": 2", "\"per_method\"",
                          "\"skip_reason\": \"excluded\""}) {
    EXPECT_NE(json.find(key), std::string::npos) << key;
  }
  JsonValue parsed;
  std::string error;
  EXPECT_TRUE(parseJson(json, parsed, error)) << error;
}

TEST_F(PlanReportTest, ErrorReport) {
  PlanReport report;
  report.success = false;
  report.error_message = "no fusion configuration for role utility";
  std::string json = report.toJson();
  EXPECT_NE(json.find("\"error\""), std::string::npos);
  EXPECT_EQ(json.find("\"per_method\""), std::string::npos);
  EXPECT_NE(report.toTextSummary().find("Plan not evaluated"), std::string::npos);
}

TEST_F(PlanReportTest, TextSummary) {
  ValidationDecision failed = makeDecision("b", Decision::Fail, 0.61);
  failed.node_id = "q002.causal";
  PlanReport report = buildPlanReport(
      {makeDecision("a", Decision::Pass, 0.9), failed, makeDecision("d", Decision::Skipped, 0.0)},
      policy_);
  std::string text = report.toTextSummary();
  EXPECT_NE(text.find("Overall: FAIL"), std::string::npos);
  EXPECT_NE(text.find("Pass rate: 33.3%"), std::string::npos);
  EXPECT_NE(text.find("b @q002.causal"), std::string::npos);
  EXPECT_NE(text.find("SCORE_BELOW_THRESHOLD"), std::string::npos);
  EXPECT_NE(text.find("(excluded)"), std::string::npos);
}

}  // namespace
}  // namespace calib
