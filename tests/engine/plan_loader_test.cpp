// Tests for engine/plan_loader.h -- plan parsing.

#include "engine/plan_loader.h"

#include <gtest/gtest.h>

#include "test_helpers.h"

namespace calib {
namespace {

constexpr const char* kContext =
    R"("context": {"question": "Q001", "dimension": "D1", "policy": "P1", "unit_quality": 0.8})";

std::string planWith(const std::string& subjects) {
  return std::string(R"({"timestamp": "2025-01-01T00:00:00Z", "subjects": [)") + subjects + "]}";
}

class PlanLoaderTest : public ::testing::Test {
 protected:
  PlanLoadResult parse(const std::string& text) { return parsePlan(text, *config_); }

  std::shared_ptr<const CalibrationConfig> config_ = test_helpers::sampleConfig();
};

TEST_F(PlanLoaderTest, ExamplePlan) {
  PlanLoadResult plan =
      loadPlan(test_helpers::sourcePath("config/example_plan.json"), *config_);
  ASSERT_TRUE(plan.success) << plan.error_message;
  ASSERT_EQ(plan.subjects.size(), 4u);
  EXPECT_EQ(plan.timestamp, "2025-06-01T12:00:00Z");
  // The normalizer carries no evidence.
  EXPECT_EQ(plan.evidence->size(), 3u);

  const CalibrationSubject& causal = plan.subjects[1];
  EXPECT_EQ(causal.methodId(), test_helpers::kCausal);
  EXPECT_EQ(causal.role(), MethodRole::Analyzer);
  EXPECT_EQ(causal.nodeId(), "q002.causal");
  EXPECT_EQ(causal.interplayGroup(), "causal_ensemble");
  EXPECT_DOUBLE_EQ(causal.context().unit_quality, 0.55);
  EXPECT_EQ(causal.context().policy_area, "P3");
}

TEST_F(PlanLoaderTest, RoleInferredForDeclaredMethod) {
  PlanLoadResult plan = parse(
      planWith(std::string(R"({"method": "ingest.pdf.DocumentLoader.load", )") + kContext + "}"));
  ASSERT_TRUE(plan.success) << plan.error_message;
  EXPECT_EQ(plan.subjects[0].role(), MethodRole::Ingest);
  EXPECT_EQ(plan.subjects[0].nodeId(), "ingest.pdf.DocumentLoader.load");
}

TEST_F(PlanLoaderTest, RoleMustMatchDeclaration) {
  PlanLoadResult plan = parse(planWith(
      std::string(R"({"method": "ingest.pdf.DocumentLoader.load", "role": "report", )") +
      kContext + "}"));
  EXPECT_FALSE(plan.success);
  EXPECT_NE(plan.error_message.find("conflicts with the declared role 'ingest'"),
            std::string::npos);
  EXPECT_NE(plan.error_message.find("plan.subjects[0].role"), std::string::npos);

  plan = parse(planWith(
      std::string(R"({"method": "ingest.pdf.DocumentLoader.load", "role": "ingest", )") +
      kContext + "}"));
  ASSERT_TRUE(plan.success) << plan.error_message;
  EXPECT_EQ(plan.subjects[0].role(), MethodRole::Ingest);
}

TEST_F(PlanLoaderTest, UndeclaredMethodNeedsRole) {
  PlanLoadResult plan =
      parse(planWith(std::string(R"({"method": "misc.Helper.run", )") + kContext + "}"));
  EXPECT_FALSE(plan.success);
  EXPECT_NE(plan.error_message.find("plan.subjects[0].role"), std::string::npos);

  plan = parse(planWith(std::string(R"({"method": "misc.Helper.run", "role": "utility", )") +
                        kContext + "}"));
  ASSERT_TRUE(plan.success) << plan.error_message;
  EXPECT_EQ(plan.subjects[0].role(), MethodRole::Utility);
}

TEST_F(PlanLoaderTest, UnknownRole) {
  PlanLoadResult plan = parse(planWith(
      std::string(R"({"method": "misc.Helper.run", "role": "wizard", )") + kContext + "}"));
  EXPECT_FALSE(plan.success);
  EXPECT_NE(plan.error_message.find("unknown role"), std::string::npos);
}

TEST_F(PlanLoaderTest, DuplicateNode) {
  std::string entry =
      std::string(R"({"method": "misc.Helper.run", "role": "utility", "node": "n1", )") +
      kContext + "}";
  PlanLoadResult plan = parse(planWith(entry + ", " + entry));
  EXPECT_FALSE(plan.success);
  EXPECT_NE(plan.error_message.find("duplicate node id 'n1'"), std::string::npos);
}

TEST_F(PlanLoaderTest, UnitQualityOutOfRange) {
  PlanLoadResult plan = parse(planWith(
      R"({"method": "misc.Helper.run", "role": "utility",
          "context": {"question": "Q001", "dimension": "D1", "policy": "P1",
                      "unit_quality": 1.5}})"));
  EXPECT_FALSE(plan.success);
  EXPECT_NE(plan.error_message.find("plan.subjects[0]"), std::string::npos);
}

TEST_F(PlanLoaderTest, MissingContext) {
  PlanLoadResult plan = parse(planWith(R"({"method": "misc.Helper.run", "role": "utility"})"));
  EXPECT_FALSE(plan.success);
  EXPECT_NE(plan.error_message.find(".context"), std::string::npos);
}

TEST_F(PlanLoaderTest, BadEvidenceFailsOnlyThatSubject) {
  PlanLoadResult plan = parse(planWith(
      std::string(R"({"method": "misc.Helper.run", "role": "utility", "evidence": {"unit": 5}, )") +
      kContext + "}"));
  ASSERT_TRUE(plan.success) << plan.error_message;
  EvidenceSupplyResult supplied = plan.evidence->supply(plan.subjects[0], SupplyBudget{});
  EXPECT_FALSE(supplied.success);
  EXPECT_EQ(supplied.error.layer, CanonicalLayer::Unit);
}

TEST_F(PlanLoaderTest, MalformedJson) {
  PlanLoadResult plan = parse("{\"subjects\": [");
  EXPECT_FALSE(plan.success);
  EXPECT_EQ(plan.error_message.rfind("plan: ", 0), 0u);

  plan = parse("{\"subjects\": 3}");
  EXPECT_FALSE(plan.success);
  EXPECT_NE(plan.error_message.find("plan.subjects"), std::string::npos);
}

TEST_F(PlanLoaderTest, MissingFile) {
  PlanLoadResult plan = loadPlan("/nonexistent/plan.json", *config_);
  EXPECT_FALSE(plan.success);
  EXPECT_NE(plan.error_message.find("cannot open"), std::string::npos);
}

}  // namespace
}  // namespace calib
