// Tests for layers/base_layer.h -- intrinsic quality.

#include "layers/base_layer.h"

#include <gtest/gtest.h>

#include "test_helpers.h"

namespace calib {
namespace {

LayerEvaluation evaluate(const std::string& method_id, MethodRole role) {
  auto config = test_helpers::sampleConfig();
  auto registry = test_helpers::sampleRegistry();
  CalibrationSubject subject = test_helpers::makeSubject(method_id, role);
  EvidenceBundle evidence;
  LayerContext ctx{subject, evidence, *config, *registry};
  return evaluateBaseLayer(ctx);
}

TEST(BaseLayerTest, ComputedRecordUsesWeightedComponents) {
  LayerEvaluation eval = evaluate(test_helpers::kBayesian, MethodRole::Analyzer);
  ASSERT_TRUE(eval.success);
  EXPECT_NEAR(eval.score.value, 0.4 * 0.92 + 0.35 * 0.88 + 0.25 * 0.9, 1e-12);
  EXPECT_EQ(eval.score.layer, CanonicalLayer::Base);
  EXPECT_DOUBLE_EQ(eval.score.components.at("b_theory"), 0.92);
  EXPECT_EQ(eval.score.evidence.at("intrinsic_status"), "computed");
  EXPECT_EQ(eval.score.evidence.at("registry_version"), "intrinsic-2025.06");
}

TEST(BaseLayerTest, PendingUsesNeutralFallback) {
  LayerEvaluation eval = evaluate(test_helpers::kAggregator, MethodRole::Aggregate);
  ASSERT_TRUE(eval.success);
  EXPECT_NEAR(eval.score.value, 0.5, 1e-12);
  EXPECT_EQ(eval.score.evidence.at("source"), "fallback (pending)");
}

TEST(BaseLayerTest, UnknownUsesPenalizingFallback) {
  LayerEvaluation eval = evaluate("nowhere.Nothing.run", MethodRole::Utility);
  ASSERT_TRUE(eval.success);
  EXPECT_NEAR(eval.score.value, 0.3, 1e-12);
  EXPECT_EQ(eval.score.evidence.at("intrinsic_status"), "none");
}

TEST(BaseLayerTest, ExcludedIsSkipped) {
  LayerEvaluation eval = evaluate(test_helpers::kNormalizer, MethodRole::Utility);
  EXPECT_FALSE(eval.success);
  EXPECT_TRUE(eval.skipped);
  EXPECT_EQ(eval.skip_reason, "excluded");
}

}  // namespace
}  // namespace calib
