// Tests for layers/meta_layer.h -- transparency, governance and cost.

#include "layers/meta_layer.h"

#include <gtest/gtest.h>

#include "test_helpers.h"

namespace calib {
namespace {

class MetaLayerTest : public ::testing::Test {
 protected:
  LayerEvaluation evaluate(const EvidenceBundle& evidence) {
    LayerContext ctx{subject_, evidence, *config_, *registry_};
    return evaluateMetaLayer(ctx);
  }

  std::shared_ptr<const CalibrationConfig> config_ = test_helpers::sampleConfig();
  std::shared_ptr<const JsonIntrinsicRegistry> registry_ = test_helpers::sampleRegistry();
  CalibrationSubject subject_ =
      test_helpers::makeSubject(test_helpers::kBayesian, MethodRole::Analyzer);
};

TEST_F(MetaLayerTest, FullMarks) {
  LayerEvaluation eval = evaluate(test_helpers::fullEvidence());
  ASSERT_TRUE(eval.success);
  EXPECT_NEAR(eval.score.value, 1.0, 1e-12);
  EXPECT_EQ(eval.score.evidence.at("transparency_conditions_met"), "3");
}

TEST_F(MetaLayerTest, PartialConditions) {
  EvidenceBundle evidence = test_helpers::fullEvidence();
  evidence.meta->trace_complete = false;
  evidence.meta->signature_valid = false;
  evidence.meta->runtime_ms = 2400.0;
  evidence.meta->memory_mb = 300.0;
  LayerEvaluation eval = evaluate(evidence);
  ASSERT_TRUE(eval.success);
  EXPECT_DOUBLE_EQ(eval.score.components.at("m_transp"), 0.7);
  EXPECT_DOUBLE_EQ(eval.score.components.at("m_gov"), 0.66);
  EXPECT_DOUBLE_EQ(eval.score.components.at("m_cost"), 0.8);
  EXPECT_NEAR(eval.score.value, 0.5 * 0.7 + 0.4 * 0.66 + 0.1 * 0.8, 1e-12);
}

TEST_F(MetaLayerTest, NothingMet) {
  EvidenceBundle evidence;
  evidence.meta = MetaEvidence{};
  evidence.meta->runtime_ms = 9000.0;
  evidence.meta->memory_mb = 1024.0;
  LayerEvaluation eval = evaluate(evidence);
  ASSERT_TRUE(eval.success);
  EXPECT_NEAR(eval.score.value, 0.1 * 0.3, 1e-12);
}

TEST_F(MetaLayerTest, CostIsWorseOfRuntimeAndMemory) {
  const MetaRubric& rubric = config_->meta;
  EXPECT_DOUBLE_EQ(metaCostScore(rubric, 500.0, 100.0), 1.0);
  EXPECT_DOUBLE_EQ(metaCostScore(rubric, 2000.0, 100.0), 0.8);
  EXPECT_DOUBLE_EQ(metaCostScore(rubric, 6000.0, 100.0), 0.5);
  EXPECT_DOUBLE_EQ(metaCostScore(rubric, 500.0, 600.0), 0.3);
  EXPECT_DOUBLE_EQ(metaCostScore(rubric, 1000.0, 512.0), 0.8);
}

TEST_F(MetaLayerTest, MissingEvidenceFailsClosed) {
  LayerEvaluation eval = evaluate(EvidenceBundle{});
  EXPECT_FALSE(eval.success);
  EXPECT_EQ(eval.error.layer, CanonicalLayer::Meta);
  EXPECT_EQ(eval.error.field, "meta");
}

}  // namespace
}  // namespace calib
