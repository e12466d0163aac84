// Tests for layers/contextual_layer.h -- @q, @d and @p lookups.

#include "layers/contextual_layer.h"

#include <gtest/gtest.h>

#include "test_helpers.h"

namespace calib {
namespace {

class ContextualLayerTest : public ::testing::Test {
 protected:
  double score(const CalibrationConfig& config, const std::string& method_id,
               CanonicalLayer layer, const std::string& question, const std::string& dimension,
               const std::string& policy) {
    CalibrationSubject subject = test_helpers::makeSubject(method_id, MethodRole::Analyzer,
                                                           question, dimension, policy);
    EvidenceBundle evidence;
    LayerContext ctx{subject, evidence, config, *registry_};
    LayerEvaluation eval = evaluateContextualLayer(ctx, layer);
    EXPECT_TRUE(eval.success);
    EXPECT_EQ(eval.score.layer, layer);
    return eval.score.value;
  }

  double question(const std::string& question_id) {
    return score(*config_, test_helpers::kBayesian, CanonicalLayer::Question, question_id, "D1",
                 "P1");
  }

  std::shared_ptr<const CalibrationConfig> config_ = test_helpers::sampleConfig();
  std::shared_ptr<const JsonIntrinsicRegistry> registry_ = test_helpers::sampleRegistry();
};

TEST_F(ContextualLayerTest, QuestionTiers) {
  EXPECT_DOUBLE_EQ(question("Q001"), 1.0);
  EXPECT_DOUBLE_EQ(question("Q002"), 0.7);
  EXPECT_DOUBLE_EQ(question("Q003"), 0.3);
  EXPECT_DOUBLE_EQ(question("Q004"), 0.1);
}

TEST_F(ContextualLayerTest, DimensionAndPolicy) {
  EXPECT_DOUBLE_EQ(score(*config_, test_helpers::kBayesian, CanonicalLayer::Dimension, "Q001",
                         "D2", "P1"),
                   0.3);
  EXPECT_DOUBLE_EQ(score(*config_, test_helpers::kBayesian, CanonicalLayer::Policy, "Q001",
                         "D1", "P2"),
                   0.7);
  EXPECT_DOUBLE_EQ(score(*config_, test_helpers::kCausal, CanonicalLayer::Policy, "Q001",
                         "D1", "P3"),
                   1.0);
}

TEST_F(ContextualLayerTest, UnregisteredMethodIsUndeclared) {
  EXPECT_DOUBLE_EQ(score(*config_, "nowhere.Nothing.run", CanonicalLayer::Question, "Q001",
                         "D1", "P1"),
                   0.1);
}

TEST_F(ContextualLayerTest, IncompatibleDeclarationScoresZero) {
  CalibrationConfig edited = *config_;
  edited.methods[test_helpers::kBayesian].question_compat["Q004"] =
      CompatibilityTier::Incompatible;
  EXPECT_DOUBLE_EQ(score(edited, test_helpers::kBayesian, CanonicalLayer::Question, "Q004", "D1",
                         "P1"),
                   0.0);
}

TEST_F(ContextualLayerTest, EvidenceRecordsKeyAndTier) {
  CalibrationSubject subject =
      test_helpers::makeSubject(test_helpers::kBayesian, MethodRole::Analyzer, "Q002");
  EvidenceBundle evidence;
  LayerContext ctx{subject, evidence, *config_, *registry_};
  LayerEvaluation eval = evaluateContextualLayer(ctx, CanonicalLayer::Question);
  EXPECT_EQ(eval.score.evidence.at("context_key"), "Q002");
  EXPECT_EQ(eval.score.evidence.at("tier"), "secondary");
}

}  // namespace
}  // namespace calib
