// Tests for layers/chain_layer.h -- contract tiers.

#include "layers/chain_layer.h"

#include <gtest/gtest.h>

#include "test_helpers.h"

namespace calib {
namespace {

class ChainLayerTest : public ::testing::Test {
 protected:
  LayerEvaluation evaluate(const ChainEvidence& chain) {
    EvidenceBundle evidence;
    evidence.chain = chain;
    LayerContext ctx{subject_, evidence, *config_, *registry_};
    return evaluateChainLayer(ctx);
  }

  std::shared_ptr<const CalibrationConfig> config_ = test_helpers::sampleConfig();
  std::shared_ptr<const JsonIntrinsicRegistry> registry_ = test_helpers::sampleRegistry();
  CalibrationSubject subject_ =
      test_helpers::makeSubject(test_helpers::kBayesian, MethodRole::Analyzer);
};

TEST_F(ChainLayerTest, TierValues) {
  ChainEvidence chain;
  chain.hard_mismatch = true;
  EXPECT_DOUBLE_EQ(evaluate(chain).score.value, 0.0);

  chain = ChainEvidence{};
  chain.missing_beneficial = true;
  EXPECT_DOUBLE_EQ(evaluate(chain).score.value, 0.3);

  chain = ChainEvidence{};
  chain.schema_deviation = true;
  EXPECT_DOUBLE_EQ(evaluate(chain).score.value, 0.6);

  chain = ChainEvidence{};
  chain.warning_count = 2;
  EXPECT_DOUBLE_EQ(evaluate(chain).score.value, 0.8);

  EXPECT_DOUBLE_EQ(evaluate(ChainEvidence{}).score.value, 1.0);
}

TEST_F(ChainLayerTest, HighestPriorityTierWins) {
  ChainEvidence chain;
  chain.hard_mismatch = true;
  chain.missing_beneficial = true;
  chain.warning_count = 3;
  EXPECT_EQ(classifyChain(chain), ChainTier::HardMismatch);

  chain.hard_mismatch = false;
  chain.schema_deviation = true;
  EXPECT_EQ(classifyChain(chain), ChainTier::MissingBeneficial);
}

TEST_F(ChainLayerTest, TraceNamesTierAndDetails) {
  ChainEvidence chain;
  chain.missing_beneficial = true;
  chain.details.push_back("beneficial input 'baseline' missing");
  LayerEvaluation eval = evaluate(chain);
  ASSERT_TRUE(eval.success);
  EXPECT_EQ(eval.score.evidence.at("tier"), "missing_beneficial");
  EXPECT_EQ(eval.score.formula, "chain_rubric.missing_beneficial");
  EXPECT_NE(eval.score.rationale.find("baseline"), std::string::npos);
}

TEST_F(ChainLayerTest, MissingEvidenceFailsClosed) {
  EvidenceBundle evidence;
  LayerContext ctx{subject_, evidence, *config_, *registry_};
  LayerEvaluation eval = evaluateChainLayer(ctx);
  EXPECT_FALSE(eval.success);
  EXPECT_FALSE(eval.skipped);
  EXPECT_EQ(eval.error.layer, CanonicalLayer::Chain);
}

TEST_F(ChainLayerTest, RubricValuesComeFromConfiguration) {
  CalibrationConfig edited = *config_;
  edited.chain.warnings = 0.75;
  EvidenceBundle evidence;
  ChainEvidence chain;
  chain.warning_count = 1;
  evidence.chain = chain;
  LayerContext ctx{subject_, evidence, edited, *registry_};
  EXPECT_DOUBLE_EQ(evaluateChainLayer(ctx).score.value, 0.75);
}

}  // namespace
}  // namespace calib
