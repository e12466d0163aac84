// Tests for fusion/choquet_fusion.h -- 2-additive Choquet aggregation.

#include "fusion/choquet_fusion.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <random>

#include "test_helpers.h"

namespace calib {
namespace {

using Scores = std::map<CanonicalLayer, double>;

/// Layer scores of the documented end-to-end analyzer example.
Scores analyzerExampleScores() {
  return {{CanonicalLayer::Base, 0.9},      {CanonicalLayer::Chain, 1.0},
          {CanonicalLayer::Unit, 0.6},      {CanonicalLayer::Question, 1.0},
          {CanonicalLayer::Dimension, 1.0}, {CanonicalLayer::Policy, 0.8},
          {CanonicalLayer::Congruence, 1.0}, {CanonicalLayer::Meta, 0.95}};
}

const FusionConfiguration& analyzerFusion() {
  return *test_helpers::sampleConfig()->findFusion(MethodRole::Analyzer);
}

TEST(ChoquetFusionTest, AnalyzerExample) {
  FusionResult result = fuseLayerScores(analyzerFusion(), analyzerExampleScores());
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_NEAR(result.linear_sum, 0.696, 1e-9);
  EXPECT_NEAR(result.final_score, 0.8617534, 1e-6);
  EXPECT_DOUBLE_EQ(result.final_score, result.linear_sum + result.interaction_sum);
}

TEST(ChoquetFusionTest, TermsInEvaluationOrder) {
  FusionResult result = fuseLayerScores(analyzerFusion(), analyzerExampleScores());
  ASSERT_EQ(result.terms.size(), kLayerCount + 3);
  for (size_t idx = 0; idx < kLayerCount; ++idx) {
    EXPECT_EQ(result.terms[idx].kind, FusionTermKind::Linear);
    EXPECT_EQ(result.terms[idx].layer_a, kAllLayers[idx]);
  }
  const FusionTerm& unit_chain = result.terms[kLayerCount];
  EXPECT_EQ(unit_chain.kind, FusionTermKind::Interaction);
  EXPECT_EQ(unit_chain.label, "(@u,@chain)");
  EXPECT_DOUBLE_EQ(unit_chain.input, 0.6);
  EXPECT_FALSE(unit_chain.rationale.empty());
}

TEST(ChoquetFusionTest, WeakLinkLimitsInteraction) {
  FusionResult result = fuseLayerScores(analyzerFusion(), analyzerExampleScores());
  ASSERT_TRUE(result.success);
  const FusionTerm& unit_chain = result.terms[kLayerCount];
  const FusionTerm& chain_congruence = result.terms[kLayerCount + 1];
  // @u = 0.6 caps the (@u,@chain) synergy; the other pairs are saturated.
  EXPECT_LT(unit_chain.contribution, unit_chain.weight);
  EXPECT_DOUBLE_EQ(chain_congruence.contribution, chain_congruence.weight);
}

TEST(ChoquetFusionTest, AllOnesScoreOne) {
  Scores scores;
  for (CanonicalLayer layer : kAllLayers) scores[layer] = 1.0;
  FusionResult result = fuseLayerScores(analyzerFusion(), scores);
  ASSERT_TRUE(result.success);
  EXPECT_NEAR(result.final_score, 1.0, 1e-9);
}

TEST(ChoquetFusionTest, AllZerosScoreZero) {
  Scores scores;
  for (CanonicalLayer layer : kAllLayers) scores[layer] = 0.0;
  FusionResult result = fuseLayerScores(analyzerFusion(), scores);
  ASSERT_TRUE(result.success);
  EXPECT_DOUBLE_EQ(result.final_score, 0.0);
}

TEST(ChoquetFusionTest, BoundedAndMonotonicOnRandomInputs) {
  std::mt19937 rng(42);
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  const FusionConfiguration& fusion = analyzerFusion();
  for (int trial = 0; trial < 200; ++trial) {
    Scores scores;
    for (CanonicalLayer layer : kAllLayers) scores[layer] = dist(rng);
    FusionResult base = fuseLayerScores(fusion, scores);
    ASSERT_TRUE(base.success);
    EXPECT_GE(base.final_score, 0.0);
    EXPECT_LE(base.final_score, 1.0 + kWeightTolerance);

    CanonicalLayer raised = kAllLayers[static_cast<size_t>(trial) % kLayerCount];
    scores[raised] = std::min(1.0, scores[raised] + dist(rng) * 0.2);
    FusionResult higher = fuseLayerScores(fusion, scores);
    ASSERT_TRUE(higher.success);
    EXPECT_GE(higher.final_score, base.final_score);
  }
}

TEST(ChoquetFusionTest, InteractionNeedsBothLayersActive) {
  Scores scores = analyzerExampleScores();
  scores.erase(CanonicalLayer::Unit);
  FusionResult result = fuseLayerScores(analyzerFusion(), scores);
  ASSERT_TRUE(result.success);
  for (const auto& term : result.terms) {
    EXPECT_NE(term.label, "(@u,@chain)");
    EXPECT_NE(term.label, "@u");
  }
}

TEST(ChoquetFusionTest, OutOfRangeIsConfigurationError) {
  FusionConfiguration fusion;
  fusion.role = MethodRole::Utility;
  fusion.linear_weights[CanonicalLayer::Base] = 0.9;
  fusion.linear_weights[CanonicalLayer::Chain] = 0.9;
  FusionResult result =
      fuseLayerScores(fusion, {{CanonicalLayer::Base, 1.0}, {CanonicalLayer::Chain, 1.0}});
  EXPECT_FALSE(result.success);
  EXPECT_NEAR(result.final_score, 1.8, 1e-12);
  EXPECT_NE(result.error_message.find("@b=0.9"), std::string::npos);
  EXPECT_NE(result.error_message.find("utility"), std::string::npos);
}

TEST(ChoquetFusionTest, ReplayIsBitIdentical) {
  FusionResult result = fuseLayerScores(analyzerFusion(), analyzerExampleScores());
  double linear_sum = 0.0;
  double interaction_sum = 0.0;
  double replayed = replayFusionTrace(result.terms, linear_sum, interaction_sum);
  EXPECT_EQ(replayed, result.final_score);
  EXPECT_EQ(linear_sum, result.linear_sum);
  EXPECT_EQ(interaction_sum, result.interaction_sum);
}

TEST(ChoquetFusionTest, MarginalGain) {
  Scores scores = analyzerExampleScores();
  FusionResult result = fuseLayerScores(analyzerFusion(), scores);
  // @u is the smaller operand of (@u,@chain).
  EXPECT_NEAR(marginalGain(result.terms, CanonicalLayer::Unit, scores),
              0.16 + 0.0856164383561644, 1e-12);
  // @chain is the larger operand of (@u,@chain) and tied in (@chain,@C).
  EXPECT_NEAR(marginalGain(result.terms, CanonicalLayer::Chain, scores), 0.10, 1e-12);
  EXPECT_DOUBLE_EQ(marginalGain(result.terms, CanonicalLayer::Unit, {}), 0.0);
}

}  // namespace
}  // namespace calib
