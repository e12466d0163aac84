// Tests for decision/validation_decision.h -- gates and failure attribution.

#include "decision/validation_decision.h"

#include <gtest/gtest.h>

#include <map>

#include "certificate/certificate_builder.h"
#include "config/layer_requirements.h"
#include "test_helpers.h"

namespace calib {
namespace {

using Scores = std::map<CanonicalLayer, double>;

class ValidationDecisionTest : public ::testing::Test {
 protected:
  CalibrationCertificate scored(const Scores& values, const FusionConfiguration* fusion = nullptr) {
    if (!fusion) fusion = config_->findFusion(MethodRole::Analyzer);
    std::vector<LayerScore> scores;
    LayerSet active;
    for (const auto& entry : values) {
      LayerScore score;
      score.layer = entry.first;
      score.value = entry.second;
      scores.push_back(score);
      layerSetInsert(active, entry.first);
    }
    FusionResult fused = fuseLayerScores(*fusion, values);
    EXPECT_TRUE(fused.success) << fused.error_message;
    return buildScoredCertificate(context(), subject_, active, scores, *fusion, fused);
  }

  static Scores uniform(double value) {
    Scores values;
    for (CanonicalLayer layer : kAllLayers) values[layer] = value;
    return values;
  }

  CertificateContext context() const {
    return CertificateContext{*config_, "intrinsic-2025.06", "2025-06-01T12:00:00Z"};
  }

  const DecisionPolicy& policy() const { return config_->decision; }

  std::shared_ptr<const CalibrationConfig> config_ = test_helpers::sampleConfig();
  CalibrationSubject subject_ =
      test_helpers::makeSubject(test_helpers::kBayesian, MethodRole::Analyzer);
};

TEST_F(ValidationDecisionTest, PassAtThreshold) {
  CalibrationCertificate cert = scored(uniform(0.9));
  ValidationDecision decision = decide(cert, 0.7, policy());
  EXPECT_EQ(decision.decision, Decision::Pass);
  EXPECT_EQ(decision.reason, FailureReason::None);
  EXPECT_EQ(decision.certificate_id, cert.instance_id);
  EXPECT_EQ(decide(cert, cert.calibration_score, policy()).decision, Decision::Pass);
}

TEST_F(ValidationDecisionTest, ConditionalPassWithinBand) {
  CalibrationCertificate cert = scored(uniform(0.68));
  ValidationDecision decision = decide(cert, 0.7, policy());
  EXPECT_EQ(decision.decision, Decision::ConditionalPass);
  EXPECT_TRUE(decision.recommendations.empty());
}

TEST_F(ValidationDecisionTest, FailWithoutLayerBelowFloor) {
  CalibrationCertificate cert = scored(uniform(0.55));
  ValidationDecision decision = decide(cert, 0.7, policy());
  EXPECT_EQ(decision.decision, Decision::Fail);
  EXPECT_EQ(decision.reason, FailureReason::ScoreBelowThreshold);
  EXPECT_FALSE(decision.has_failed_layer);
  ASSERT_EQ(decision.recommendations.size(), 1u);
}

TEST_F(ValidationDecisionTest, AttributesLowestContribution) {
  Scores values = {{CanonicalLayer::Base, 0.8075},    {CanonicalLayer::Chain, 0.3},
                   {CanonicalLayer::Unit, 0.5},       {CanonicalLayer::Question, 1.0},
                   {CanonicalLayer::Dimension, 1.0},  {CanonicalLayer::Policy, 1.0},
                   {CanonicalLayer::Congruence, 0.08}, {CanonicalLayer::Meta, 0.694}};
  CalibrationCertificate cert = scored(values);
  EXPECT_NEAR(cert.calibration_score, 0.61658, 1e-4);
  ValidationDecision decision = decide(cert, 0.7, policy());
  ASSERT_EQ(decision.decision, Decision::Fail);
  EXPECT_EQ(decision.reason, FailureReason::CongruenceFail);
  ASSERT_TRUE(decision.has_failed_layer);
  EXPECT_EQ(decision.failed_layer, CanonicalLayer::Congruence);
  EXPECT_NE(decision.failure_details.find("below floor"), std::string::npos);

  // Cause first, then the other layers below the floor: @chain, then @u.
  std::vector<std::string> expected = recommendationsFor(FailureReason::CongruenceFail);
  for (auto& text : recommendationsFor(FailureReason::ChainLayerFail)) expected.push_back(text);
  for (auto& text : recommendationsFor(FailureReason::UnitLayerFail)) expected.push_back(text);
  EXPECT_EQ(decision.recommendations, expected);
}

TEST_F(ValidationDecisionTest, TiesResolveInCanonicalOrder) {
  Scores values = uniform(1.0);
  values[CanonicalLayer::Base] = 0.2;
  values[CanonicalLayer::Meta] = 0.2;
  CalibrationCertificate cert = scored(values);
  ValidationDecision decision = decide(cert, 0.9, policy());
  ASSERT_EQ(decision.decision, Decision::Fail);
  EXPECT_EQ(decision.failed_layer, CanonicalLayer::Base);
  EXPECT_EQ(decision.reason, FailureReason::BaseLayerLow);
}

TEST_F(ValidationDecisionTest, ContextualLayersShareOneReason) {
  Scores values = uniform(1.0);
  values[CanonicalLayer::Question] = 0.1;
  values[CanonicalLayer::Policy] = 0.1;
  CalibrationCertificate cert = scored(values);
  ValidationDecision decision = decide(cert, 0.95, policy());
  ASSERT_EQ(decision.decision, Decision::Fail);
  EXPECT_EQ(decision.reason, FailureReason::ContextualFail);
  EXPECT_EQ(decision.recommendations, recommendationsFor(FailureReason::ContextualFail));
}

TEST_F(ValidationDecisionTest, NormalizedContributions) {
  Scores values = uniform(1.0);
  values[CanonicalLayer::Unit] = 0.6;
  CalibrationCertificate cert = scored(values);
  std::vector<LayerAttribution> attrs = normalizedContributions(cert);
  ASSERT_EQ(attrs.size(), kLayerCount);
  EXPECT_EQ(attrs[2].layer, CanonicalLayer::Unit);
  // (0.16 * 0.6 + w * 0.6) / (0.16 + w)
  EXPECT_NEAR(attrs[2].contribution, 0.6, 1e-12);
  // @chain: linear 1.0, (@u,@chain) at 0.6, (@chain,@C) at 1.0.
  double w_uc = 0.0856164383561644;
  double w_cc = 0.0684931506849315;
  EXPECT_NEAR(attrs[1].contribution, (0.10 + w_uc * 0.6 + w_cc) / (0.10 + w_uc + w_cc), 1e-12);
}

TEST_F(ValidationDecisionTest, ZeroWeightLayerUsesOwnScore) {
  FusionConfiguration fusion;
  fusion.role = MethodRole::Analyzer;
  fusion.linear_weights[CanonicalLayer::Base] = 1.0;
  fusion.linear_weights[CanonicalLayer::Meta] = 0.0;
  CalibrationCertificate cert =
      scored({{CanonicalLayer::Base, 0.9}, {CanonicalLayer::Meta, 0.3}}, &fusion);
  std::vector<LayerAttribution> attrs = normalizedContributions(cert);
  ASSERT_EQ(attrs.size(), 2u);
  EXPECT_DOUBLE_EQ(attrs[1].contribution, 0.3);
}

TEST_F(ValidationDecisionTest, FailClosedUsesMissingLayer) {
  EvidenceError error;
  error.layer = CanonicalLayer::Meta;
  error.field = "meta";
  error.message = "required";
  CalibrationCertificate cert = buildFailClosedCertificate(
      context(), subject_, defaultRequiredLayers(MethodRole::Analyzer), {}, error);
  ValidationDecision decision = decide(cert, 0.7, policy());
  EXPECT_EQ(decision.decision, Decision::Fail);
  EXPECT_EQ(decision.reason, FailureReason::MetaLayerFail);
  EXPECT_EQ(decision.failed_layer, CanonicalLayer::Meta);
  EXPECT_NE(decision.failure_details.find("@m.meta"), std::string::npos);
  EXPECT_DOUBLE_EQ(decision.score, 0.0);
}

TEST_F(ValidationDecisionTest, IncompleteCertificateFailsOnMissingLayer) {
  // Declared ingest, run as a report: @C is required and was never scored.
  CalibrationSubject subject =
      test_helpers::makeSubject(test_helpers::kLoader, MethodRole::Report);
  const FusionConfiguration* fusion = config_->findFusion(MethodRole::Report);
  ASSERT_NE(fusion, nullptr);
  Scores values = {{CanonicalLayer::Base, 1.0},
                   {CanonicalLayer::Chain, 1.0},
                   {CanonicalLayer::Unit, 1.0},
                   {CanonicalLayer::Meta, 1.0}};
  std::vector<LayerScore> scores;
  LayerSet active;
  for (const auto& entry : values) {
    LayerScore score;
    score.layer = entry.first;
    score.value = entry.second;
    scores.push_back(score);
    layerSetInsert(active, entry.first);
  }
  FusionResult fused = fuseLayerScores(*fusion, values);
  ASSERT_TRUE(fused.success) << fused.error_message;
  CalibrationCertificate cert =
      buildScoredCertificate(context(), subject, active, scores, *fusion, fused);

  EXPECT_FALSE(cert.completeness.passed);
  ASSERT_EQ(cert.completeness.missing_layers.size(), 1u);
  EXPECT_EQ(cert.completeness.missing_layers[0], CanonicalLayer::Congruence);
  EXPECT_NE(certificateToJson(cert).find("\"missing_layers\""), std::string::npos);

  ValidationDecision decision = decide(cert, 0.5, policy());
  EXPECT_EQ(decision.decision, Decision::Fail);
  EXPECT_EQ(decision.reason, FailureReason::CongruenceFail);
  EXPECT_TRUE(decision.has_failed_layer);
  EXPECT_EQ(decision.failed_layer, CanonicalLayer::Congruence);
  EXPECT_NE(decision.failure_details.find("Incomplete calibration"), std::string::npos);
}

TEST_F(ValidationDecisionTest, SkippedCarriesReason) {
  CalibrationCertificate cert = buildSkippedCertificate(
      context(), subject_, defaultRequiredLayers(MethodRole::Analyzer), "cancelled");
  ValidationDecision decision = decide(cert, 0.7, policy());
  EXPECT_EQ(decision.decision, Decision::Skipped);
  EXPECT_EQ(decision.skip_reason, "cancelled");
}

TEST_F(ValidationDecisionTest, DecisionJson) {
  Scores values = uniform(1.0);
  values[CanonicalLayer::Chain] = 0.0;
  ValidationDecision decision = decide(scored(values), 0.95, policy());
  ASSERT_EQ(decision.decision, Decision::Fail);
  JsonWriter writer;
  writeDecisionJson(writer, decision);
  std::string json = writer.toString();
  EXPECT_NE(json.find("\"decision\":\"FAIL\""), std::string::npos);
  EXPECT_NE(json.find("\"failure_reason\":\"CHAIN_LAYER_FAIL\""), std::string::npos);
  EXPECT_NE(json.find("\"failed_layer\":\"@chain\""), std::string::npos);
}

TEST(DecisionNamesTest, Strings) {
  EXPECT_STREQ(decisionToString(Decision::Pass), "PASS");
  EXPECT_STREQ(decisionToString(Decision::ConditionalPass), "CONDITIONAL_PASS");
  EXPECT_STREQ(decisionToString(Decision::Fail), "FAIL");
  EXPECT_STREQ(decisionToString(Decision::Skipped), "SKIPPED");
  EXPECT_STREQ(failureReasonToString(FailureReason::UnitLayerFail), "UNIT_LAYER_FAIL");
  EXPECT_EQ(failureReasonForLayer(CanonicalLayer::Dimension), FailureReason::ContextualFail);
  EXPECT_EQ(failureReasonForLayer(CanonicalLayer::Base), FailureReason::BaseLayerLow);
  EXPECT_TRUE(recommendationsFor(FailureReason::None).empty());
}

}  // namespace
}  // namespace calib
