// Tests for config/layer_requirements.h -- role profiles and active layers.

#include "config/layer_requirements.h"

#include <gtest/gtest.h>

#include "test_helpers.h"

namespace calib {
namespace {

TEST(LayerRequirementsTest, EveryRoleRequiresBase) {
  for (MethodRole role : kAllRoles) {
    LayerSet required = defaultRequiredLayers(role);
    EXPECT_TRUE(layerSetContains(required, CanonicalLayer::Base)) << roleToString(role);
  }
}

TEST(LayerRequirementsTest, AnalyzerRequiresAllEight) {
  LayerSet required = defaultRequiredLayers(MethodRole::Analyzer);
  ASSERT_EQ(required.size(), kLayerCount);
  for (size_t idx = 0; idx < kLayerCount; ++idx) EXPECT_EQ(required[idx], kAllLayers[idx]);
}

TEST(LayerRequirementsTest, RoleProfiles) {
  EXPECT_EQ(defaultRequiredLayers(MethodRole::Ingest),
            (LayerSet{CanonicalLayer::Base, CanonicalLayer::Chain, CanonicalLayer::Unit,
                      CanonicalLayer::Meta}));
  EXPECT_EQ(defaultRequiredLayers(MethodRole::Aggregate),
            (LayerSet{CanonicalLayer::Base, CanonicalLayer::Chain, CanonicalLayer::Dimension,
                      CanonicalLayer::Policy, CanonicalLayer::Congruence,
                      CanonicalLayer::Meta}));
  EXPECT_EQ(defaultRequiredLayers(MethodRole::Report),
            (LayerSet{CanonicalLayer::Base, CanonicalLayer::Chain, CanonicalLayer::Congruence,
                      CanonicalLayer::Meta}));
  EXPECT_EQ(defaultRequiredLayers(MethodRole::Utility),
            (LayerSet{CanonicalLayer::Base, CanonicalLayer::Chain, CanonicalLayer::Meta}));
}

TEST(LayerRequirementsTest, RegisteredMethodUsesDeclaredLayers) {
  auto config = test_helpers::sampleConfig();
  ASSERT_NE(config, nullptr);
  ActiveLayerResolution resolution =
      resolveActiveLayers(*config, test_helpers::kLoader, MethodRole::Ingest);
  EXPECT_TRUE(resolution.registered);
  EXPECT_EQ(resolution.active,
            (LayerSet{CanonicalLayer::Base, CanonicalLayer::Chain, CanonicalLayer::Unit,
                      CanonicalLayer::Meta}));
}

TEST(LayerRequirementsTest, UndeclaredActiveLayersDefaultToRoleProfile) {
  auto config = test_helpers::sampleConfig();
  ASSERT_NE(config, nullptr);
  ActiveLayerResolution resolution =
      resolveActiveLayers(*config, test_helpers::kBayesian, MethodRole::Analyzer);
  EXPECT_TRUE(resolution.registered);
  EXPECT_EQ(resolution.active.size(), kLayerCount);
}

TEST(LayerRequirementsTest, UnregisteredMethodFallsBackToRole) {
  auto config = test_helpers::sampleConfig();
  ASSERT_NE(config, nullptr);
  ActiveLayerResolution resolution =
      resolveActiveLayers(*config, "unknown.Thing.run", MethodRole::Utility);
  EXPECT_FALSE(resolution.registered);
  EXPECT_EQ(resolution.active, requiredLayers(*config, MethodRole::Utility));
}

TEST(LayerRequirementsTest, MissingRequiredLayers) {
  auto config = test_helpers::sampleConfig();
  ASSERT_NE(config, nullptr);
  LayerSet present = {CanonicalLayer::Base, CanonicalLayer::Meta};
  EXPECT_EQ(missingRequiredLayers(*config, MethodRole::Report, present),
            (LayerSet{CanonicalLayer::Chain, CanonicalLayer::Congruence}));
}

TEST(LayerRequirementsTest, JustifiedOmissionIsAccepted) {
  auto config = test_helpers::sampleConfig();
  ASSERT_NE(config, nullptr);
  const MethodDeclaration* report = config->findMethod(test_helpers::kReport);
  ASSERT_NE(report, nullptr);
  EXPECT_TRUE(checkDeclaredLayers(*config, *report).empty());
}

TEST(LayerRequirementsTest, UnjustifiedOmissionIsRejected) {
  auto config = test_helpers::sampleConfig();
  ASSERT_NE(config, nullptr);
  MethodDeclaration report = *config->findMethod(test_helpers::kReport);
  report.justifications.clear();
  std::vector<std::string> errors = checkDeclaredLayers(*config, report);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_NE(errors[0].find("@C"), std::string::npos);

  report.justifications[CanonicalLayer::Congruence] = "   ";
  EXPECT_EQ(checkDeclaredLayers(*config, report).size(), 1u);
}

TEST(LayerRequirementsTest, LoaderRejectsUnjustifiedOmission) {
  CalibrationConfig edited = test_helpers::sampleConfigCopy();
  edited.methods[test_helpers::kReport].justifications.clear();
  ConfigLoadResult result = finalizeCalibrationConfig(edited);
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error_message.find("omits required layer @C"), std::string::npos);
}

TEST(LayerRequirementsTest, BaseCannotBeJustifiedAway) {
  auto config = test_helpers::sampleConfig();
  ASSERT_NE(config, nullptr);
  MethodDeclaration normalizer = *config->findMethod(test_helpers::kNormalizer);
  normalizer.active_layers = {CanonicalLayer::Chain, CanonicalLayer::Meta};
  normalizer.justifications[CanonicalLayer::Base] = "legacy";
  std::vector<std::string> errors = checkDeclaredLayers(*config, normalizer);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_NE(errors[0].find("@b cannot be justified away"), std::string::npos);
}

TEST(LayerRequirementsTest, LoaderRejectsMethodWithoutBase) {
  CalibrationConfig edited = test_helpers::sampleConfigCopy();
  MethodDeclaration& normalizer = edited.methods[test_helpers::kNormalizer];
  normalizer.active_layers = {CanonicalLayer::Chain, CanonicalLayer::Meta};
  normalizer.justifications[CanonicalLayer::Base] = "legacy";
  ConfigLoadResult result = finalizeCalibrationConfig(edited);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.config, nullptr);
  EXPECT_NE(result.error_message.find("omits required layer @b"), std::string::npos);
}

}  // namespace
}  // namespace calib
