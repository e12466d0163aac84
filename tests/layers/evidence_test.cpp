// Tests for layers/evidence.h -- evidence parsing and chain contract checks.

#include "layers/evidence.h"

#include <gtest/gtest.h>

#include <string>

#include "test_helpers.h"

namespace calib {
namespace {

JsonValue parse(const std::string& text) {
  JsonValue value;
  std::string error;
  EXPECT_TRUE(parseJson(text, value, error)) << error;
  return value;
}

InputSignature bayesianSignature() {
  return test_helpers::sampleConfig()->findMethod(test_helpers::kBayesian)->signature;
}

TEST(ChainDerivationTest, AllInputsProvidedIsClean) {
  InputSignature signature = bayesianSignature();
  ChainEvidence evidence = deriveChainEvidence(
      &signature, {{"document", "Document"}, {"indicators", "IndicatorMatrix"},
                   {"baseline", "float"}, {"metadata", "dict"}});
  EXPECT_FALSE(evidence.hard_mismatch);
  EXPECT_FALSE(evidence.missing_beneficial);
  EXPECT_FALSE(evidence.schema_deviation);
  EXPECT_EQ(evidence.warning_count, 0);
  EXPECT_TRUE(evidence.details.empty());
}

TEST(ChainDerivationTest, RequiredTypeConflictIsHardMismatch) {
  InputSignature signature = bayesianSignature();
  ChainEvidence evidence = deriveChainEvidence(
      &signature, {{"document", "str"}, {"indicators", "IndicatorMatrix"}, {"baseline", ""}});
  EXPECT_TRUE(evidence.hard_mismatch);
  ASSERT_FALSE(evidence.details.empty());
  EXPECT_NE(evidence.details[0].find("expected 'Document'"), std::string::npos);
}

TEST(ChainDerivationTest, MissingRequiredIsHardMismatch) {
  InputSignature signature = bayesianSignature();
  ChainEvidence evidence = deriveChainEvidence(&signature, {{"document", "Document"}});
  EXPECT_TRUE(evidence.hard_mismatch);
  EXPECT_TRUE(evidence.missing_beneficial);
}

TEST(ChainDerivationTest, BeneficialAndOptionalInputs) {
  InputSignature signature = bayesianSignature();
  ChainEvidence evidence = deriveChainEvidence(
      &signature, {{"document", "Document"}, {"indicators", "IndicatorMatrix"}});
  EXPECT_FALSE(evidence.hard_mismatch);
  EXPECT_TRUE(evidence.missing_beneficial);
  EXPECT_EQ(evidence.warning_count, 1);
}

TEST(ChainDerivationTest, NonRequiredTypeConflictIsSchemaDeviation) {
  InputSignature signature = bayesianSignature();
  ChainEvidence evidence = deriveChainEvidence(
      &signature, {{"document", "Document"}, {"indicators", "IndicatorMatrix"},
                   {"baseline", "str"}, {"metadata", "dict"}});
  EXPECT_FALSE(evidence.hard_mismatch);
  EXPECT_FALSE(evidence.missing_beneficial);
  EXPECT_TRUE(evidence.schema_deviation);
}

TEST(ChainDerivationTest, NoSignatureIsHardMismatch) {
  ChainEvidence evidence = deriveChainEvidence(nullptr, {{"x", "int"}});
  EXPECT_TRUE(evidence.hard_mismatch);
}

TEST(EvidenceParseTest, ParsesEverySection) {
  JsonValue value = parse(R"({
    "chain": {"hard_mismatch": false, "missing_beneficial": true,
              "schema_deviation": false, "warning_count": 2},
    "unit": {"structural_compliance": 0.7, "indicator_matrix_present": true,
             "ppi_matrix_present": false},
    "congruence": {"provided_inputs": ["posterior"]},
    "meta": {"formula_exported": true, "trace_complete": true,
             "logs_schema_conformant": false, "version_tagged": true,
             "config_hash_matches": false, "signature_valid": true,
             "runtime_ms": 1200, "memory_mb": 256}})");
  EvidenceParseResult result = parseEvidenceBundle(value, nullptr);
  ASSERT_TRUE(result.success) << result.error.toString();
  ASSERT_TRUE(result.bundle.chain.has_value());
  EXPECT_TRUE(result.bundle.chain->missing_beneficial);
  EXPECT_EQ(result.bundle.chain->warning_count, 2);
  ASSERT_TRUE(result.bundle.unit.has_value());
  EXPECT_DOUBLE_EQ(result.bundle.unit->structural_compliance, 0.7);
  EXPECT_FALSE(result.bundle.unit->ppi_matrix_present);
  ASSERT_TRUE(result.bundle.congruence.has_value());
  EXPECT_EQ(result.bundle.congruence->provided_inputs.size(), 1u);
  ASSERT_TRUE(result.bundle.meta.has_value());
  EXPECT_DOUBLE_EQ(result.bundle.meta->runtime_ms, 1200.0);
  EXPECT_FALSE(result.bundle.meta->config_hash_matches);
}

TEST(EvidenceParseTest, AbsentSectionsStayEmpty) {
  EvidenceParseResult result = parseEvidenceBundle(parse("{}"), nullptr);
  ASSERT_TRUE(result.success);
  EXPECT_FALSE(result.bundle.chain.has_value());
  EXPECT_FALSE(result.bundle.unit.has_value());
  EXPECT_FALSE(result.bundle.congruence.has_value());
  EXPECT_FALSE(result.bundle.meta.has_value());
}

TEST(EvidenceParseTest, MissingFieldIsNamed) {
  JsonValue value = parse(R"({"unit": {"structural_compliance": 0.7,
                                       "indicator_matrix_present": true}})");
  EvidenceParseResult result = parseEvidenceBundle(value, nullptr);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.layer, CanonicalLayer::Unit);
  EXPECT_EQ(result.error.field, "ppi_matrix_present");
  EXPECT_EQ(result.error.toString(), "@u.ppi_matrix_present: required field is absent");
}

TEST(EvidenceParseTest, WrongTypeIsRejected) {
  JsonValue value = parse(R"({"meta": {"formula_exported": "yes"}})");
  EvidenceParseResult result = parseEvidenceBundle(value, nullptr);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.layer, CanonicalLayer::Meta);
  EXPECT_EQ(result.error.field, "formula_exported");
}

TEST(EvidenceParseTest, StructuralComplianceMustBeInRange) {
  JsonValue value = parse(R"({"unit": {"structural_compliance": 1.5,
                                       "indicator_matrix_present": true,
                                       "ppi_matrix_present": true}})");
  EvidenceParseResult result = parseEvidenceBundle(value, nullptr);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.field, "structural_compliance");
}

TEST(EvidenceParseTest, ProvidedInputsAreCheckedAgainstSignature) {
  auto config = test_helpers::sampleConfig();
  ASSERT_NE(config, nullptr);
  JsonValue value = parse(R"({"chain": {"provided_inputs": {"document": "Document"}}})");
  EvidenceParseResult result =
      parseEvidenceBundle(value, config->findMethod(test_helpers::kCausal));
  ASSERT_TRUE(result.success);
  ASSERT_TRUE(result.bundle.chain.has_value());
  EXPECT_FALSE(result.bundle.chain->hard_mismatch);
  EXPECT_TRUE(result.bundle.chain->missing_beneficial);
}

TEST(EvidenceParseTest, FractionalWarningCountIsRejected) {
  JsonValue value = parse(R"({"chain": {"hard_mismatch": false, "missing_beneficial": false,
                                        "schema_deviation": false, "warning_count": 0.5}})");
  EvidenceParseResult result = parseEvidenceBundle(value, nullptr);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.layer, CanonicalLayer::Chain);
  EXPECT_EQ(result.error.field, "warning_count");
  EXPECT_NE(result.error.message.find("whole"), std::string::npos);
}

TEST(EvidenceParseTest, HugeWarningCountIsRejected) {
  JsonValue value = parse(R"({"chain": {"hard_mismatch": false, "missing_beneficial": false,
                                        "schema_deviation": false, "warning_count": 1e30}})");
  EvidenceParseResult result = parseEvidenceBundle(value, nullptr);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.field, "warning_count");
  EXPECT_NE(result.error.message.find("out of range"), std::string::npos);
}

}  // namespace
}  // namespace calib
