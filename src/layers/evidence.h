// Per-layer structured evidence and typed evidence errors.

#ifndef CALIB_LAYERS_EVIDENCE_H
#define CALIB_LAYERS_EVIDENCE_H

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "config/calibration_config.h"
#include "core/basic_types.h"
#include "core/json_parser.h"

namespace calib {

/// Contract-validation outcome for @chain.
struct ChainEvidence {
  bool hard_mismatch = false;       ///< Required input absent or type-incompatible.
  bool missing_beneficial = false;  ///< A beneficial input is absent.
  bool schema_deviation = false;    ///< Non-fatal schema deviation.
  int warning_count = 0;            ///< Warnings raised by passing contracts.
  std::vector<std::string> details; ///< Human-readable findings, in check order.
};

/// Document structure signals for @u hard gates. U itself is in the context.
struct UnitEvidence {
  double structural_compliance = 0.0;
  bool indicator_matrix_present = false;
  bool ppi_matrix_present = false;
};

/// Inputs actually provided to an interplay group's fusion step.
struct CongruenceEvidence {
  std::vector<std::string> provided_inputs;
};

/// Observability and cost measurements for @m.
struct MetaEvidence {
  bool formula_exported = false;
  bool trace_complete = false;
  bool logs_schema_conformant = false;
  bool version_tagged = false;
  bool config_hash_matches = false;
  bool signature_valid = false;
  double runtime_ms = 0.0;
  double memory_mb = 0.0;
};

/// @brief Evidence for one subject. A layer's entry is absent when not supplied.
struct EvidenceBundle {
  std::optional<ChainEvidence> chain;
  std::optional<UnitEvidence> unit;
  std::optional<CongruenceEvidence> congruence;
  std::optional<MetaEvidence> meta;
};

/// @brief A required evidence field was not supplied.
struct EvidenceError {
  CanonicalLayer layer = CanonicalLayer::Base;
  std::string field;
  std::string message;

  /// @brief "@u.structural_compliance: <message>".
  std::string toString() const;
};

/// Result of parsing an evidence object.
struct EvidenceParseResult {
  bool success = false;
  EvidenceBundle bundle;
  EvidenceError error;
};

/// @brief Build ChainEvidence by checking provided inputs against a signature.
///
/// Missing required inputs and type conflicts on required inputs are hard
/// mismatches; missing beneficial inputs are flagged; type conflicts on
/// non-required inputs are schema deviations; each missing optional input
/// raises one warning.
///
/// @param signature Declared input contract, or nullptr if the method has
///        none (treated as a hard mismatch).
/// @param provided Input name -> type name as produced upstream. An empty
///        type name means "untyped" and never conflicts.
ChainEvidence deriveChainEvidence(const InputSignature* signature,
                                  const std::map<std::string, std::string>& provided);

/// @brief Parse an evidence object.
///
/// Layout: {"chain": {...}, "unit": {...}, "congruence": {...}, "meta": {...}}.
/// Every section is optional, but a present section must carry all of its
/// fields. "chain" holds either the four outcome fields or a
/// "provided_inputs" object that is checked against `method`'s signature.
///
/// @param value Evidence JSON.
/// @param method Declaration of the subject's method, or nullptr.
EvidenceParseResult parseEvidenceBundle(const JsonValue& value,
                                        const MethodDeclaration* method);

}  // namespace calib

#endif  // CALIB_LAYERS_EVIDENCE_H
