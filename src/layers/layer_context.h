// Inputs and outputs shared by the layer evaluators.

#ifndef CALIB_LAYERS_LAYER_CONTEXT_H
#define CALIB_LAYERS_LAYER_CONTEXT_H

#include <string>
#include <utility>

#include "config/calibration_config.h"
#include "core/basic_types.h"
#include "layers/evidence.h"
#include "registry/intrinsic_registry.h"

namespace calib {

/// @brief Everything an evaluator may read. All members are read-only.
struct LayerContext {
  const CalibrationSubject& subject;
  const EvidenceBundle& evidence;
  const CalibrationConfig& config;
  const IIntrinsicRegistry& registry;
};

/// @brief Outcome of one layer evaluator.
///
/// Exactly one of three shapes: a score (success), an evidence error
/// (success false, skipped false), or a registry skip (skipped true, @b only).
struct LayerEvaluation {
  bool success = false;
  bool skipped = false;
  std::string skip_reason;  ///< Registry status that caused the skip.
  LayerScore score;
  EvidenceError error;

  static LayerEvaluation scored(LayerScore score) {
    LayerEvaluation eval;
    eval.success = true;
    eval.score = std::move(score);
    return eval;
  }

  static LayerEvaluation missingEvidence(CanonicalLayer layer, std::string field,
                                         std::string message) {
    LayerEvaluation eval;
    eval.error.layer = layer;
    eval.error.field = std::move(field);
    eval.error.message = std::move(message);
    return eval;
  }
};

}  // namespace calib

#endif  // CALIB_LAYERS_LAYER_CONTEXT_H
