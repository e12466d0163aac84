// @chain: data-flow contract compatibility.

#ifndef CALIB_LAYERS_CHAIN_LAYER_H
#define CALIB_LAYERS_CHAIN_LAYER_H

#include <cstdint>

#include "layers/layer_context.h"

namespace calib {

/// Discrete @chain outcome, in priority order.
enum class ChainTier : uint8_t {
  HardMismatch,
  MissingBeneficial,
  SchemaDeviation,
  PassWithWarnings,
  Clean
};

const char* chainTierToString(ChainTier tier);

/// @brief First matching tier for the evidence (hard mismatch wins).
ChainTier classifyChain(const ChainEvidence& evidence);

/// @brief Score @chain from its tier; values come from the chain rubric.
///
/// Fails with an evidence error when no ChainEvidence was supplied.
LayerEvaluation evaluateChainLayer(const LayerContext& ctx);

}  // namespace calib

#endif  // CALIB_LAYERS_CHAIN_LAYER_H
