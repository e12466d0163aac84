// @m: transparency, governance and cost.

#ifndef CALIB_LAYERS_META_LAYER_H
#define CALIB_LAYERS_META_LAYER_H

#include "layers/layer_context.h"

namespace calib {

/// @brief Cost sub-score: min(runtime tier value, memory tier value).
double metaCostScore(const MetaRubric& rubric, double runtime_ms, double memory_mb);

/// @brief Score @m = w_t*m_transp + w_g*m_gov + w_c*m_cost.
///
/// m_transp and m_gov are tier tables indexed by how many of their three
/// conditions hold. Fails with an evidence error when no MetaEvidence was
/// supplied.
LayerEvaluation evaluateMetaLayer(const LayerContext& ctx);

}  // namespace calib

#endif  // CALIB_LAYERS_META_LAYER_H
