// @q, @d, @p: compatibility with the question, dimension and policy area.

#ifndef CALIB_LAYERS_CONTEXTUAL_LAYER_H
#define CALIB_LAYERS_CONTEXTUAL_LAYER_H

#include "layers/layer_context.h"

namespace calib {

/// @brief Score a contextual layer by table lookup.
///
/// Looks up the subject's question id, dimension or policy area in the
/// method's declared compatibility table. A missing entry or an unregistered
/// method is "undeclared". Tier values come from the contextual tiers.
///
/// @param ctx Evaluation inputs.
/// @param layer One of Question, Dimension or Policy.
LayerEvaluation evaluateContextualLayer(const LayerContext& ctx, CanonicalLayer layer);

}  // namespace calib

#endif  // CALIB_LAYERS_CONTEXTUAL_LAYER_H
