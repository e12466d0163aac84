// Dispatch over the eight canonical layer evaluators.

#ifndef CALIB_LAYERS_LAYER_CATALOG_H
#define CALIB_LAYERS_LAYER_CATALOG_H

#include "layers/layer_context.h"

namespace calib {

/// @brief Evaluate one canonical layer for a subject.
///
/// Pure: reads only the context. Produces a score, an evidence error, or
/// (for @b on an excluded method) a skip.
LayerEvaluation evaluateLayer(CanonicalLayer layer, const LayerContext& ctx);

}  // namespace calib

#endif  // CALIB_LAYERS_LAYER_CATALOG_H
