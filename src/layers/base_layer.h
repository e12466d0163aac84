// @b: intrinsic quality from the registry.

#ifndef CALIB_LAYERS_BASE_LAYER_H
#define CALIB_LAYERS_BASE_LAYER_H

#include "layers/layer_context.h"

namespace calib {

/// @brief Score @b = w_th*b_theory + w_imp*b_impl + w_dep*b_deploy.
///
/// Computed records use their stored components. Pending and none records
/// substitute the configured fallback for all three components (none also
/// logs a warning). Excluded records return a skipped evaluation.
LayerEvaluation evaluateBaseLayer(const LayerContext& ctx);

}  // namespace calib

#endif  // CALIB_LAYERS_BASE_LAYER_H
