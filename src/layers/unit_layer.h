// @u: sensitivity to unit-of-analysis quality, with hard gates.

#ifndef CALIB_LAYERS_UNIT_LAYER_H
#define CALIB_LAYERS_UNIT_LAYER_H

#include "layers/layer_context.h"

namespace calib {

/// @brief Score @u = g_role(U), or exactly 0 when a hard gate trips.
///
/// Roles with no configured transform are not unit-sensitive and score 1
/// without needing evidence. For sensitive roles the gates run first, in
/// order: structural compliance below minimum, PPI matrix required but
/// absent, indicator matrix required but absent. A tripped gate is a valid
/// score carrying a "HARD GATE:" rationale, not an error.
LayerEvaluation evaluateUnitLayer(const LayerContext& ctx);

}  // namespace calib

#endif  // CALIB_LAYERS_UNIT_LAYER_H
