// @C: congruence of co-acting methods in an interplay group.

#ifndef CALIB_LAYERS_CONGRUENCE_LAYER_H
#define CALIB_LAYERS_CONGRUENCE_LAYER_H

#include <string>
#include <vector>

#include "layers/layer_context.h"

namespace calib {

/// @brief Jaccard index |intersection| / |union| over several tag sets.
/// @return 0 when the union is empty.
double jaccardIndex(const std::vector<std::vector<std::string>>& tag_sets);

/// @brief Score @C.
///
/// A subject acting alone scores the standalone value for registered or
/// unregistered methods. Inside a group the score is
/// c_scale * c_sem * c_fusion. c_fusion needs CongruenceEvidence only when
/// the group declares a fusion rule.
LayerEvaluation evaluateCongruenceLayer(const LayerContext& ctx);

}  // namespace calib

#endif  // CALIB_LAYERS_CONGRUENCE_LAYER_H
