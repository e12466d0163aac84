// 2-additive Choquet fusion of layer scores into one calibration score.

#ifndef CALIB_FUSION_CHOQUET_FUSION_H
#define CALIB_FUSION_CHOQUET_FUSION_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "config/calibration_config.h"
#include "core/basic_types.h"

namespace calib {

/// Kind of a term in the fusion trace.
enum class FusionTermKind : uint8_t {
  Linear,      ///< a_l * x_l
  Interaction  ///< a_lk * min(x_l, x_k)
};

/// @brief One step of the fusion, recorded in evaluation order.
struct FusionTerm {
  FusionTermKind kind = FusionTermKind::Linear;
  CanonicalLayer layer_a = CanonicalLayer::Base;
  CanonicalLayer layer_b = CanonicalLayer::Base;  ///< Same as layer_a for Linear.
  double weight = 0.0;
  double input = 0.0;         ///< x_l, or min(x_l, x_k).
  double contribution = 0.0;  ///< weight * input.
  std::string label;          ///< "@b" or "(@u,@chain)".
  std::string rationale;      ///< Interaction rationale from the configuration.
};

/// Result of fusing one subject's layer scores.
struct FusionResult {
  bool success = false;
  std::string error_message;  ///< Set when the final score leaves [0, 1].
  double linear_sum = 0.0;
  double interaction_sum = 0.0;
  double final_score = 0.0;
  std::vector<FusionTerm> terms;  ///< Linear terms in canonical order, then interactions.
};

/// @brief Fuse layer scores with a role's Choquet weights.
///
/// Only layers present in `scores` are active. Linear terms are summed over
/// active layers; an interaction contributes only when both of its layers
/// are active. The result is never clamped: a final score outside [0, 1]
/// (beyond kWeightTolerance) is reported as a configuration error naming
/// the weights that produced it.
///
/// @param fusion Weights for the subject's role.
/// @param scores Active layer -> value in [0, 1].
FusionResult fuseLayerScores(const FusionConfiguration& fusion,
                             const std::map<CanonicalLayer, double>& scores);

/// @brief Recompute sums from a recorded trace in the same order.
/// @return linear_sum + interaction_sum, bit-identical to the original run.
double replayFusionTrace(const std::vector<FusionTerm>& terms, double& linear_sum,
                         double& interaction_sum);

/// @brief d(final)/d(x_l) at the given point.
///
/// The linear weight plus every active interaction in which the layer is
/// strictly the smaller operand (raising a tied operand leaves min unchanged).
double marginalGain(const std::vector<FusionTerm>& terms, CanonicalLayer layer,
                    const std::map<CanonicalLayer, double>& scores);

}  // namespace calib

#endif  // CALIB_FUSION_CHOQUET_FUSION_H
