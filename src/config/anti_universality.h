// Load-time rejection of methods declared compatible with every context.

#ifndef CALIB_CONFIG_ANTI_UNIVERSALITY_H
#define CALIB_CONFIG_ANTI_UNIVERSALITY_H

#include <string>
#include <vector>

#include "config/calibration_config.h"

namespace calib {

/// @brief Check one method across the whole configured domain.
///
/// A method is universal when its @q, @d and @p scores are all at or above
/// the configured threshold for every (question, dimension, policy area)
/// combination. The scan stops at the first combination that falls short.
///
/// @param config Configuration providing domain, tiers and threshold.
/// @param method Declaration to check.
/// @param witness Receives the first non-maximal combination, e.g.
///        "Q002/DIM01/PA01", when the method is not universal (may be nullptr).
/// @return True if the method is universal (a violation).
bool isUniversalMethod(const CalibrationConfig& config, const MethodDeclaration& method,
                       std::string* witness = nullptr);

/// @brief Check every declared method.
/// @return One error message per universal method, in method id order.
std::vector<std::string> checkAntiUniversality(const CalibrationConfig& config);

}  // namespace calib

#endif  // CALIB_CONFIG_ANTI_UNIVERSALITY_H
