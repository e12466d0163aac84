// Loading and validation of the calibration configuration.

#ifndef CALIB_CONFIG_CONFIG_LOADER_H
#define CALIB_CONFIG_CONFIG_LOADER_H

#include <memory>
#include <string>
#include <vector>

#include "config/calibration_config.h"

namespace calib {

/// @brief Result of a configuration load.
///
/// On failure `config` is null; there is no partially valid configuration.
struct ConfigLoadResult {
  bool success = false;
  std::string error_message;          ///< All errors joined with "; ".
  std::vector<std::string> errors;    ///< One entry per problem found.
  std::shared_ptr<const CalibrationConfig> config;
};

/// @brief Read, parse, validate and hash a configuration file.
ConfigLoadResult loadCalibrationConfig(const std::string& path);

/// @brief Parse, validate and hash configuration JSON text.
ConfigLoadResult parseCalibrationConfig(const std::string& json_text);

/// @brief Validate and hash an already populated configuration.
///
/// Fills missing role profiles with the built-in ones before validating.
ConfigLoadResult finalizeCalibrationConfig(CalibrationConfig config);

/// @brief Run every load-time check.
///
/// Weight normalization, value ranges, unit transform shape, role profiles,
/// declared layers versus requirements, fusion coverage of declared roles
/// and anti-universality.
/// @return All problems found, empty if the configuration is valid.
std::vector<std::string> validateCalibrationConfig(const CalibrationConfig& config);

}  // namespace calib

#endif  // CALIB_CONFIG_CONFIG_LOADER_H
