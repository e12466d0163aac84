// Role-based layer requirements and active-layer resolution.

#ifndef CALIB_CONFIG_LAYER_REQUIREMENTS_H
#define CALIB_CONFIG_LAYER_REQUIREMENTS_H

#include <string>
#include <vector>

#include "config/calibration_config.h"
#include "core/basic_types.h"

namespace calib {

/// @brief Built-in required layers for a role.
///
/// Analyzers need all eight layers; aggregators need the dimension, policy
/// and congruence layers; reporters need congruence; ingestion-class roles
/// need the unit layer; coordination roles need only @b, @chain and @m.
/// Every profile contains BASE.
LayerSet defaultRequiredLayers(MethodRole role);

/// @brief Required layers for a role under a configuration.
/// @return The configured profile if present, otherwise the built-in one.
LayerSet requiredLayers(const CalibrationConfig& config, MethodRole role);

/// Outcome of resolving which layers run for one subject.
struct ActiveLayerResolution {
  LayerSet active;
  bool registered = false;  ///< Method has a declaration in the configuration.
};

/// @brief Active layers for a method of the given role.
///
/// A registered method uses its declared active layers. An unregistered
/// method falls back to its role's required set and a warning is logged.
ActiveLayerResolution resolveActiveLayers(const CalibrationConfig& config,
                                          const std::string& method_id, MethodRole role);

/// @brief Required layers absent from a layer set.
LayerSet missingRequiredLayers(const CalibrationConfig& config, MethodRole role,
                               const LayerSet& present);

/// @brief Whether a declaration may leave out a required layer.
///
/// Needs a non-blank justification; never true for @b.
bool isOmissionJustified(const MethodDeclaration& method, CanonicalLayer layer);

/// @brief Load-time check of one declaration against its role profile.
/// @return One message per omitted required layer that lacks a non-empty
///         justification, and one for an omitted @b whatever its
///         justification. Empty when the declaration is acceptable.
std::vector<std::string> checkDeclaredLayers(const CalibrationConfig& config,
                                             const MethodDeclaration& method);

}  // namespace calib

#endif  // CALIB_CONFIG_LAYER_REQUIREMENTS_H
