// One-time, thread-safe loading of the shared calibration resources.

#ifndef CALIB_CONFIG_CALIBRATION_RESOURCES_H
#define CALIB_CONFIG_CALIBRATION_RESOURCES_H

#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "config/config_loader.h"
#include "registry/intrinsic_registry.h"

namespace calib {

/// Configuration and registry as loaded together.
struct ResourceLoadResult {
  bool success = false;
  std::string error_message;
  std::shared_ptr<const CalibrationConfig> config;
  std::shared_ptr<const IIntrinsicRegistry> registry;
};

/// @brief Owner of the process-wide configuration and registry.
///
/// The first get() runs the loaders under std::call_once; concurrent first
/// callers block until that load finishes and every caller sees the same
/// result. A failed load is final: nothing is retried or defaulted.
class CalibrationResources {
 public:
  using ConfigLoader = std::function<ConfigLoadResult()>;
  using RegistryLoader = std::function<RegistryLoadResult()>;

  /// @brief Load from files on first use.
  CalibrationResources(std::string config_path, std::string registry_path);

  /// @brief Load through caller-supplied loaders on first use.
  CalibrationResources(ConfigLoader config_loader, RegistryLoader registry_loader);

  CalibrationResources(const CalibrationResources&) = delete;
  CalibrationResources& operator=(const CalibrationResources&) = delete;

  /// @brief Shared resources, loading them on the first call.
  const ResourceLoadResult& get();

 private:
  void load();

  ConfigLoader config_loader_;
  RegistryLoader registry_loader_;
  std::once_flag once_;
  ResourceLoadResult result_;
};

}  // namespace calib

#endif  // CALIB_CONFIG_CALIBRATION_RESOURCES_H
