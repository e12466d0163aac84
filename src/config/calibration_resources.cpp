// Implementation of the one-time resource loader.

#include "config/calibration_resources.h"

#include <cstdio>
#include <utility>

namespace calib {

CalibrationResources::CalibrationResources(std::string config_path, std::string registry_path)
    : config_loader_([config_path]() { return loadCalibrationConfig(config_path); }),
      registry_loader_([registry_path]() { return loadIntrinsicRegistry(registry_path); }) {}

CalibrationResources::CalibrationResources(ConfigLoader config_loader,
                                           RegistryLoader registry_loader)
    : config_loader_(std::move(config_loader)),
      registry_loader_(std::move(registry_loader)) {}

const ResourceLoadResult& CalibrationResources::get() {
  std::call_once(once_, [this]() { load(); });
  return result_;
}

void CalibrationResources::load() {
  ConfigLoadResult config = config_loader_();
  if (!config.success) {
    result_.error_message = "configuration rejected: " + config.error_message;
    return;
  }
  RegistryLoadResult registry = registry_loader_();
  if (!registry.success) {
    result_.error_message = "intrinsic registry rejected: " + registry.error_message;
    return;
  }
  result_.config = std::move(config.config);
  result_.registry = std::move(registry.registry);
  result_.success = true;
  std::fprintf(stderr, "[resources] loaded configuration %s (%s), registry %s\n",
               result_.config->version.c_str(), result_.config->config_hash.c_str(),
               result_.registry->version().c_str());
}

}  // namespace calib
