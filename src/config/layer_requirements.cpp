// Implementation of the layer requirement resolver.

#include "config/layer_requirements.h"

#include <cstdio>

namespace calib {

namespace {

constexpr CanonicalLayer B = CanonicalLayer::Base;
constexpr CanonicalLayer CH = CanonicalLayer::Chain;
constexpr CanonicalLayer U = CanonicalLayer::Unit;
constexpr CanonicalLayer Q = CanonicalLayer::Question;
constexpr CanonicalLayer D = CanonicalLayer::Dimension;
constexpr CanonicalLayer P = CanonicalLayer::Policy;
constexpr CanonicalLayer C = CanonicalLayer::Congruence;
constexpr CanonicalLayer M = CanonicalLayer::Meta;

}  // namespace

bool isOmissionJustified(const MethodDeclaration& method, CanonicalLayer layer) {
  // @b carries the registry status, so no justification can stand in for it.
  if (layer == CanonicalLayer::Base) return false;
  auto iter = method.justifications.find(layer);
  if (iter == method.justifications.end()) return false;
  return iter->second.find_first_not_of(" \t\r\n") != std::string::npos;
}

LayerSet defaultRequiredLayers(MethodRole role) {
  switch (role) {
    case MethodRole::Analyzer:
      return {B, CH, U, Q, D, P, C, M};
    case MethodRole::Processor:
    case MethodRole::Ingest:
    case MethodRole::Structure:
    case MethodRole::Extract:
      return {B, CH, U, M};
    case MethodRole::Aggregate:
      return {B, CH, D, P, C, M};
    case MethodRole::Report:
      return {B, CH, C, M};
    case MethodRole::Utility:
    case MethodRole::Orchestrator:
    case MethodRole::Meta:
    case MethodRole::Transform:
      return {B, CH, M};
  }
  return {B};
}

LayerSet requiredLayers(const CalibrationConfig& config, MethodRole role) {
  auto iter = config.layer_requirements.find(role);
  if (iter != config.layer_requirements.end()) return iter->second;
  return defaultRequiredLayers(role);
}

ActiveLayerResolution resolveActiveLayers(const CalibrationConfig& config,
                                          const std::string& method_id, MethodRole role) {
  ActiveLayerResolution resolution;
  const MethodDeclaration* method = config.findMethod(method_id);
  if (method) {
    resolution.registered = true;
    resolution.active = method->active_layers;
    return resolution;
  }
  std::fprintf(stderr,
               "[requirements] WARNING: method '%s' is not registered; "
               "using the %s role profile\n",
               method_id.c_str(), roleToString(role));
  resolution.active = requiredLayers(config, role);
  return resolution;
}

LayerSet missingRequiredLayers(const CalibrationConfig& config, MethodRole role,
                               const LayerSet& present) {
  LayerSet missing;
  for (CanonicalLayer layer : requiredLayers(config, role)) {
    if (!layerSetContains(present, layer)) missing.push_back(layer);
  }
  return missing;
}

std::vector<std::string> checkDeclaredLayers(const CalibrationConfig& config,
                                             const MethodDeclaration& method) {
  std::vector<std::string> errors;
  for (CanonicalLayer layer : missingRequiredLayers(config, method.role, method.active_layers)) {
    if (layer == CanonicalLayer::Base) {
      errors.push_back("method '" + method.method_id + "' (" + roleToString(method.role) +
                       ") omits required layer @b; @b cannot be justified away");
      continue;
    }
    if (isOmissionJustified(method, layer)) continue;
    errors.push_back("method '" + method.method_id + "' (" + roleToString(method.role) +
                     ") omits required layer " + layerToString(layer) +
                     " without an approved justification");
  }
  return errors;
}

}  // namespace calib
