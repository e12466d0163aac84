// Implementation of basic type conversions and subject validation.

#include "core/basic_types.h"

#include <algorithm>
#include <cstdio>

namespace calib {

// ---------------------------------------------------------------------------
// CanonicalLayer
// ---------------------------------------------------------------------------

const char* layerToString(CanonicalLayer layer) {
  switch (layer) {
    case CanonicalLayer::Base:       return "@b";
    case CanonicalLayer::Chain:      return "@chain";
    case CanonicalLayer::Unit:       return "@u";
    case CanonicalLayer::Question:   return "@q";
    case CanonicalLayer::Dimension:  return "@d";
    case CanonicalLayer::Policy:     return "@p";
    case CanonicalLayer::Congruence: return "@C";
    case CanonicalLayer::Meta:       return "@m";
  }
  return "unknown";
}

const char* layerDisplayName(CanonicalLayer layer) {
  switch (layer) {
    case CanonicalLayer::Base:       return "base";
    case CanonicalLayer::Chain:      return "chain";
    case CanonicalLayer::Unit:       return "unit";
    case CanonicalLayer::Question:   return "question";
    case CanonicalLayer::Dimension:  return "dimension";
    case CanonicalLayer::Policy:     return "policy";
    case CanonicalLayer::Congruence: return "congruence";
    case CanonicalLayer::Meta:       return "meta";
  }
  return "unknown";
}

bool layerFromString(const std::string& str, CanonicalLayer& out) {
  for (CanonicalLayer layer : kAllLayers) {
    if (str == layerToString(layer)) {
      out = layer;
      return true;
    }
  }
  return false;
}

bool isContextualLayer(CanonicalLayer layer) {
  switch (layer) {
    case CanonicalLayer::Question:
    case CanonicalLayer::Dimension:
    case CanonicalLayer::Policy:
      return true;
    case CanonicalLayer::Base:
    case CanonicalLayer::Chain:
    case CanonicalLayer::Unit:
    case CanonicalLayer::Congruence:
    case CanonicalLayer::Meta:
      return false;
  }
  return false;
}

void layerSetInsert(LayerSet& set, CanonicalLayer layer) {
  auto pos = std::lower_bound(set.begin(), set.end(), layer,
                              [](CanonicalLayer lhs, CanonicalLayer rhs) {
                                return layerIndex(lhs) < layerIndex(rhs);
                              });
  if (pos != set.end() && *pos == layer) return;
  set.insert(pos, layer);
}

bool layerSetContains(const LayerSet& set, CanonicalLayer layer) {
  return std::find(set.begin(), set.end(), layer) != set.end();
}

// ---------------------------------------------------------------------------
// MethodRole
// ---------------------------------------------------------------------------

const char* roleToString(MethodRole role) {
  switch (role) {
    case MethodRole::Analyzer:     return "analyzer";
    case MethodRole::Processor:    return "processor";
    case MethodRole::Ingest:       return "ingest";
    case MethodRole::Structure:    return "structure";
    case MethodRole::Extract:      return "extract";
    case MethodRole::Aggregate:    return "aggregate";
    case MethodRole::Report:       return "report";
    case MethodRole::Utility:      return "utility";
    case MethodRole::Orchestrator: return "orchestrator";
    case MethodRole::Meta:         return "meta";
    case MethodRole::Transform:    return "transform";
  }
  return "unknown";
}

bool roleFromString(const std::string& str, MethodRole& out) {
  for (MethodRole role : kAllRoles) {
    if (str == roleToString(role)) {
      out = role;
      return true;
    }
  }
  return false;
}

// ---------------------------------------------------------------------------
// CalibrationSubject
// ---------------------------------------------------------------------------

std::optional<CalibrationSubject> CalibrationSubject::create(const SubjectSpec& spec,
                                                             std::string* error) {
  if (spec.method_id.empty()) {
    if (error) *error = "subject has an empty method_id";
    return std::nullopt;
  }
  // Negated comparison also rejects NaN.
  if (!(spec.context.unit_quality >= 0.0 && spec.context.unit_quality <= 1.0)) {
    if (error) {
      *error = "subject " + spec.method_id + ": unit_quality " +
               formatNumber(spec.context.unit_quality) + " outside [0, 1]";
    }
    return std::nullopt;
  }

  CalibrationSubject subject;
  subject.method_id_ = spec.method_id;
  subject.role_ = spec.role;
  subject.node_id_ = spec.node_id.empty() ? spec.method_id : spec.node_id;
  subject.interplay_group_ = spec.interplay_group;
  subject.context_ = spec.context;
  return subject;
}

// ---------------------------------------------------------------------------
// Formatting
// ---------------------------------------------------------------------------

std::string formatNumber(double val, int precision) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*g", precision, val);
  return buf;
}

}  // namespace calib
