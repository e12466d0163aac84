// Reading validation plans: subjects plus their evidence.

#ifndef CALIB_ENGINE_PLAN_LOADER_H
#define CALIB_ENGINE_PLAN_LOADER_H

#include <memory>
#include <string>
#include <vector>

#include "config/calibration_config.h"
#include "engine/evidence_supplier.h"

namespace calib {

/// @brief Parsed plan.
///
/// Evidence is keyed by node id, so node ids must be unique within a plan.
struct PlanLoadResult {
  bool success = false;
  std::string error_message;
  std::vector<CalibrationSubject> subjects;
  std::shared_ptr<StaticEvidenceSupplier> evidence;
  std::string timestamp;  ///< Optional "timestamp" field of the plan.
};

/// @brief Parse plan JSON.
///
/// Layout:
/// @code
///   {"timestamp": "2025-01-01T00:00:00Z",
///    "subjects": [
///      {"method": "pkg.Class.run", "role": "analyzer", "node": "n1",
///       "interplay_group": "g1",
///       "context": {"question": "Q001", "dimension": "D1",
///                   "policy": "P1", "unit_quality": 0.8},
///       "evidence": {"chain": {...}, "unit": {...}, "meta": {...}}}]}
/// @endcode
/// "role" may be omitted for a method declared in the configuration; when
/// given for such a method it must match the declared role.
///
/// @param json_text Plan JSON.
/// @param config Configuration used to resolve roles and input signatures.
PlanLoadResult parsePlan(const std::string& json_text, const CalibrationConfig& config);

/// @brief Read and parse a plan file.
PlanLoadResult loadPlan(const std::string& path, const CalibrationConfig& config);

}  // namespace calib

#endif  // CALIB_ENGINE_PLAN_LOADER_H
