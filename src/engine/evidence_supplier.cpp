// Static evidence supplier.

#include "engine/evidence_supplier.h"

#include <utility>

namespace calib {

void StaticEvidenceSupplier::add(const std::string& node_id, EvidenceBundle bundle) {
  EvidenceSupplyResult& entry = bundles_[node_id];
  entry.success = true;
  entry.bundle = std::move(bundle);
  entry.error = EvidenceError();
}

void StaticEvidenceSupplier::addError(const std::string& node_id, EvidenceError error) {
  EvidenceSupplyResult& entry = bundles_[node_id];
  entry.success = false;
  entry.bundle = EvidenceBundle();
  entry.error = std::move(error);
}

EvidenceSupplyResult StaticEvidenceSupplier::supply(const CalibrationSubject& subject,
                                                    const SupplyBudget& /*budget*/) const {
  auto iter = bundles_.find(subject.nodeId());
  if (iter != bundles_.end()) return iter->second;
  EvidenceSupplyResult result;
  result.success = true;
  return result;
}

}  // namespace calib
