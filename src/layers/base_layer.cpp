// Implementation of the @b evaluator.

#include "layers/base_layer.h"

#include <cstdio>

namespace calib {

LayerEvaluation evaluateBaseLayer(const LayerContext& ctx) {
  const std::string& method_id = ctx.subject.methodId();
  IntrinsicRecord record = ctx.registry.getIntrinsic(method_id);
  const IntrinsicFallbacks& fallbacks = ctx.config.intrinsic_fallbacks;

  std::string source;
  switch (record.status) {
    case IntrinsicStatus::Computed:
      source = "registry";
      break;
    case IntrinsicStatus::Pending:
      record.b_theory = record.b_impl = record.b_deploy = fallbacks.pending;
      source = "fallback (pending)";
      break;
    case IntrinsicStatus::None:
      std::fprintf(stderr,
                   "[base] WARNING: method '%s' has no intrinsic calibration; "
                   "using fallback %g\n",
                   method_id.c_str(), fallbacks.none);
      record.b_theory = record.b_impl = record.b_deploy = fallbacks.none;
      source = "fallback (none)";
      break;
    case IntrinsicStatus::Excluded: {
      LayerEvaluation eval;
      eval.skipped = true;
      eval.skip_reason = intrinsicStatusToString(record.status);
      return eval;
    }
  }

  const BaseWeights& weights = ctx.config.base_weights;
  LayerScore score;
  score.layer = CanonicalLayer::Base;
  score.value = weights.theory * record.b_theory + weights.impl * record.b_impl +
                weights.deploy * record.b_deploy;
  score.components["b_theory"] = record.b_theory;
  score.components["b_impl"] = record.b_impl;
  score.components["b_deploy"] = record.b_deploy;
  score.evidence["intrinsic_status"] = intrinsicStatusToString(record.status);
  score.evidence["registry_version"] = ctx.registry.version();
  score.evidence["source"] = source;
  score.formula = formatNumber(weights.theory) + "*b_theory + " + formatNumber(weights.impl) +
                  "*b_impl + " + formatNumber(weights.deploy) + "*b_deploy";
  score.rationale = "Intrinsic quality from " + source + ": theory=" +
                    formatNumber(record.b_theory) + ", impl=" + formatNumber(record.b_impl) +
                    ", deploy=" + formatNumber(record.b_deploy);
  return LayerEvaluation::scored(std::move(score));
}

}  // namespace calib
