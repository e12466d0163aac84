// Implementation of the @C evaluator.

#include "layers/congruence_layer.h"

#include <algorithm>
#include <iterator>
#include <set>

namespace calib {

double jaccardIndex(const std::vector<std::vector<std::string>>& tag_sets) {
  if (tag_sets.empty()) return 0.0;
  std::set<std::string> unite;
  for (const auto& tags : tag_sets) unite.insert(tags.begin(), tags.end());
  if (unite.empty()) return 0.0;

  std::set<std::string> common(tag_sets.front().begin(), tag_sets.front().end());
  for (size_t idx = 1; idx < tag_sets.size(); ++idx) {
    std::set<std::string> next(tag_sets[idx].begin(), tag_sets[idx].end());
    std::set<std::string> kept;
    std::set_intersection(common.begin(), common.end(), next.begin(), next.end(),
                          std::inserter(kept, kept.begin()));
    common.swap(kept);
  }
  return static_cast<double>(common.size()) / static_cast<double>(unite.size());
}

namespace {

/// Scale congruence of the group relative to the subject's output range.
double scaleCongruence(const CalibrationConfig& config, const MethodDeclaration* self,
                       const std::vector<const MethodDeclaration*>& members,
                       std::string& verdict) {
  const CongruenceRubric& rubric = config.congruence;
  if (!self) {
    verdict = "subject unregistered";
    return rubric.incompatible;
  }
  bool converted = false;
  for (const MethodDeclaration* member : members) {
    if (!member) {
      verdict = "unregistered member";
      return rubric.incompatible;
    }
    if (member->output_range == self->output_range) continue;
    if (!config.hasRangeTransform(member->output_range, self->output_range)) {
      verdict = member->method_id + " range " + member->output_range.toString() +
                " not convertible to " + self->output_range.toString();
      return rubric.incompatible;
    }
    converted = true;
  }
  verdict = converted ? "convertible" : "same_range";
  return converted ? rubric.convertible : rubric.same_range;
}

}  // namespace

LayerEvaluation evaluateCongruenceLayer(const LayerContext& ctx) {
  const CalibrationConfig& config = ctx.config;
  const CongruenceRubric& rubric = config.congruence;
  const MethodDeclaration* self = config.findMethod(ctx.subject.methodId());

  LayerScore score;
  score.layer = CanonicalLayer::Congruence;

  if (!ctx.subject.inInterplayGroup()) {
    score.value = self ? rubric.standalone_registered : rubric.standalone_unregistered;
    score.evidence["mode"] = "standalone";
    score.evidence["registered"] = self ? "true" : "false";
    score.formula = self ? "congruence_rubric.standalone_registered"
                         : "congruence_rubric.standalone_unregistered";
    score.rationale = self ? "Acts alone; method is registered"
                           : "Acts alone; method is not registered";
    return LayerEvaluation::scored(std::move(score));
  }

  const std::string& group_id = ctx.subject.interplayGroup();
  score.evidence["mode"] = "interplay";
  score.evidence["group"] = group_id;
  score.formula = "c_scale * c_sem * c_fusion";

  const InterplayGroup* group = config.findGroup(group_id);
  if (!group) {
    score.value = 0.0;
    score.components["c_scale"] = rubric.incompatible;
    score.components["c_sem"] = 0.0;
    score.components["c_fusion"] = rubric.fusion_missing;
    score.rationale = "Interplay group '" + group_id + "' is not declared";
    return LayerEvaluation::scored(std::move(score));
  }

  // The subject always takes part in its own group.
  std::vector<std::string> member_ids = group->members;
  if (std::find(member_ids.begin(), member_ids.end(), ctx.subject.methodId()) ==
      member_ids.end()) {
    member_ids.push_back(ctx.subject.methodId());
  }
  std::vector<const MethodDeclaration*> members;
  std::vector<std::vector<std::string>> tag_sets;
  for (const auto& member_id : member_ids) {
    const MethodDeclaration* member = config.findMethod(member_id);
    members.push_back(member);
    tag_sets.push_back(member ? member->semantic_tags : std::vector<std::string>{});
  }

  std::string scale_verdict;
  double c_scale = scaleCongruence(config, self, members, scale_verdict);
  double c_sem = jaccardIndex(tag_sets);

  double c_fusion = rubric.fusion_missing;
  std::string fusion_verdict = "no fusion rule";
  if (!group->fusion_rule.empty()) {
    if (!ctx.evidence.congruence) {
      return LayerEvaluation::missingEvidence(CanonicalLayer::Congruence, "provided_inputs",
                                              "group '" + group_id +
                                                  "' declares a fusion rule; provided inputs "
                                                  "are required");
    }
    const std::vector<std::string>& provided = ctx.evidence.congruence->provided_inputs;
    size_t missing = 0;
    for (const auto& expected : group->expected_inputs) {
      if (std::find(provided.begin(), provided.end(), expected) == provided.end()) ++missing;
    }
    c_fusion = missing == 0 ? rubric.fusion_complete : rubric.fusion_partial;
    fusion_verdict = group->fusion_rule + (missing == 0 ? ", all inputs present"
                                                        : ", " + std::to_string(missing) +
                                                              " input(s) missing");
  }

  score.value = c_scale * c_sem * c_fusion;
  score.components["c_scale"] = c_scale;
  score.components["c_sem"] = c_sem;
  score.components["c_fusion"] = c_fusion;
  score.evidence["members"] = std::to_string(member_ids.size());
  score.evidence["fusion_rule"] = group->fusion_rule;
  score.rationale = "scale: " + scale_verdict + "; semantic overlap " + formatNumber(c_sem, 3) +
                    "; fusion: " + fusion_verdict;
  return LayerEvaluation::scored(std::move(score));
}

}  // namespace calib
