// Plan parsing.

#include "engine/plan_loader.h"

#include <cstdio>
#include <fstream>
#include <set>
#include <sstream>
#include <utility>

#include "core/json_parser.h"

namespace calib {

namespace {

PlanLoadResult failPlan(const std::string& message) {
  std::fprintf(stderr, "[plan] ERROR: %s\n", message.c_str());
  PlanLoadResult result;
  result.error_message = message;
  return result;
}

bool readSubject(const JsonValue& entry, const std::string& path,
                 const CalibrationConfig& config, SubjectSpec& spec, std::string& error) {
  if (!entry.isObject()) {
    error = path + ": expected an object";
    return false;
  }
  const JsonValue* method = entry.find("method");
  if (!method || !method->isString() || method->string_val.empty()) {
    error = path + ".method: missing method id";
    return false;
  }
  spec.method_id = method->string_val;

  const MethodDeclaration* declared = config.findMethod(spec.method_id);
  if (const JsonValue* role = entry.find("role")) {
    if (!role->isString() || !roleFromString(role->string_val, spec.role)) {
      error = path + ".role: unknown role '" + role->asString() + "'";
      return false;
    }
    if (declared && declared->role != spec.role) {
      error = path + ".role: '" + role->string_val + "' conflicts with the declared role '" +
              roleToString(declared->role) + "' of " + spec.method_id;
      return false;
    }
  } else if (declared) {
    spec.role = declared->role;
  } else {
    error = path + ".role: required for undeclared method " + spec.method_id;
    return false;
  }

  spec.node_id = entry.has("node") ? entry.find("node")->asString() : "";
  spec.interplay_group =
      entry.has("interplay_group") ? entry.find("interplay_group")->asString() : "";

  const JsonValue* context = entry.find("context");
  if (!context || !context->isObject()) {
    error = path + ".context: missing object";
    return false;
  }
  const char* keys[] = {"question", "dimension", "policy"};
  std::string* targets[] = {&spec.context.question_id, &spec.context.dimension,
                            &spec.context.policy_area};
  for (size_t idx = 0; idx < 3; ++idx) {
    const JsonValue* val = context->find(keys[idx]);
    if (!val || !val->isString()) {
      error = path + ".context." + keys[idx] + ": missing string";
      return false;
    }
    *targets[idx] = val->string_val;
  }
  const JsonValue* quality = context->find("unit_quality");
  if (!quality || !quality->isNumber()) {
    error = path + ".context.unit_quality: missing number";
    return false;
  }
  spec.context.unit_quality = quality->number_val;
  return true;
}

}  // namespace

PlanLoadResult parsePlan(const std::string& json_text, const CalibrationConfig& config) {
  JsonValue root;
  std::string parse_error;
  if (!parseJson(json_text, root, parse_error)) return failPlan("plan: " + parse_error);
  if (!root.isObject()) return failPlan("plan: expected an object");

  const JsonValue* subjects = root.find("subjects");
  if (!subjects || !subjects->isArray()) return failPlan("plan.subjects: missing array");

  PlanLoadResult result;
  result.evidence = std::make_shared<StaticEvidenceSupplier>();
  if (const JsonValue* timestamp = root.find("timestamp")) {
    result.timestamp = timestamp->asString();
  }

  std::set<std::string> nodes;
  for (size_t idx = 0; idx < subjects->array_items.size(); ++idx) {
    const JsonValue& entry = subjects->array_items[idx];
    std::string path = "plan.subjects[" + std::to_string(idx) + "]";

    SubjectSpec spec;
    std::string error;
    if (!readSubject(entry, path, config, spec, error)) return failPlan(error);
    std::optional<CalibrationSubject> subject = CalibrationSubject::create(spec, &error);
    if (!subject) return failPlan(path + ": " + error);
    if (!nodes.insert(subject->nodeId()).second) {
      return failPlan(path + ".node: duplicate node id '" + subject->nodeId() + "'");
    }

    if (const JsonValue* evidence = entry.find("evidence")) {
      EvidenceParseResult parsed =
          parseEvidenceBundle(*evidence, config.findMethod(subject->methodId()));
      if (parsed.success) {
        result.evidence->add(subject->nodeId(), std::move(parsed.bundle));
      } else {
        // The subject fails closed at calibration time, not the whole plan.
        result.evidence->addError(subject->nodeId(), parsed.error);
      }
    }
    result.subjects.push_back(std::move(*subject));
  }

  result.success = true;
  return result;
}

PlanLoadResult loadPlan(const std::string& path, const CalibrationConfig& config) {
  std::ifstream file(path, std::ios::binary);
  if (!file) return failPlan("cannot open " + path);
  std::ostringstream contents;
  contents << file.rdbuf();
  return parsePlan(contents.str(), config);
}

}  // namespace calib
