// Implementation of the JSON-backed intrinsic registry.

#include "registry/intrinsic_registry.h"

#include <cstdio>
#include <utility>

#include "core/json_parser.h"

namespace calib {

const char* intrinsicStatusToString(IntrinsicStatus status) {
  switch (status) {
    case IntrinsicStatus::Computed: return "computed";
    case IntrinsicStatus::Pending:  return "pending";
    case IntrinsicStatus::Excluded: return "excluded";
    case IntrinsicStatus::None:     return "none";
  }
  return "unknown";
}

bool intrinsicStatusFromString(const std::string& str, IntrinsicStatus& out) {
  if (str == "computed") {
    out = IntrinsicStatus::Computed;
  } else if (str == "pending") {
    out = IntrinsicStatus::Pending;
  } else if (str == "excluded") {
    out = IntrinsicStatus::Excluded;
  } else if (str == "none") {
    out = IntrinsicStatus::None;
  } else {
    return false;
  }
  return true;
}

IntrinsicRecord JsonIntrinsicRegistry::getIntrinsic(const std::string& method_id) const {
  auto iter = records_.find(method_id);
  if (iter == records_.end()) return IntrinsicRecord{};
  return iter->second;
}

namespace {

RegistryLoadResult failRegistry(const std::string& message) {
  std::fprintf(stderr, "[registry] ERROR: %s\n", message.c_str());
  RegistryLoadResult result;
  result.error_message = message;
  return result;
}

RegistryLoadResult buildRegistry(const JsonValue& root) {
  if (!root.isObject()) return failRegistry("registry must be a JSON object");
  std::string version = root.find("version") ? root.find("version")->asString() : "";
  if (version.empty()) return failRegistry("registry: missing version");

  const JsonValue* methods = root.find("methods");
  if (!methods || !methods->isObject()) {
    return failRegistry("registry: missing 'methods' object");
  }

  std::map<std::string, IntrinsicRecord> records;
  for (const auto& member : methods->members) {
    const std::string& method_id = member.first;
    const JsonValue& body = member.second;
    if (!body.isObject()) return failRegistry("registry." + method_id + ": expected an object");

    IntrinsicRecord record;
    const JsonValue* status = body.find("status");
    if (!status || !intrinsicStatusFromString(status->asString(), record.status)) {
      return failRegistry("registry." + method_id + ": unknown status '" +
                          (status ? status->asString() : "") + "'");
    }

    if (record.status == IntrinsicStatus::Computed) {
      struct Component {
        const char* name;
        double* target;
      };
      const Component components[] = {{"b_theory", &record.b_theory},
                                      {"b_impl", &record.b_impl},
                                      {"b_deploy", &record.b_deploy}};
      for (const auto& component : components) {
        const JsonValue* val = body.find(component.name);
        if (!val || !val->isNumber()) {
          return failRegistry("registry." + method_id + ": computed record lacks " +
                              component.name);
        }
        if (!(val->number_val >= 0.0 && val->number_val <= 1.0)) {
          return failRegistry("registry." + method_id + "." + component.name + " = " +
                              std::to_string(val->number_val) + " is outside [0, 1]");
        }
        *component.target = val->number_val;
      }
    }
    records[method_id] = record;
  }

  RegistryLoadResult result;
  result.success = true;
  result.registry = std::make_shared<const JsonIntrinsicRegistry>(std::move(version),
                                                                  std::move(records));
  return result;
}

}  // namespace

RegistryLoadResult parseIntrinsicRegistry(const std::string& json_text) {
  JsonValue root;
  std::string error;
  if (!parseJson(json_text, root, error)) return failRegistry("malformed registry JSON: " + error);
  return buildRegistry(root);
}

RegistryLoadResult loadIntrinsicRegistry(const std::string& path) {
  JsonValue root;
  std::string error;
  if (!parseJsonFile(path, root, error)) return failRegistry("cannot load registry: " + error);
  return buildRegistry(root);
}

}  // namespace calib
