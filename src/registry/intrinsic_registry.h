// Intrinsic-score registry consumed by the @b layer.

#ifndef CALIB_REGISTRY_INTRINSIC_REGISTRY_H
#define CALIB_REGISTRY_INTRINSIC_REGISTRY_H

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>

namespace calib {

/// Calibration status of a method in the registry.
enum class IntrinsicStatus : uint8_t {
  Computed,  ///< Components were measured.
  Pending,   ///< Not yet measured; neutral fallback applies.
  Excluded,  ///< Method must not be scored; subject is skipped.
  None       ///< Unknown to the registry; penalizing fallback applies.
};

const char* intrinsicStatusToString(IntrinsicStatus status);
bool intrinsicStatusFromString(const std::string& str, IntrinsicStatus& out);

/// Registry entry for one method. Components are meaningful for Computed only.
struct IntrinsicRecord {
  IntrinsicStatus status = IntrinsicStatus::None;
  double b_theory = 0.0;
  double b_impl = 0.0;
  double b_deploy = 0.0;
};

/// @brief Read-only source of intrinsic scores.
///
/// Implementations must be safe to call from several threads at once.
class IIntrinsicRegistry {
 public:
  virtual ~IIntrinsicRegistry() = default;

  /// @brief Record for a canonical method id; status None if unknown.
  virtual IntrinsicRecord getIntrinsic(const std::string& method_id) const = 0;

  /// @brief Version tag of the registry contents, for provenance.
  virtual std::string version() const = 0;
};

/// @brief Immutable registry loaded from JSON.
///
/// File format:
/// @code
///   {"version": "2025-01", "methods": {
///      "pkg.Class.method": {"status": "computed",
///                           "b_theory": 0.9, "b_impl": 0.8, "b_deploy": 0.7}}}
/// @endcode
class JsonIntrinsicRegistry : public IIntrinsicRegistry {
 public:
  JsonIntrinsicRegistry(std::string version, std::map<std::string, IntrinsicRecord> records)
      : version_(std::move(version)), records_(std::move(records)) {}

  IntrinsicRecord getIntrinsic(const std::string& method_id) const override;
  std::string version() const override { return version_; }

  size_t size() const { return records_.size(); }

 private:
  std::string version_;
  std::map<std::string, IntrinsicRecord> records_;
};

/// Result of loading a registry file.
struct RegistryLoadResult {
  bool success = false;
  std::string error_message;
  std::shared_ptr<const JsonIntrinsicRegistry> registry;
};

/// @brief Parse registry JSON text.
///
/// Rejects unknown statuses and, for computed records, missing components
/// or components outside [0, 1].
RegistryLoadResult parseIntrinsicRegistry(const std::string& json_text);

/// @brief Read and parse a registry file.
RegistryLoadResult loadIntrinsicRegistry(const std::string& path);

}  // namespace calib

#endif  // CALIB_REGISTRY_INTRINSIC_REGISTRY_H
