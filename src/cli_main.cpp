/// @file
/// @brief CLI entry point for plan validation.

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "certificate/certificate_reader.h"
#include "config/calibration_resources.h"
#include "engine/calibration_engine.h"
#include "engine/plan_loader.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitConfigError = 1;
constexpr int kExitUsage = 2;

/// @brief Command-line options parsed from argv.
struct CliOptions {
  std::string config_path;
  std::string registry_path;
  std::string plan_path;
  unsigned threads = 1;
  long timeout_ms = 0;
  std::string timestamp;
  bool json_output = false;
  std::string output;
  std::string certificates_dir;
  std::vector<std::string> verify_paths;
};

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("calib_cli - Multi-layer method calibration\n\n");
  std::printf("Usage: calib_cli --config FILE --registry FILE --plan FILE [options]\n");
  std::printf("       calib_cli --verify FILE [--verify FILE ...]\n\n");
  std::printf("Options:\n");
  std::printf("  --config FILE       Calibration configuration (JSON)\n");
  std::printf("  --registry FILE     Intrinsic score registry (JSON)\n");
  std::printf("  --plan FILE         Validation plan: subjects and evidence (JSON)\n");
  std::printf("  --threads N         Worker threads (default 1)\n");
  std::printf("  --timeout-ms N      Per-subject time budget, 0 = none (default 0)\n");
  std::printf("  --timestamp TEXT    Audit timestamp (default: plan's, else current UTC)\n");
  std::printf("  --json              Write the plan report as JSON\n");
  std::printf("  -o FILE             JSON output path (default stdout)\n");
  std::printf("  --certificates DIR  Write one certificate per subject into DIR\n");
  std::printf("  --verify FILE       Replay a written certificate and check its id\n");
  std::printf("  --help              Show this help\n");
}

/// @brief Parse a non-negative integer argument.
bool parseCount(const char* text, long& out) {
  char* end = nullptr;
  long val = std::strtol(text, &end, 10);
  if (end == text || *end != '\0' || val < 0) return false;
  out = val;
  return true;
}

/// @brief Parse command-line arguments into CliOptions.
/// @return kExitOk to continue, or the exit code to stop with.
///         --help stops with kExitOk through `stop`.
int parseArgs(int argc, char* argv[], CliOptions& opts, bool& stop) {
  stop = false;
  for (int idx = 1; idx < argc; ++idx) {
    const char* arg = argv[idx];
    bool has_value = idx + 1 < argc;
    if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      printUsage();
      stop = true;
      return kExitOk;
    }
    if (std::strcmp(arg, "--config") == 0 && has_value) {
      opts.config_path = argv[++idx];
    } else if (std::strcmp(arg, "--registry") == 0 && has_value) {
      opts.registry_path = argv[++idx];
    } else if (std::strcmp(arg, "--plan") == 0 && has_value) {
      opts.plan_path = argv[++idx];
    } else if (std::strcmp(arg, "--threads") == 0 && has_value) {
      long count = 0;
      if (!parseCount(argv[++idx], count) || count == 0) {
        std::fprintf(stderr, "Error: --threads expects a positive integer\n");
        return kExitUsage;
      }
      opts.threads = static_cast<unsigned>(count);
    } else if (std::strcmp(arg, "--timeout-ms") == 0 && has_value) {
      if (!parseCount(argv[++idx], opts.timeout_ms)) {
        std::fprintf(stderr, "Error: --timeout-ms expects a non-negative integer\n");
        return kExitUsage;
      }
    } else if (std::strcmp(arg, "--timestamp") == 0 && has_value) {
      opts.timestamp = argv[++idx];
    } else if (std::strcmp(arg, "--json") == 0) {
      opts.json_output = true;
    } else if (std::strcmp(arg, "-o") == 0 && has_value) {
      opts.output = argv[++idx];
    } else if (std::strcmp(arg, "--certificates") == 0 && has_value) {
      opts.certificates_dir = argv[++idx];
    } else if (std::strcmp(arg, "--verify") == 0 && has_value) {
      opts.verify_paths.push_back(argv[++idx]);
    } else {
      std::fprintf(stderr, "Error: unknown or incomplete option '%s'\n", arg);
      return kExitUsage;
    }
  }
  if (!opts.verify_paths.empty()) return kExitOk;
  if (opts.config_path.empty() || opts.registry_path.empty() || opts.plan_path.empty()) {
    std::fprintf(stderr, "Error: --config, --registry and --plan are required\n");
    return kExitUsage;
  }
  return kExitOk;
}

/// @brief Current UTC time as ISO 8601.
std::string currentTimestamp() {
  std::time_t now = std::time(nullptr);
  std::tm utc{};
  gmtime_r(&now, &utc);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return buf;
}

bool writeTextFile(const std::string& path, const std::string& text) {
  std::ofstream file(path);
  if (!file.is_open()) return false;
  file << text;
  return static_cast<bool>(file);
}

/// @brief File name for a certificate: node id with path separators replaced.
std::string certificateFileName(const std::string& node_id) {
  std::string name = node_id;
  for (auto& chr : name) {
    if (chr == '/' || chr == '\\') chr = '_';
  }
  return name + ".json";
}

/// @brief Verify each certificate file and print one line per file.
/// @return kExitOk when every certificate verifies.
int verifyCertificateFiles(const std::vector<std::string>& paths) {
  int failures = 0;
  for (const auto& path : paths) {
    calib::CalibrationCertificate cert;
    std::string error;
    if (!calib::loadCertificateFile(path, cert, error)) {
      std::fprintf(stderr, "Error: %s\n", error.c_str());
      ++failures;
      continue;
    }
    calib::CertificateVerification verified = calib::verifyCertificate(cert);
    if (verified.success) {
      std::printf("OK       %s (%s, score %s)\n", path.c_str(), cert.method_id.c_str(),
                  calib::formatNumber(cert.calibration_score).c_str());
    } else {
      std::printf("INVALID  %s: %s\n", path.c_str(), verified.error_message.c_str());
      ++failures;
    }
  }
  std::fprintf(stderr, "[cli] verify: %zu certificates, %d failed\n", paths.size(), failures);
  return failures == 0 ? kExitOk : kExitConfigError;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  bool stop = false;
  int code = parseArgs(argc, argv, opts, stop);
  if (stop || code != kExitOk) return code;
  if (!opts.verify_paths.empty()) return verifyCertificateFiles(opts.verify_paths);

  std::printf("calib_cli v1.0.0\n");
  std::printf("Config:   %s\n", opts.config_path.c_str());
  std::printf("Registry: %s\n", opts.registry_path.c_str());
  std::printf("Plan:     %s\n", opts.plan_path.c_str());
  std::printf("Threads:  %u\n", opts.threads);

  calib::CalibrationResources resources(opts.config_path, opts.registry_path);
  const calib::ResourceLoadResult& loaded = resources.get();
  if (!loaded.success) {
    std::fprintf(stderr, "Error: %s\n", loaded.error_message.c_str());
    return kExitConfigError;
  }
  std::printf("Config hash: %s\n\n", loaded.config->config_hash.c_str());

  calib::PlanLoadResult plan = calib::loadPlan(opts.plan_path, *loaded.config);
  if (!plan.success) {
    std::fprintf(stderr, "Error: %s\n", plan.error_message.c_str());
    return kExitConfigError;
  }

  calib::PlanOptions plan_opts;
  plan_opts.threads = opts.threads;
  plan_opts.timeout = std::chrono::milliseconds(opts.timeout_ms);
  if (!opts.timestamp.empty()) {
    plan_opts.timestamp = opts.timestamp;
  } else if (!plan.timestamp.empty()) {
    plan_opts.timestamp = plan.timestamp;
  } else {
    plan_opts.timestamp = currentTimestamp();
  }

  calib::CalibrationEngine engine(loaded.config, loaded.registry);
  std::vector<calib::CalibrationCertificate> certificates;
  calib::PlanReport report =
      engine.validatePlan(plan.subjects, *plan.evidence, plan_opts, &certificates);

  std::printf("%s", report.toTextSummary().c_str());
  std::fprintf(stderr, "[cli] plan: %u subjects, overall %s\n", report.summary.total,
               calib::decisionToString(report.overall_decision));

  if (opts.json_output) {
    std::string json = report.toJson();
    if (opts.output.empty()) {
      std::printf("%s\n", json.c_str());
    } else if (writeTextFile(opts.output, json)) {
      std::printf("\nJSON:     %s\n", opts.output.c_str());
    } else {
      std::fprintf(stderr, "Error: failed to write %s\n", opts.output.c_str());
      return kExitConfigError;
    }
  }

  if (!opts.certificates_dir.empty()) {
    std::error_code dir_error;
    std::filesystem::create_directories(opts.certificates_dir, dir_error);
    if (dir_error) {
      std::fprintf(stderr, "Error: cannot create %s: %s\n", opts.certificates_dir.c_str(),
                   dir_error.message().c_str());
      return kExitConfigError;
    }
    for (const auto& cert : certificates) {
      std::filesystem::path path =
          std::filesystem::path(opts.certificates_dir) / certificateFileName(cert.node_id);
      if (!writeTextFile(path.string(), calib::certificateToJson(cert))) {
        std::fprintf(stderr, "Warning: failed to write %s\n", path.string().c_str());
      }
    }
    std::printf("Certificates: %zu written to %s\n", certificates.size(),
                opts.certificates_dir.c_str());
  }

  return report.success ? kExitOk : kExitConfigError;
}
