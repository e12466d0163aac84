// Tests for config/calibration_resources.h -- one-time shared loading.

#include "config/calibration_resources.h"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "test_helpers.h"

namespace calib {
namespace {

TEST(CalibrationResourcesTest, LoadsSampleFiles) {
  CalibrationResources resources(test_helpers::sourcePath("config/calibration.json"),
                                 test_helpers::sourcePath("config/intrinsic_registry.json"));
  const ResourceLoadResult& loaded = resources.get();
  ASSERT_TRUE(loaded.success) << loaded.error_message;
  EXPECT_EQ(loaded.registry->version(), "intrinsic-2025.06");
  EXPECT_EQ(loaded.config->config_hash, test_helpers::sampleConfig()->config_hash);
}

TEST(CalibrationResourcesTest, ConcurrentFirstCallsLoadOnce) {
  std::atomic<int> config_loads{0};
  std::atomic<int> registry_loads{0};
  CalibrationResources resources(
      [&config_loads]() {
        ++config_loads;
        return finalizeCalibrationConfig(test_helpers::sampleConfigCopy());
      },
      [&registry_loads]() {
        ++registry_loads;
        return loadIntrinsicRegistry(test_helpers::sourcePath("config/intrinsic_registry.json"));
      });

  constexpr int kThreads = 8;
  std::vector<const CalibrationConfig*> seen(kThreads, nullptr);
  std::vector<std::thread> threads;
  for (int idx = 0; idx < kThreads; ++idx) {
    threads.emplace_back([&resources, &seen, idx]() {
      seen[static_cast<size_t>(idx)] = resources.get().config.get();
    });
  }
  for (auto& thread : threads) thread.join();

  EXPECT_EQ(config_loads.load(), 1);
  EXPECT_EQ(registry_loads.load(), 1);
  ASSERT_NE(seen[0], nullptr);
  for (const CalibrationConfig* config : seen) EXPECT_EQ(config, seen[0]);
}

TEST(CalibrationResourcesTest, FailedLoadIsFinal) {
  int config_loads = 0;
  CalibrationResources resources(
      [&config_loads]() {
        ++config_loads;
        return parseCalibrationConfig("not json");
      },
      []() { return RegistryLoadResult{}; });

  EXPECT_FALSE(resources.get().success);
  EXPECT_FALSE(resources.get().success);
  EXPECT_EQ(config_loads, 1);
  EXPECT_EQ(resources.get().config, nullptr);
  EXPECT_EQ(resources.get().error_message.rfind("configuration rejected", 0), 0u);
}

TEST(CalibrationResourcesTest, RegistryFailureRejectsBoth) {
  CalibrationResources resources(
      []() { return finalizeCalibrationConfig(test_helpers::sampleConfigCopy()); },
      []() { return parseIntrinsicRegistry("{\"methods\": {}}"); });
  const ResourceLoadResult& loaded = resources.get();
  EXPECT_FALSE(loaded.success);
  EXPECT_EQ(loaded.config, nullptr);
  EXPECT_EQ(loaded.error_message.rfind("intrinsic registry rejected", 0), 0u);
}

}  // namespace
}  // namespace calib
