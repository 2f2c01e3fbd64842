#ifndef VIGIL_STORAGE_TEST_DATA_HPP
#define VIGIL_STORAGE_TEST_DATA_HPP
/**
 * @file StorageTestData.hpp
 * @brief Snapshot builders and temp directories shared by storage tests.
 */

#include "src/helpers/inc/Clock.hpp"
#include "src/model/inc/MetricSnapshot.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <cstdlib>
#include <string>

namespace vigil {

namespace storage {

namespace test {

/// Fully populated snapshot; @p seed varies every value.
inline model::MetricSnapshot makeSnapshot(const std::string& host, std::int64_t tsMillis,
                                          int seed = 0, std::size_t cores = 2) {
  model::MetricSnapshot s{};
  s.hostname = host;
  s.timestamp = vigil::helpers::clock::fromUnixMillis(tsMillis);
  s.cpu.overallPercent = 12.5 + seed;
  for (std::size_t i = 0; i < cores; ++i) {
    s.cpu.perCorePercent.push_back(0.1 + 0.2 + static_cast<double>(i) + seed);
  }
  s.cpu.coreCountLogical = static_cast<std::uint32_t>(cores);
  s.cpu.loadAvg = {0.52, 0.58, 0.59 + seed};
  s.memory = {16'000'000'000ULL, 8'000'000'000ULL + static_cast<std::uint64_t>(seed),
              4'000'000'000ULL, 7'000'000'000ULL, 500'000'000ULL, 3'000'000'000ULL,
              50.0 + seed / 1000.0};
  s.swap = {2'000'000'000ULL, 0, 2'000'000'000ULL, 0.0};
  s.disk.filesystems.push_back(
      {"/", "/dev/nvme0n1p2", "ext4", 500'000'000'000ULL, 200'000'000'000ULL,
       275'000'000'000ULL, 42.105263157894736});
  s.disk.filesystems.push_back({"/mnt/my data", "/dev/sdb1", "xfs", 1'000'000'000ULL,
                                900'000'000ULL, 100'000'000ULL, 90.0 + seed});
  // Counters above INT64_MAX exercise the full unsigned range.
  s.network = {18'000'000'000'000'000'000ULL, 1'234'567ULL + static_cast<std::uint64_t>(seed),
               1000, 2000, 1, 2, 3, 4};
  return s;
}

/// mkdtemp() directory removed on TearDown.
class TempDirTest : public ::testing::Test {
protected:
  std::string dir_{};

  void SetUp() override {
    char tmpl[] = "/tmp/vigil_storage_XXXXXX";
    const char* made = ::mkdtemp(tmpl);
    ASSERT_NE(made, nullptr);
    dir_ = made;
  }

  void TearDown() override {
    const std::string CMD = "rm -rf '" + dir_ + "'";
    EXPECT_EQ(std::system(CMD.c_str()), 0);
  }
};

} // namespace test

} // namespace storage

} // namespace vigil

#endif // VIGIL_STORAGE_TEST_DATA_HPP
