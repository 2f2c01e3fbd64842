/**
 * @file ThresholdConfig_uTest.cpp
 * @brief Unit tests for vigil::alert::ThresholdConfig.
 */

#include "src/alert/inc/ThresholdConfig.hpp"

#include <gtest/gtest.h>

#include <string>

using vigil::alert::MetricThreshold;
using vigil::alert::ThresholdConfig;
using vigil::model::Severity;

/** @test Recovery and critical levels fall back to their defaults. */
TEST(ThresholdConfigTest, DefaultLevels) {
  MetricThreshold t{};
  t.value = 80.0;
  EXPECT_DOUBLE_EQ(t.recoveryLevel(), 80.0);
  EXPECT_DOUBLE_EQ(t.criticalLevel(), 95.0);

  t.value = 90.0;
  EXPECT_DOUBLE_EQ(t.criticalLevel(), 100.0);

  t.recovery = 70.0;
  t.critical = 92.0;
  EXPECT_DOUBLE_EQ(t.recoveryLevel(), 70.0);
  EXPECT_DOUBLE_EQ(t.criticalLevel(), 92.0);
}

/** @test Severity bands: warning at the threshold, error from the midpoint, critical at the top. */
TEST(ThresholdConfigTest, SeverityBands) {
  MetricThreshold t{};
  t.value = 80.0; // critical 95, midpoint 87.5
  EXPECT_EQ(t.severityFor(80.0), Severity::WARNING);
  EXPECT_EQ(t.severityFor(87.4), Severity::WARNING);
  EXPECT_EQ(t.severityFor(87.5), Severity::ERROR);
  EXPECT_EQ(t.severityFor(94.9), Severity::ERROR);
  EXPECT_EQ(t.severityFor(95.0), Severity::CRITICAL);
  EXPECT_EQ(t.severityFor(100.0), Severity::CRITICAL);
}

/** @test Lookup by name; unconfigured metrics return nullptr. */
TEST(ThresholdConfigTest, Find) {
  ThresholdConfig cfg{};
  cfg.metrics["cpu"].value = 80.0;
  ASSERT_NE(cfg.find("cpu"), nullptr);
  EXPECT_DOUBLE_EQ(cfg.find("cpu")->value, 80.0);
  EXPECT_EQ(cfg.find("disk"), nullptr);
}

/** @test validate() names the offending metric. */
TEST(ThresholdConfigTest, ValidateRejects) {
  std::string reason;
  ThresholdConfig cfg{};
  cfg.metrics["cpu"].value = 80.0;
  EXPECT_TRUE(cfg.validate(reason));

  ThresholdConfig unknown = cfg;
  unknown.metrics["gpu"].value = 50.0;
  EXPECT_FALSE(unknown.validate(reason));
  EXPECT_EQ(reason, "thresholds.gpu: unknown metric");

  ThresholdConfig range = cfg;
  range.metrics["memory"].value = 120.0;
  EXPECT_FALSE(range.validate(reason));
  EXPECT_NE(reason.find("thresholds.memory"), std::string::npos);

  ThresholdConfig recovery = cfg;
  recovery.metrics["cpu"].recovery = 85.0;
  EXPECT_FALSE(recovery.validate(reason));
  EXPECT_NE(reason.find("recovery"), std::string::npos);

  ThresholdConfig critical = cfg;
  critical.metrics["cpu"].critical = 70.0;
  EXPECT_FALSE(critical.validate(reason));
  EXPECT_NE(reason.find("critical"), std::string::npos);
}
