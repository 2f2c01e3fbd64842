/**
 * @file Backoff_uTest.cpp
 * @brief Unit tests for vigil::transport::BackoffPolicy.
 */

#include "src/transport/inc/Backoff.hpp"

#include <gtest/gtest.h>

#include <set>

using std::chrono::milliseconds;
using vigil::transport::BackoffPolicy;

/** @test Nominal delay doubles from base and is capped at max. */
TEST(BackoffTest, DoublesAndCaps) {
  const BackoffPolicy P(milliseconds(1000), milliseconds(30'000), 0.0);
  EXPECT_EQ(P.nominalDelay(1), milliseconds(1000));
  EXPECT_EQ(P.nominalDelay(2), milliseconds(2000));
  EXPECT_EQ(P.nominalDelay(3), milliseconds(4000));
  EXPECT_EQ(P.nominalDelay(5), milliseconds(16'000));
  EXPECT_EQ(P.nominalDelay(6), milliseconds(30'000));
  EXPECT_EQ(P.nominalDelay(60), milliseconds(30'000));
  EXPECT_EQ(P.nominalDelay(0), milliseconds(0));
}

/** @test Without jitter, delayFor equals the nominal delay. */
TEST(BackoffTest, NoJitterDeterministic) {
  BackoffPolicy p(milliseconds(100), milliseconds(1000), 0.0);
  EXPECT_EQ(p.delayFor(1), milliseconds(100));
  EXPECT_EQ(p.delayFor(4), milliseconds(800));
}

/** @test Jittered delays stay within +/-20 % and are not all equal. */
TEST(BackoffTest, JitterBounds) {
  BackoffPolicy p(milliseconds(1000), milliseconds(30'000), 0.2, 42);
  std::set<long> seen;
  for (int i = 0; i < 200; ++i) {
    const milliseconds D = p.delayFor(2);
    EXPECT_GE(D.count(), 1600);
    EXPECT_LE(D.count(), 2400);
    seen.insert(static_cast<long>(D.count()));
  }
  EXPECT_GT(seen.size(), 10U);
}

/** @test Jitter is applied after the cap. */
TEST(BackoffTest, JitterAroundCap) {
  BackoffPolicy p(milliseconds(1000), milliseconds(5000), 0.2, 7);
  for (int i = 0; i < 100; ++i) {
    const milliseconds D = p.delayFor(20);
    EXPECT_GE(D.count(), 4000);
    EXPECT_LE(D.count(), 6000);
  }
}

/** @test A max below base is raised to base. */
TEST(BackoffTest, MaxBelowBase) {
  const BackoffPolicy P(milliseconds(500), milliseconds(100), 0.0);
  EXPECT_EQ(P.max(), milliseconds(500));
  EXPECT_EQ(P.nominalDelay(3), milliseconds(500));
}
