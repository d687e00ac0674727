/**
 * @file test_congestion.cpp
 * @brief Tests for RED / WRED drop probabilities and per-queue dispatch.
 */

#include <gtest/gtest.h>

#include "qosctl/queueing/congestion.hpp"

using namespace qosctl::queueing;
using qosctl::domain::CongestionAlgorithm;
using qosctl::domain::CongestionParameters;

/**
 * @test Red_Boundaries
 * @brief 0 at or below min, 1 at or above max, linear in between.
 */
TEST(Red, Red_Boundaries) {
  EXPECT_DOUBLE_EQ(red_drop_probability(0, 20, 80, 0.1), 0.0);
  EXPECT_DOUBLE_EQ(red_drop_probability(20, 20, 80, 0.1), 0.0);
  EXPECT_DOUBLE_EQ(red_drop_probability(80, 20, 80, 0.1), 1.0);
  EXPECT_DOUBLE_EQ(red_drop_probability(500, 20, 80, 0.1), 1.0);
  EXPECT_NEAR(red_drop_probability(50, 20, 80, 0.1), 0.05, 1e-12);
}

/**
 * @test Red_Monotonic
 * @brief Strictly between the thresholds the probability never decreases.
 */
TEST(Red, Red_Monotonic) {
  double prev = 0.0;
  for (int occ = 21; occ < 80; ++occ) {
    const double p = red_drop_probability(occ, 20, 80, 0.3);
    EXPECT_GT(p, 0.0);
    EXPECT_LT(p, 1.0);
    EXPECT_GE(p, prev);
    prev = p;
  }
}

/**
 * @test Wred_Bounded_By_Red
 * @brief Weight 0 equals RED; larger weights only lower the probability.
 */
TEST(Wred, Wred_Bounded_By_Red) {
  for (double w : {0.0, 0.25, 0.5, 0.75, 1.0}) {
    for (double occ : {10.0, 30.0, 55.0, 79.0, 90.0}) {
      EXPECT_LE(wred_drop_probability(occ, 20, 80, 0.1, w), red_drop_probability(occ, 20, 80, 0.1));
    }
  }
  EXPECT_DOUBLE_EQ(wred_drop_probability(50, 20, 80, 0.1, 0.0), red_drop_probability(50, 20, 80, 0.1));
  EXPECT_DOUBLE_EQ(wred_drop_probability(50, 20, 80, 0.1, 1.0), 0.0);
  EXPECT_NEAR(wred_drop_probability(50, 20, 80, 0.1, 0.5), 0.025, 1e-12);
}

/**
 * @test Dispatch_By_Algorithm
 * @brief drop_probability() follows the configured congestion kind.
 */
TEST(Dispatch, Dispatch_By_Algorithm) {
  CongestionParameters tail;
  EXPECT_DOUBLE_EQ(drop_probability(tail, 1e6), 0.0);  // no thresholds: never early-drop
  tail.max_threshold = 10;
  EXPECT_DOUBLE_EQ(drop_probability(tail, 9), 0.0);
  EXPECT_DOUBLE_EQ(drop_probability(tail, 10), 1.0);

  CongestionParameters red{CongestionAlgorithm::Red, 20, 80, 0.1, {}};
  EXPECT_NEAR(drop_probability(red, 50), 0.05, 1e-12);

  CongestionParameters wred{CongestionAlgorithm::Wred, 20, 80, 0.1, {{"AF41", 0.5}}};
  EXPECT_NEAR(drop_probability(wred, 50, "AF41"), 0.025, 1e-12);
  EXPECT_NEAR(drop_probability(wred, 50, "BE"), 0.05, 1e-12);

  CongestionParameters ecn{CongestionAlgorithm::Ecn, 2000, 100000, 0.0, {}};
  EXPECT_DOUBLE_EQ(drop_probability(ecn, 1e9), 0.0);
}
