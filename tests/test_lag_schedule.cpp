#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "xpcs/core/Errors.hpp"
#include "xpcs/correlate/LagSchedule.hpp"

using namespace xpcs;

TEST(LagSchedule, SingleLevelIsPlainLags) {
  const MultiTauLags lags = multi_tau_lags(1, 4);
  EXPECT_EQ(lags.total_channels, 4u);
  EXPECT_EQ(lags.lag_steps, (std::vector<std::uint64_t>{0, 1, 2, 3}));
}

TEST(LagSchedule, HigherLevelsDoubleTheSpacing) {
  const MultiTauLags lags = multi_tau_lags(3, 8);
  EXPECT_EQ(lags.total_channels, 16u);
  EXPECT_EQ(lags.lag_steps, (std::vector<std::uint64_t>{0, 1, 2, 3, 4, 5, 6, 7,
                                                         8, 10, 12, 14,
                                                         16, 20, 24, 28}));
}

TEST(LagSchedule, LagsAreStrictlyIncreasing) {
  const MultiTauLags lags = multi_tau_lags(10, 6);
  ASSERT_EQ(lags.lag_steps.size(), 6u + 9u * 3u);
  for (std::size_t k = 1; k < lags.lag_steps.size(); ++k) {
    EXPECT_LT(lags.lag_steps[k - 1], lags.lag_steps[k]);
  }
  EXPECT_EQ(lags.lag_steps.back(), 5u << 9);
}

TEST(LagSchedule, RejectsBadGeometry) {
  EXPECT_THROW(multi_tau_lags(0, 8), InvalidConfig);
  EXPECT_THROW(multi_tau_lags(3, 7), InvalidConfig);
  EXPECT_THROW(multi_tau_lags(3, 0), InvalidConfig);
  EXPECT_NO_THROW(validate_multi_tau(1, 2));
}
