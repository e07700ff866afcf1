// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
#include "Domain/SamplingConfig.h"

#include <gtest/gtest.h>

namespace Domain::Sampling
{
namespace
{

TEST(SamplingConfigTest, DefaultsAreWithinBounds)
{
    static_assert(REFRESH_INTERVAL_DEFAULT_MS >= REFRESH_INTERVAL_MIN_MS);
    static_assert(REFRESH_INTERVAL_DEFAULT_MS <= REFRESH_INTERVAL_MAX_MS);
    static_assert(HISTORY_SECONDS_DEFAULT >= HISTORY_SECONDS_MIN);
    static_assert(HISTORY_SECONDS_DEFAULT <= HISTORY_SECONDS_MAX);
    static_assert(ZOOM_FACTOR_DEFAULT >= ZOOM_FACTOR_MIN);
    static_assert(ZOOM_FACTOR_DEFAULT <= ZOOM_FACTOR_MAX);
    SUCCEED();
}

TEST(SamplingConfigTest, ClampRefreshInterval)
{
    EXPECT_EQ(clampRefreshInterval(0), REFRESH_INTERVAL_MIN_MS);
    EXPECT_EQ(clampRefreshInterval(250), 250);
    EXPECT_EQ(clampRefreshInterval(60000), REFRESH_INTERVAL_MAX_MS);
}

TEST(SamplingConfigTest, ClampHistorySeconds)
{
    EXPECT_EQ(clampHistorySeconds(-5), HISTORY_SECONDS_MIN);
    EXPECT_EQ(clampHistorySeconds(120), 120);
    EXPECT_EQ(clampHistorySeconds(99999), HISTORY_SECONDS_MAX);
}

TEST(SamplingConfigTest, ClampZoomFactor)
{
    EXPECT_EQ(clampZoomFactor(0), ZOOM_FACTOR_MIN);
    EXPECT_EQ(clampZoomFactor(8), 8);
    EXPECT_EQ(clampZoomFactor(1000), ZOOM_FACTOR_MAX);
}

TEST(SamplingConfigTest, HistoryCapacityCoversWindow)
{
    EXPECT_EQ(historyCapacity(300, 1000), 300);
    EXPECT_EQ(historyCapacity(10, 250), 40);
    // Partial intervals round up
    EXPECT_EQ(historyCapacity(10, 3000), 4);
}

TEST(SamplingConfigTest, HistoryCapacityClampsInputs)
{
    EXPECT_EQ(historyCapacity(0, 1000), historyCapacity(HISTORY_SECONDS_MIN, 1000));
    EXPECT_EQ(historyCapacity(300, 1), historyCapacity(300, REFRESH_INTERVAL_MIN_MS));
}

} // namespace
} // namespace Domain::Sampling
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
