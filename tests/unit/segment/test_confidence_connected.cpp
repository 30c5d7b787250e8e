/**
 * @file test_confidence_connected.cpp
 * @brief Unit tests for Segment::ConfidenceConnected
 */

#include <gtest/gtest.h>
#include <VolSeg/Segment/RegionGrowing.h>
#include <VolSeg/Core/Exception.h>

#include <cmath>
#include <limits>
#include <string>

using namespace Vol::Seg;
using namespace Vol::Seg::Segment;

namespace {

/**
 * 5x5x5 volume, background 50. The 3x3x3 core around (2,2,2) holds
 * 97 / 100 / 103 on slices z = 1 / 2 / 3 (mean 100, variance 162/26).
 * Four outliers touch the core on slice z = 2: 106 and 94 fall inside
 * 100 +- 2.5 sigma, 107 and 93 just outside.
 */
VolumeGrid<float> CreateLayeredCore() {
    VolumeGrid<float> grid(5, 5, 5, 1, 50.0f);
    for (int32_t z = 1; z <= 3; ++z) {
        const float v = 97.0f + 3.0f * static_cast<float>(z - 1);
        for (int32_t y = 1; y <= 3; ++y) {
            for (int32_t x = 1; x <= 3; ++x) {
                grid.SetValue(Index3(x, y, z), v);
            }
        }
    }
    grid.SetValue(Index3(4, 2, 2), 106.0f);
    grid.SetValue(Index3(2, 0, 2), 94.0f);
    grid.SetValue(Index3(0, 2, 2), 107.0f);
    grid.SetValue(Index3(2, 4, 2), 93.0f);
    return grid;
}

const std::vector<Index3> kCenterSeed = {Index3(2, 2, 2)};

bool IsSubset(const LabelMask& a, const LabelMask& b) {
    for (size_t i = 0; i < a.VoxelCount(); ++i) {
        if (a[i] != 0 && b[i] == 0) return false;
    }
    return true;
}

} // anonymous namespace

// =============================================================================
// Iteration 0
// =============================================================================

TEST(ConfidenceConnectedTest, InitialIterationMatchesHandComputedBounds) {
    auto grid = CreateLayeredCore();
    ConfidenceConnectedParams params;
    params.numberOfIterations = 0;

    auto result = ConfidenceConnected(grid, kCenterSeed, params);
    ASSERT_TRUE(result.Ok());

    const double sigma = std::sqrt(162.0 / 26.0);
    const double lower = 100.0 - 2.5 * sigma;
    const double upper = 100.0 + 2.5 * sigma;

    EXPECT_EQ(result.sampleCount, 27);
    EXPECT_NEAR(result.mean, 100.0, 1e-9);
    EXPECT_NEAR(result.variance, 162.0 / 26.0, 1e-9);
    EXPECT_NEAR(result.lower, lower, 1e-9);
    EXPECT_NEAR(result.upper, upper, 1e-9);
    EXPECT_EQ(result.iterationsCompleted, 0);

    LabelMask expected = ConnectedThreshold(grid, kCenterSeed, lower, upper);
    EXPECT_EQ(result.mask, expected);
    EXPECT_EQ(result.mask.CountNonZero(), 29u);
    EXPECT_EQ(result.mask.ValueAt(Index3(4, 2, 2)), 1);
    EXPECT_EQ(result.mask.ValueAt(Index3(2, 0, 2)), 1);
    EXPECT_EQ(result.mask.ValueAt(Index3(0, 2, 2)), 0);
    EXPECT_EQ(result.mask.ValueAt(Index3(2, 4, 2)), 0);
}

TEST(ConfidenceConnectedTest, MultiplierGrowsRegionMonotonically) {
    auto grid = CreateLayeredCore();
    ConfidenceConnectedParams params;
    params.numberOfIterations = 0;

    params.multiplier = 1.0;
    auto narrow = ConfidenceConnected(grid, kCenterSeed, params);
    params.multiplier = 2.0;
    auto medium = ConfidenceConnected(grid, kCenterSeed, params);
    params.multiplier = 3.0;
    auto wide = ConfidenceConnected(grid, kCenterSeed, params);

    EXPECT_EQ(narrow.mask.CountNonZero(), 9u);
    EXPECT_EQ(medium.mask.CountNonZero(), 27u);
    EXPECT_EQ(wide.mask.CountNonZero(), 31u);
    EXPECT_TRUE(IsSubset(narrow.mask, medium.mask));
    EXPECT_TRUE(IsSubset(medium.mask, wide.mask));
}

TEST(ConfidenceConnectedTest, SingleSeedZeroVarianceIsExactMatch) {
    auto grid = CreateLayeredCore();
    ConfidenceConnectedParams params;
    params.numberOfIterations = 0;
    params.initialNeighborhoodRadius = 0;

    auto result = ConfidenceConnected(grid, kCenterSeed, params);
    ASSERT_TRUE(result.Ok());
    EXPECT_EQ(result.sampleCount, 1);
    EXPECT_DOUBLE_EQ(result.variance, 0.0);
    EXPECT_DOUBLE_EQ(result.lower, 100.0);
    EXPECT_DOUBLE_EQ(result.upper, 100.0);
    // Only the 100-valued slice of the core
    EXPECT_EQ(result.mask.CountNonZero(), 9u);
}

TEST(ConfidenceConnectedTest, HugeNeighborhoodRadiusSamplesWholeVolume) {
    VolumeGrid<float> grid(3, 3, 3, 1, 10.0f);
    grid.SetValue(Index3(0, 0, 0), 12.0f);
    ConfidenceConnectedParams params;
    params.numberOfIterations = 0;
    params.initialNeighborhoodRadius = std::numeric_limits<int32_t>::max();

    auto result = ConfidenceConnected(grid, {Index3(1, 1, 1)}, params);
    ASSERT_TRUE(result.Ok()) << result.message;
    EXPECT_EQ(result.sampleCount, 27);
    EXPECT_EQ(result.iterationsCompleted, 0);
    EXPECT_NEAR(result.mean, (26.0 * 10.0 + 12.0) / 27.0, 1e-9);
    // The 12 lies outside mean +- 2.5 sigma
    EXPECT_EQ(result.mask.CountNonZero(), 26u);
    EXPECT_EQ(result.mask.ValueAt(Index3(0, 0, 0)), 0);
}

TEST(ConfidenceConnectedTest, UniformPlateauRecovered) {
    VolumeGrid<int16_t> grid(7, 7, 7, 1, 101);
    for (int32_t z = 1; z <= 5; ++z)
        for (int32_t y = 1; y <= 5; ++y)
            for (int32_t x = 1; x <= 5; ++x)
                grid.SetValue(Index3(x, y, z), 100);

    auto result = ConfidenceConnected(grid, {Index3(3, 3, 3)});
    ASSERT_TRUE(result.Ok());
    EXPECT_EQ(result.iterationsCompleted, 4);
    EXPECT_DOUBLE_EQ(result.variance, 0.0);
    EXPECT_EQ(result.mask.CountNonZero(), 125u);
}

// =============================================================================
// Refinement
// =============================================================================

TEST(ConfidenceConnectedTest, RefinementUsesPreviousMask) {
    auto grid = CreateLayeredCore();
    ConfidenceConnectedParams params;
    params.numberOfIterations = 1;

    // Iteration 0 admits 29 voxels (mean 100, squared deviations 234),
    // whose wider interval then reaches 107 and 93
    auto result = ConfidenceConnected(grid, kCenterSeed, params);
    ASSERT_TRUE(result.Ok());
    EXPECT_EQ(result.iterationsCompleted, 1);
    EXPECT_EQ(result.sampleCount, 29);
    EXPECT_NEAR(result.mean, 100.0, 1e-9);
    EXPECT_NEAR(result.variance, 234.0 / 28.0, 1e-9);
    EXPECT_EQ(result.mask.CountNonZero(), 31u);
}

TEST(ConfidenceConnectedTest, FixedIterationCount) {
    auto grid = CreateLayeredCore();
    auto result = ConfidenceConnected(grid, kCenterSeed);
    ASSERT_TRUE(result.Ok());
    EXPECT_EQ(result.iterationsCompleted, 4);
    EXPECT_EQ(result.mask.CountNonZero(), 31u);
    EXPECT_TRUE(result.message.empty());
}

TEST(ConfidenceConnectedTest, ReplaceValueAndConnectivity) {
    auto grid = CreateLayeredCore();
    ConfidenceConnectedParams params;
    params.numberOfIterations = 0;
    params.replaceValue = 7;
    params.connectivity = Connectivity3d::TwentySix;

    auto result = ConfidenceConnected(grid, kCenterSeed, params);
    EXPECT_EQ(result.mask.ValueAt(Index3(2, 2, 2)), 7);
    EXPECT_EQ(result.mask.CountNonZero(), 29u);
}

// =============================================================================
// Failure Status
// =============================================================================

TEST(ConfidenceConnectedTest, RejectPolicyReportsInsufficientSamples) {
    auto grid = CreateLayeredCore();
    ConfidenceConnectedParams params;
    params.initialNeighborhoodRadius = 0;
    params.singleSamplePolicy = SingleSamplePolicy::Reject;

    auto result = ConfidenceConnected(grid, kCenterSeed, params);
    EXPECT_FALSE(result.Ok());
    EXPECT_EQ(result.status, GrowStatus::InsufficientSamples);
    EXPECT_EQ(result.mask.Dims(), grid.Dims());
    EXPECT_EQ(result.mask.CountNonZero(), 0u);
    EXPECT_NE(result.message.find("iteration 0"), std::string::npos);
    EXPECT_THROW(result.ThrowIfFailed(), InsufficientSamplesException);
}

TEST(ConfidenceConnectedTest, EmptyMaskGivesDegenerateStatistics) {
    // The outlier seed lies far outside the spread of its neighborhood,
    // so iteration 0 labels nothing and iteration 1 has no samples
    VolumeGrid<float> grid(3, 3, 3, 1, 0.0f);
    grid.SetValue(Index3(1, 1, 1), 1000.0f);

    auto result = ConfidenceConnected(grid, {Index3(1, 1, 1)});
    EXPECT_EQ(result.status, GrowStatus::DegenerateStatistics);
    EXPECT_EQ(result.iterationsCompleted, 0);
    EXPECT_EQ(result.mask.CountNonZero(), 0u);
    EXPECT_EQ(result.sampleCount, 27);
    EXPECT_NE(result.message.find("iteration 1"), std::string::npos);
    EXPECT_THROW(result.ThrowIfFailed(), DegenerateStatisticsException);
}

TEST(ConfidenceConnectedTest, SingleVoxelMaskKeptUnderReject) {
    const float data[] = {10.0f, 11.0f, 14.0f};
    auto grid = VolumeGrid<float>::FromData(data, Size3(3, 1, 1));

    ConfidenceConnectedParams params;
    params.multiplier = 0.5;
    params.numberOfIterations = 3;
    params.singleSamplePolicy = SingleSamplePolicy::Reject;

    auto result = ConfidenceConnected(grid, {Index3(1, 0, 0)}, params);
    EXPECT_EQ(result.status, GrowStatus::DegenerateStatistics);
    EXPECT_EQ(result.iterationsCompleted, 0);
    EXPECT_EQ(result.mask.CountNonZero(), 1u);
    EXPECT_EQ(result.mask.ValueAt(Index3(1, 0, 0)), 1);
}

TEST(ConfidenceConnectedTest, SuccessDoesNotThrow) {
    auto grid = CreateLayeredCore();
    auto result = ConfidenceConnected(grid, kCenterSeed);
    EXPECT_NO_THROW(result.ThrowIfFailed());
    EXPECT_STREQ(GrowStatusName(result.status), "Success");
}

// =============================================================================
// Validation
// =============================================================================

TEST(ConfidenceConnectedTest, InvalidParametersThrow) {
    auto grid = CreateLayeredCore();
    ConfidenceConnectedParams params;

    params.multiplier = 0.0;
    EXPECT_THROW(ConfidenceConnected(grid, kCenterSeed, params), InvalidArgumentException);

    params = ConfidenceConnectedParams();
    params.numberOfIterations = -1;
    EXPECT_THROW(ConfidenceConnected(grid, kCenterSeed, params), InvalidArgumentException);

    params = ConfidenceConnectedParams();
    params.initialNeighborhoodRadius = -2;
    EXPECT_THROW(ConfidenceConnected(grid, kCenterSeed, params), InvalidArgumentException);

    params = ConfidenceConnectedParams();
    params.replaceValue = 0;
    EXPECT_THROW(ConfidenceConnected(grid, kCenterSeed, params), InvalidArgumentException);
}

TEST(ConfidenceConnectedTest, NonFiniteMultiplierThrows) {
    auto grid = CreateLayeredCore();
    ConfidenceConnectedParams params;
    params.initialNeighborhoodRadius = 0;

    params.multiplier = std::numeric_limits<double>::infinity();
    EXPECT_THROW(ConfidenceConnected(grid, kCenterSeed, params), InvalidArgumentException);
    params.multiplier = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(ConfidenceConnected(grid, kCenterSeed, params), InvalidArgumentException);
}

TEST(ConfidenceConnectedTest, ZeroVarianceIgnoresLargeMultiplier) {
    auto grid = CreateLayeredCore();
    ConfidenceConnectedParams params;
    params.numberOfIterations = 0;
    params.initialNeighborhoodRadius = 0;
    params.multiplier = std::numeric_limits<double>::max();

    auto result = ConfidenceConnected(grid, kCenterSeed, params);
    ASSERT_TRUE(result.Ok()) << result.message;
    EXPECT_DOUBLE_EQ(result.lower, 100.0);
    EXPECT_DOUBLE_EQ(result.upper, 100.0);
    EXPECT_EQ(result.mask.ValueAt(Index3(2, 2, 2)), 1);
    EXPECT_EQ(result.mask.CountNonZero(), 9u);
}

TEST(ConfidenceConnectedTest, InvalidSeedThrows) {
    auto grid = CreateLayeredCore();
    EXPECT_THROW(ConfidenceConnected(grid, {Index3(5, 0, 0)}), InvalidSeedException);
    EXPECT_THROW(ConfidenceConnected(grid, {}), InvalidArgumentException);
}
