/**
 * @file test_vector_confidence_connected.cpp
 * @brief Unit tests for Segment::VectorConfidenceConnected
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

void SetPair(VolumeGrid<float>& grid, int32_t x, float a, float b) {
    grid.SetValue(Index3(x, 0, 0), a, 0);
    grid.SetValue(Index3(x, 0, 0), b, 1);
}

/**
 * Row of six two-channel voxels. Seeds x = 1..4 sit on the corners of a
 * rectangle around (10, 20), giving a diagonal covariance diag(4/3, 16/3).
 * x = 5 holds (12, 20), x = 0 holds (10, 26).
 */
VolumeGrid<float> CreateDiagonalRow() {
    VolumeGrid<float> grid(Size3(6, 1, 1), 2);
    SetPair(grid, 0, 10.0f, 26.0f);
    SetPair(grid, 1, 9.0f, 18.0f);
    SetPair(grid, 2, 11.0f, 18.0f);
    SetPair(grid, 3, 9.0f, 22.0f);
    SetPair(grid, 4, 11.0f, 22.0f);
    SetPair(grid, 5, 12.0f, 20.0f);
    return grid;
}

const std::vector<Index3> kRectSeeds = {
    Index3(1, 0, 0), Index3(2, 0, 0), Index3(3, 0, 0), Index3(4, 0, 0)};

double DiagonalMahalanobis(double dx, double dy, double varX, double varY) {
    return std::sqrt(dx * dx / varX + dy * dy / varY);
}

} // anonymous namespace

// =============================================================================
// Admission
// =============================================================================

TEST(VectorConfidenceConnectedTest, DiagonalCovarianceAdmission) {
    auto grid = CreateDiagonalRow();
    VectorConfidenceConnectedParams params;
    params.numberOfIterations = 0;

    const double varX = 4.0 / 3.0;
    const double varY = 16.0 / 3.0;
    ASSERT_LT(DiagonalMahalanobis(2.0, 0.0, varX, varY), 2.5);   // x = 5
    ASSERT_GT(DiagonalMahalanobis(0.0, 6.0, varX, varY), 2.5);   // x = 0

    auto result = VectorConfidenceConnected(grid, kRectSeeds, params);
    ASSERT_TRUE(result.Ok());
    EXPECT_EQ(result.sampleCount, 4);

    ASSERT_EQ(result.mean.size(), 2u);
    EXPECT_NEAR(result.mean[0], 10.0, 1e-9);
    EXPECT_NEAR(result.mean[1], 20.0, 1e-9);

    ASSERT_EQ(result.covariance.size(), 4u);
    EXPECT_NEAR(result.covariance[0], varX, 1e-9);
    EXPECT_NEAR(result.covariance[1], 0.0, 1e-9);
    EXPECT_NEAR(result.covariance[2], 0.0, 1e-9);
    EXPECT_NEAR(result.covariance[3], varY, 1e-9);

    EXPECT_EQ(result.mask.ValueAt(Index3(0, 0, 0)), 0);
    for (int32_t x = 1; x <= 5; ++x) {
        EXPECT_EQ(result.mask.ValueAt(Index3(x, 0, 0)), 1) << "x=" << x;
    }
}

TEST(VectorConfidenceConnectedTest, AdmissionIsStrict) {
    auto grid = CreateDiagonalRow();
    VectorConfidenceConnectedParams params;
    params.numberOfIterations = 0;

    // x = 5 lies at distance sqrt(3) = 1.73205...
    params.multiplier = 1.7320;
    auto below = VectorConfidenceConnected(grid, kRectSeeds, params);
    EXPECT_EQ(below.mask.ValueAt(Index3(5, 0, 0)), 0);
    EXPECT_EQ(below.mask.CountNonZero(), 4u);

    params.multiplier = 1.7321;
    auto above = VectorConfidenceConnected(grid, kRectSeeds, params);
    EXPECT_EQ(above.mask.ValueAt(Index3(5, 0, 0)), 1);
    EXPECT_EQ(above.mask.CountNonZero(), 5u);
}

TEST(VectorConfidenceConnectedTest, SingleSeedZeroVarianceIsExactMatch) {
    VolumeGrid<float> grid(Size3(4, 1, 1), 2);
    SetPair(grid, 0, 5.0f, 5.0f);
    SetPair(grid, 1, 5.0f, 5.0f);
    SetPair(grid, 2, 6.0f, 5.0f);
    SetPair(grid, 3, 5.0f, 5.0f);

    VectorConfidenceConnectedParams params;
    params.numberOfIterations = 0;

    auto result = VectorConfidenceConnected(grid, {Index3(0, 0, 0)}, params);
    ASSERT_TRUE(result.Ok());
    EXPECT_EQ(result.sampleCount, 1);
    for (double c : result.covariance) {
        EXPECT_DOUBLE_EQ(c, 0.0);
    }
    // x = 3 matches exactly but is cut off by x = 2
    EXPECT_EQ(result.mask.CountNonZero(), 2u);
    EXPECT_EQ(result.mask.ValueAt(Index3(3, 0, 0)), 0);
}

TEST(VectorConfidenceConnectedTest, ScalarVolumeAccepted) {
    VolumeGrid<uint8_t> grid(5, 5, 5, 1, 200);
    for (int32_t z = 1; z <= 3; ++z)
        for (int32_t y = 1; y <= 3; ++y)
            for (int32_t x = 1; x <= 3; ++x)
                grid.SetValue(Index3(x, y, z), static_cast<uint8_t>(10 + (x + y + z) % 3));

    auto result = VectorConfidenceConnected(grid, {Index3(1, 1, 1), Index3(2, 1, 1), Index3(3, 1, 1)});
    ASSERT_TRUE(result.Ok());
    EXPECT_EQ(result.mean.size(), 1u);
    EXPECT_EQ(result.mask.CountNonZero(), 27u);
}

// =============================================================================
// Failure Status
// =============================================================================

TEST(VectorConfidenceConnectedTest, SingularAtFirstIterationGivesEmptyMask) {
    VolumeGrid<float> grid(Size3(3, 1, 1), 2);
    SetPair(grid, 0, 1.0f, 2.0f);
    SetPair(grid, 1, 3.0f, 4.0f);
    SetPair(grid, 2, 2.0f, 3.0f);

    auto result = VectorConfidenceConnected(grid, {Index3(0, 0, 0), Index3(1, 0, 0)});
    EXPECT_EQ(result.status, GrowStatus::SingularCovariance);
    EXPECT_EQ(result.mask.Dims(), grid.Dims());
    EXPECT_EQ(result.mask.CountNonZero(), 0u);
    EXPECT_NE(result.message.find("iteration 0"), std::string::npos);
    EXPECT_THROW(result.ThrowIfFailed(), SingularCovarianceException);
}

TEST(VectorConfidenceConnectedTest, SingularLaterKeepsPreviousMask) {
    // Seeds 10, 10, 13: mean 11, variance 3. With c = 1 only the two 10s are
    // admitted, and their covariance on the next iteration is zero.
    const int16_t data[] = {100, 10, 10, 13, 100};
    auto grid = VolumeGrid<int16_t>::FromData(data, Size3(5, 1, 1));

    VectorConfidenceConnectedParams params;
    params.multiplier = 1.0;
    params.numberOfIterations = 2;

    auto result = VectorConfidenceConnected(
        grid, {Index3(1, 0, 0), Index3(2, 0, 0), Index3(3, 0, 0)}, params);
    EXPECT_EQ(result.status, GrowStatus::SingularCovariance);
    EXPECT_EQ(result.iterationsCompleted, 0);
    EXPECT_EQ(result.sampleCount, 3);
    ASSERT_EQ(result.mean.size(), 1u);
    EXPECT_NEAR(result.mean[0], 11.0, 1e-9);
    EXPECT_EQ(result.mask.CountNonZero(), 2u);
    EXPECT_EQ(result.mask.ValueAt(Index3(3, 0, 0)), 0);
    EXPECT_NE(result.message.find("iteration 1"), std::string::npos);
}

TEST(VectorConfidenceConnectedTest, RepeatedSampleMaskIsSingular) {
    VolumeGrid<float> grid(Size3(3, 1, 1), 2);
    SetPair(grid, 0, 5.0f, 5.0f);
    SetPair(grid, 1, 5.0f, 5.0f);
    SetPair(grid, 2, 9.0f, 1.0f);

    VectorConfidenceConnectedParams params;
    params.numberOfIterations = 1;

    auto result = VectorConfidenceConnected(grid, {Index3(0, 0, 0)}, params);
    EXPECT_EQ(result.status, GrowStatus::SingularCovariance);
    EXPECT_EQ(result.mask.CountNonZero(), 2u);
}

TEST(VectorConfidenceConnectedTest, RejectPolicyReportsInsufficientSamples) {
    auto grid = CreateDiagonalRow();
    VectorConfidenceConnectedParams params;
    params.singleSamplePolicy = SingleSamplePolicy::Reject;

    auto result = VectorConfidenceConnected(grid, {Index3(1, 0, 0)}, params);
    EXPECT_EQ(result.status, GrowStatus::InsufficientSamples);
    EXPECT_EQ(result.mask.CountNonZero(), 0u);
    EXPECT_THROW(result.ThrowIfFailed(), InsufficientSamplesException);
}

TEST(VectorConfidenceConnectedTest, EmptyMaskGivesDegenerateStatistics) {
    // Three affinely independent samples all lie at distance sqrt(4/3)
    VolumeGrid<float> grid(Size3(3, 1, 1), 2);
    SetPair(grid, 0, 0.0f, 0.0f);
    SetPair(grid, 1, 2.0f, 0.0f);
    SetPair(grid, 2, 0.0f, 2.0f);

    VectorConfidenceConnectedParams params;
    params.multiplier = 1.0;

    auto result = VectorConfidenceConnected(
        grid, {Index3(0, 0, 0), Index3(1, 0, 0), Index3(2, 0, 0)}, params);
    EXPECT_EQ(result.status, GrowStatus::DegenerateStatistics);
    EXPECT_EQ(result.iterationsCompleted, 0);
    EXPECT_EQ(result.mask.CountNonZero(), 0u);
    EXPECT_THROW(result.ThrowIfFailed(), DegenerateStatisticsException);
}

// =============================================================================
// Validation
// =============================================================================

TEST(VectorConfidenceConnectedTest, InvalidParametersThrow) {
    auto grid = CreateDiagonalRow();
    VectorConfidenceConnectedParams params;

    params.multiplier = -1.0;
    EXPECT_THROW(VectorConfidenceConnected(grid, kRectSeeds, params), InvalidArgumentException);

    params.multiplier = std::numeric_limits<double>::infinity();
    EXPECT_THROW(VectorConfidenceConnected(grid, kRectSeeds, params), InvalidArgumentException);

    params = VectorConfidenceConnectedParams();
    params.numberOfIterations = -3;
    EXPECT_THROW(VectorConfidenceConnected(grid, kRectSeeds, params), InvalidArgumentException);

    EXPECT_THROW(VectorConfidenceConnected(grid, {Index3(6, 0, 0)}), InvalidSeedException);
    EXPECT_THROW(VectorConfidenceConnected(grid, {}), InvalidArgumentException);
}
