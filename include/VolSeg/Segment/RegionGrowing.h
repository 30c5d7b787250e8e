#pragma once

#include <VolSeg/Core/Export.h>

/**
 * @file RegionGrowing.h
 * @brief Seeded region growing on 3D volumes
 *
 * Provides:
 * - ConnectedThreshold: fixed intensity interval
 * - ConfidenceConnected: interval mean +- c * stddev, refined iteratively
 * - VectorConfidenceConnected: Mahalanobis distance < c, refined iteratively
 *
 * All growers flood fill from the seeds through the chosen neighborhood
 * (6-connected by default) and return a LabelMask with the volume's
 * dimensions and geometry. Each refinement iteration recomputes statistics
 * from the previous mask and re-grows from the original seeds.
 *
 * Error model:
 * - Bad arguments (seeds, bounds, parameters) throw before any growing
 * - Statistics failures during iteration are reported in the result's
 *   status together with the last good mask; ThrowIfFailed() rethrows
 *
 * @code
 * Segment::ConfidenceConnectedParams params;
 * params.multiplier = 2.0;
 * auto result = Segment::ConfidenceConnected(ct, {{120, 140, 60}}, params);
 * if (!result.Ok()) {
 *     // result.mask still holds the last good iteration
 * }
 * @endcode
 */

#include <VolSeg/Core/Types.h>
#include <VolSeg/Core/VolumeGrid.h>
#include <VolSeg/Internal/RegionStatistics.h>

#include <cstdint>
#include <string>
#include <vector>

namespace Vol::Seg::Segment {

// =============================================================================
// Enums
// =============================================================================

using Internal::SingleSamplePolicy;

/**
 * @brief Outcome of an iterative grower
 */
enum class GrowStatus {
    Success,                ///< All iterations completed
    InsufficientSamples,    ///< Seed neighborhood too small at iteration 0, mask empty
    SingularCovariance,     ///< Covariance not invertible, mask from last good iteration
    DegenerateStatistics    ///< Previous mask unusable for statistics, mask from it kept
};

/// Status name for logs and messages
VOLSEG_API const char* GrowStatusName(GrowStatus status);

// =============================================================================
// Parameters
// =============================================================================

/**
 * @brief Parameters for ConnectedThreshold
 */
struct VOLSEG_API ConnectedThresholdParams {
    double lower = 0.0;                 ///< Inclusive lower bound
    double upper = 0.0;                 ///< Inclusive upper bound
    uint8_t replaceValue = 1;           ///< Label written for region voxels
    Connectivity3d connectivity = Connectivity3d::Six;
};

/**
 * @brief Parameters for ConfidenceConnected
 */
struct VOLSEG_API ConfidenceConnectedParams {
    double multiplier = 2.5;            ///< c in mean +- c * stddev, finite and > 0
    int32_t numberOfIterations = 4;     ///< Refinement passes after iteration 0
    int32_t initialNeighborhoodRadius = 1;  ///< Chebyshev radius around seeds
    uint8_t replaceValue = 1;
    Connectivity3d connectivity = Connectivity3d::Six;
    SingleSamplePolicy singleSamplePolicy = SingleSamplePolicy::ZeroVariance;
};

/**
 * @brief Parameters for VectorConfidenceConnected
 *
 * Iteration 0 always uses the seed voxels alone (radius 0).
 */
struct VOLSEG_API VectorConfidenceConnectedParams {
    double multiplier = 2.5;            ///< Mahalanobis distance limit, finite and > 0
    int32_t numberOfIterations = 4;
    uint8_t replaceValue = 1;
    Connectivity3d connectivity = Connectivity3d::Six;
    SingleSamplePolicy singleSamplePolicy = SingleSamplePolicy::ZeroVariance;
};

// =============================================================================
// Results
// =============================================================================

/**
 * @brief Result of ConfidenceConnected
 *
 * mean/variance/lower/upper are the statistics and bounds that produced mask.
 */
struct VOLSEG_API ConfidenceConnectedResult {
    LabelMask mask;
    GrowStatus status = GrowStatus::Success;
    std::string message;                ///< Failure description, empty on success
    int32_t iterationsCompleted = 0;    ///< Refinement iterations that produced a mask
    int64_t sampleCount = 0;
    double mean = 0.0;
    double variance = 0.0;
    double lower = 0.0;
    double upper = 0.0;

    bool Ok() const { return status == GrowStatus::Success; }

    /// Throw the exception matching a failed status
    void ThrowIfFailed() const;
};

/**
 * @brief Result of VectorConfidenceConnected
 *
 * mean/covariance are the statistics that produced mask, covariance is
 * row-major Components() x Components().
 */
struct VOLSEG_API VectorConfidenceConnectedResult {
    LabelMask mask;
    GrowStatus status = GrowStatus::Success;
    std::string message;
    int32_t iterationsCompleted = 0;
    int64_t sampleCount = 0;
    std::vector<double> mean;
    std::vector<double> covariance;

    bool Ok() const { return status == GrowStatus::Success; }

    /// Throw the exception matching a failed status
    void ThrowIfFailed() const;
};

// =============================================================================
// Connected Threshold
// =============================================================================

/**
 * @brief Grow region of voxels with lower <= value <= upper
 *
 * Seeds outside the interval are not labeled and do not expand. The result
 * is the maximal connected set of in-interval voxels containing the
 * in-interval seeds.
 *
 * @param grid Scalar volume
 * @param seeds Non-empty seed list, every seed inside grid
 * @param params Bounds, label and connectivity
 * @throws InvalidArgumentException if grid is empty or vector-valued, or seeds empty
 * @throws InvalidSeedException if a seed lies outside the grid
 * @throws InvalidBoundsException if lower > upper
 */
template<typename T>
LabelMask ConnectedThreshold(const VolumeGrid<T>& grid,
                             const std::vector<Index3>& seeds,
                             const ConnectedThresholdParams& params);

/// Convenience overload with 6-connectivity
template<typename T>
LabelMask ConnectedThreshold(const VolumeGrid<T>& grid,
                             const std::vector<Index3>& seeds,
                             double lower, double upper,
                             uint8_t replaceValue = 1);

// =============================================================================
// Confidence Connected
// =============================================================================

/**
 * @brief Grow region with interval [mean - c*stddev, mean + c*stddev]
 *
 * Iteration 0 takes statistics from the Chebyshev neighborhood of the
 * seeds; each of the numberOfIterations refinements takes them from the
 * previous mask.
 *
 * @throws InvalidArgumentException on bad grid, seeds or parameters
 * @throws InvalidSeedException if a seed lies outside the grid
 */
template<typename T>
ConfidenceConnectedResult ConfidenceConnected(const VolumeGrid<T>& grid,
                                              const std::vector<Index3>& seeds,
                                              const ConfidenceConnectedParams& params = {});

// =============================================================================
// Vector Confidence Connected
// =============================================================================

/**
 * @brief Grow region of voxels within Mahalanobis distance c of the region
 *
 * A voxel x is admitted iff sqrt((x - mean)^T cov^-1 (x - mean)) < c.
 *
 * @param grid Volume with one or more components per voxel
 * @throws InvalidArgumentException on bad grid, seeds or parameters
 * @throws InvalidSeedException if a seed lies outside the grid
 */
template<typename T>
VectorConfidenceConnectedResult VectorConfidenceConnected(
    const VolumeGrid<T>& grid,
    const std::vector<Index3>& seeds,
    const VectorConfidenceConnectedParams& params = {});

} // namespace Vol::Seg::Segment
