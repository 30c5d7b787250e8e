#pragma once

/**
 * @file RegionStatistics.h
 * @brief Mean / variance / covariance over a voxel set
 *
 * This module provides:
 * - Sample collection: seed neighborhoods (Chebyshev cubes) and mask voxels
 * - Scalar statistics: count, mean, unbiased variance
 * - Vector statistics: count, mean vector, unbiased covariance, its
 *   Cholesky factor and inverse, Mahalanobis distance
 *
 * Statistics are recomputed from scratch for each voxel set; there is no
 * running update. A single sample has undefined variance, which
 * SingleSamplePolicy turns into either zero spread or an error.
 */

#include <VolSeg/Core/Types.h>
#include <VolSeg/Core/VolumeGrid.h>
#include <VolSeg/Internal/Matrix.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

namespace Vol::Seg::Internal {

// =============================================================================
// Types
// =============================================================================

/**
 * @brief What to do when a voxel set holds exactly one sample
 */
enum class SingleSamplePolicy {
    ZeroVariance,   ///< Variance 0 / zero covariance, similarity becomes exact match
    Reject          ///< Throw InsufficientSamplesException
};

// =============================================================================
// Sample Collection
// =============================================================================

/**
 * @brief Linear indices of the union of Chebyshev cubes around seeds
 *
 * Cubes are clipped to the volume and each voxel appears once, in order of
 * first visit (seed order, then z, y, x inside each cube).
 *
 * @param dims Volume dimensions
 * @param seeds Seed coordinates (must lie inside dims)
 * @param radius Chebyshev radius, 0 = seed voxels only
 */
std::vector<size_t> CollectSeedNeighborhood(const Size3& dims,
                                            const std::vector<Index3>& seeds,
                                            int32_t radius);

/**
 * @brief Linear indices of all non-zero mask voxels in memory order
 */
std::vector<size_t> CollectMaskVoxels(const LabelMask& mask);

// =============================================================================
// Scalar Statistics
// =============================================================================

struct ScalarStatistics {
    int64_t count = 0;      ///< Number of samples
    double mean = 0.0;      ///< Sample mean
    double variance = 0.0;  ///< Unbiased sample variance (n - 1)

    double StdDev() const;

    /**
     * @brief Statistics over given voxels of a scalar volume
     *
     * @throws InsufficientSamplesException if samples is empty, or holds one
     *         voxel under SingleSamplePolicy::Reject
     */
    template<typename T>
    static ScalarStatistics FromSamples(const VolumeGrid<T>& grid,
                                        const std::vector<size_t>& samples,
                                        SingleSamplePolicy policy);

    /**
     * @brief Statistics over the Chebyshev neighborhood of the seeds
     */
    template<typename T>
    static ScalarStatistics FromSeedNeighborhood(const VolumeGrid<T>& grid,
                                                 const std::vector<Index3>& seeds,
                                                 int32_t radius,
                                                 SingleSamplePolicy policy);

    /**
     * @brief Statistics over the voxels set in mask
     *
     * @throws DimensionMismatchException if mask and grid differ in size
     */
    template<typename T>
    static ScalarStatistics FromMaskVoxels(const VolumeGrid<T>& grid,
                                           const LabelMask& mask,
                                           SingleSamplePolicy policy);
};

// =============================================================================
// Vector Statistics
// =============================================================================

struct VectorStatistics {
    int64_t count = 0;          ///< Number of samples
    VecX mean;                  ///< Mean vector
    MatX covariance;            ///< Unbiased covariance (n - 1)
    MatX inverseCovariance;     ///< Empty when degenerate
    CholeskyResult cholesky;    ///< covariance = L * L^T, invalid when degenerate
    bool degenerate = false;    ///< Single sample under ZeroVariance policy

    int Dimension() const { return mean.Size(); }

    /**
     * @brief sqrt((x - mean)^T covariance^-1 (x - mean))
     *
     * Degenerate statistics return 0 for an exact match of the mean and
     * +infinity for anything else.
     */
    double MahalanobisDistance(const VecX& x) const;

    /// Mahalanobis distance of a voxel's Dimension() components
    template<typename T>
    double MahalanobisDistance(const T* voxel) const {
        VecX scratch(Dimension());
        return MahalanobisDistance(voxel, scratch);
    }

    /**
     * @brief Mahalanobis distance of a voxel without allocating
     *
     * Forward substitution against the Cholesky factor runs in place in
     * scratch, which must hold Dimension() entries. Flood fill calls this
     * once per candidate voxel with one buffer for the whole fill.
     */
    template<typename T>
    double MahalanobisDistance(const T* voxel, VecX& scratch) const {
        const int n = Dimension();
        for (int i = 0; i < n; ++i) {
            scratch[i] = static_cast<double>(voxel[i]) - mean[i];
        }

        if (degenerate) {
            for (int i = 0; i < n; ++i) {
                if (scratch[i] != 0.0) return std::numeric_limits<double>::infinity();
            }
            return 0.0;
        }

        // y = L^-1 (x - mean), y[i] overwrites diff[i] once rows < i are done
        const MatX& L = cholesky.L;
        double sumSq = 0.0;
        for (int i = 0; i < n; ++i) {
            double sum = scratch[i];
            for (int k = 0; k < i; ++k) {
                sum -= L(i, k) * scratch[k];
            }
            scratch[i] = sum / L(i, i);
            sumSq += scratch[i] * scratch[i];
        }
        return std::sqrt(sumSq);
    }

    /**
     * @brief Statistics over given voxels of a (vector) volume
     *
     * @throws InsufficientSamplesException if samples is empty, or holds one
     *         voxel under SingleSamplePolicy::Reject
     * @throws SingularCovarianceException if the covariance of two or more
     *         samples is not positive definite
     */
    template<typename T>
    static VectorStatistics FromSamples(const VolumeGrid<T>& grid,
                                        const std::vector<size_t>& samples,
                                        SingleSamplePolicy policy);

    template<typename T>
    static VectorStatistics FromSeedNeighborhood(const VolumeGrid<T>& grid,
                                                 const std::vector<Index3>& seeds,
                                                 int32_t radius,
                                                 SingleSamplePolicy policy);

    template<typename T>
    static VectorStatistics FromMaskVoxels(const VolumeGrid<T>& grid,
                                           const LabelMask& mask,
                                           SingleSamplePolicy policy);
};

} // namespace Vol::Seg::Internal
