/**
 * @file RegionStatistics.cpp
 * @brief Scalar and vector region statistics
 */

#include <VolSeg/Internal/RegionStatistics.h>
#include <VolSeg/Internal/Solver.h>
#include <VolSeg/Core/Exception.h>
#include <VolSeg/Core/Validate.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace Vol::Seg::Internal {

namespace {

void RequireSampleCount(size_t count, SingleSamplePolicy policy, const char* funcName) {
    if (count == 0) {
        throw InsufficientSamplesException(std::string(funcName) + ": no voxels in region");
    }
    if (count == 1 && policy == SingleSamplePolicy::Reject) {
        throw InsufficientSamplesException(
            std::string(funcName) + ": variance undefined for a single voxel");
    }
}

} // anonymous namespace

// =============================================================================
// Sample Collection
// =============================================================================

std::vector<size_t> CollectSeedNeighborhood(const Size3& dims,
                                            const std::vector<Index3>& seeds,
                                            int32_t radius) {
    Validate::RequireNonNegative(radius, "radius", "CollectSeedNeighborhood");
    Validate::RequireSeeds(seeds, dims, "CollectSeedNeighborhood");

    const size_t nx = static_cast<size_t>(dims.x);
    const size_t ny = static_cast<size_t>(dims.y);

    std::vector<uint8_t> taken(dims.Volume(), 0);
    std::vector<size_t> samples;

    // Bounds in 64-bit, seed +- radius may leave the int32_t range
    const int64_t r = radius;
    auto lowerBound = [r](int32_t c) {
        return static_cast<int32_t>(std::max<int64_t>(c - r, 0));
    };
    auto upperBound = [r](int32_t c, int32_t n) {
        return static_cast<int32_t>(std::min<int64_t>(c + r, n - 1));
    };

    for (const auto& seed : seeds) {
        const int32_t z0 = lowerBound(seed.z);
        const int32_t z1 = upperBound(seed.z, dims.z);
        const int32_t y0 = lowerBound(seed.y);
        const int32_t y1 = upperBound(seed.y, dims.y);
        const int32_t x0 = lowerBound(seed.x);
        const int32_t x1 = upperBound(seed.x, dims.x);

        for (int32_t z = z0; z <= z1; ++z) {
            for (int32_t y = y0; y <= y1; ++y) {
                size_t rowBase = (static_cast<size_t>(z) * ny + static_cast<size_t>(y)) * nx;
                for (int32_t x = x0; x <= x1; ++x) {
                    size_t idx = rowBase + static_cast<size_t>(x);
                    if (!taken[idx]) {
                        taken[idx] = 1;
                        samples.push_back(idx);
                    }
                }
            }
        }
    }
    return samples;
}

std::vector<size_t> CollectMaskVoxels(const LabelMask& mask) {
    std::vector<size_t> samples;
    const size_t n = mask.VoxelCount();
    const uint8_t* data = mask.Data();
    for (size_t i = 0; i < n; ++i) {
        if (data[i] != 0) samples.push_back(i);
    }
    return samples;
}

// =============================================================================
// Scalar Statistics
// =============================================================================

double ScalarStatistics::StdDev() const {
    return variance > 0.0 ? std::sqrt(variance) : 0.0;
}

template<typename T>
ScalarStatistics ScalarStatistics::FromSamples(const VolumeGrid<T>& grid,
                                               const std::vector<size_t>& samples,
                                               SingleSamplePolicy policy) {
    Validate::RequireScalarVolume(grid, "ScalarStatistics");
    RequireSampleCount(samples.size(), policy, "ScalarStatistics");

    const T* data = grid.Data();
    ScalarStatistics stats;
    stats.count = static_cast<int64_t>(samples.size());

    // Two-pass: mean, then centered sum of squares
    double sum = 0.0;
    for (size_t idx : samples) {
        sum += static_cast<double>(data[idx]);
    }
    stats.mean = sum / static_cast<double>(stats.count);

    if (stats.count > 1) {
        double sumSq = 0.0;
        for (size_t idx : samples) {
            double d = static_cast<double>(data[idx]) - stats.mean;
            sumSq += d * d;
        }
        stats.variance = sumSq / static_cast<double>(stats.count - 1);
    }
    return stats;
}

template<typename T>
ScalarStatistics ScalarStatistics::FromSeedNeighborhood(const VolumeGrid<T>& grid,
                                                        const std::vector<Index3>& seeds,
                                                        int32_t radius,
                                                        SingleSamplePolicy policy) {
    Validate::RequireScalarVolume(grid, "ScalarStatistics::FromSeedNeighborhood");
    return FromSamples(grid, CollectSeedNeighborhood(grid.Dims(), seeds, radius), policy);
}

template<typename T>
ScalarStatistics ScalarStatistics::FromMaskVoxels(const VolumeGrid<T>& grid,
                                                  const LabelMask& mask,
                                                  SingleSamplePolicy policy) {
    Validate::RequireScalarVolume(grid, "ScalarStatistics::FromMaskVoxels");
    Validate::RequireSameDims(grid, mask, "ScalarStatistics::FromMaskVoxels");
    return FromSamples(grid, CollectMaskVoxels(mask), policy);
}

// =============================================================================
// Vector Statistics
// =============================================================================

double VectorStatistics::MahalanobisDistance(const VecX& x) const {
    if (x.Size() != Dimension()) {
        throw DimensionMismatchException(
            "VectorStatistics::MahalanobisDistance: sample has " +
            std::to_string(x.Size()) + " components, statistics have " +
            std::to_string(Dimension()));
    }

    VecX diff = x - mean;

    if (degenerate) {
        for (int i = 0; i < diff.Size(); ++i) {
            if (diff[i] != 0.0) return std::numeric_limits<double>::infinity();
        }
        return 0.0;
    }

    // d^2 = |L^-1 (x - mean)|^2 with covariance = L L^T
    VecX y = SolveLowerTriangular(cholesky.L, diff);
    return y.Norm();
}

template<typename T>
VectorStatistics VectorStatistics::FromSamples(const VolumeGrid<T>& grid,
                                               const std::vector<size_t>& samples,
                                               SingleSamplePolicy policy) {
    Validate::RequireVolumeNonEmpty(grid, "VectorStatistics");
    RequireSampleCount(samples.size(), policy, "VectorStatistics");

    const int dim = grid.Components();
    VectorStatistics stats;
    stats.count = static_cast<int64_t>(samples.size());
    stats.mean = VecX::Zero(dim);
    stats.covariance = MatX::Zero(dim, dim);

    for (size_t idx : samples) {
        const T* v = grid.VoxelPtr(idx);
        for (int c = 0; c < dim; ++c) {
            stats.mean[c] += static_cast<double>(v[c]);
        }
    }
    stats.mean *= 1.0 / static_cast<double>(stats.count);

    if (stats.count == 1) {
        stats.degenerate = true;
        return stats;
    }

    VecX diff(dim);
    for (size_t idx : samples) {
        const T* v = grid.VoxelPtr(idx);
        for (int c = 0; c < dim; ++c) {
            diff[c] = static_cast<double>(v[c]) - stats.mean[c];
        }
        stats.covariance.AddOuterProduct(diff);
    }
    stats.covariance = stats.covariance * (1.0 / static_cast<double>(stats.count - 1));

    stats.cholesky = Cholesky_Decompose(stats.covariance);
    if (!stats.cholesky.valid) {
        throw SingularCovarianceException(
            "VectorStatistics: covariance of " + std::to_string(stats.count) +
            " samples is not positive definite (pivot " +
            std::to_string(stats.cholesky.failedPivot) + ")");
    }
    stats.inverseCovariance = InverseFromCholesky(stats.cholesky);
    return stats;
}

template<typename T>
VectorStatistics VectorStatistics::FromSeedNeighborhood(const VolumeGrid<T>& grid,
                                                        const std::vector<Index3>& seeds,
                                                        int32_t radius,
                                                        SingleSamplePolicy policy) {
    Validate::RequireVolumeNonEmpty(grid, "VectorStatistics::FromSeedNeighborhood");
    return FromSamples(grid, CollectSeedNeighborhood(grid.Dims(), seeds, radius), policy);
}

template<typename T>
VectorStatistics VectorStatistics::FromMaskVoxels(const VolumeGrid<T>& grid,
                                                  const LabelMask& mask,
                                                  SingleSamplePolicy policy) {
    Validate::RequireVolumeNonEmpty(grid, "VectorStatistics::FromMaskVoxels");
    Validate::RequireSameDims(grid, mask, "VectorStatistics::FromMaskVoxels");
    return FromSamples(grid, CollectMaskVoxels(mask), policy);
}

// =============================================================================
// Explicit Instantiations
// =============================================================================

#define VOLSEG_INSTANTIATE_REGION_STATISTICS(T)                                        \
    template ScalarStatistics ScalarStatistics::FromSamples<T>(                        \
        const VolumeGrid<T>&, const std::vector<size_t>&, SingleSamplePolicy);         \
    template ScalarStatistics ScalarStatistics::FromSeedNeighborhood<T>(               \
        const VolumeGrid<T>&, const std::vector<Index3>&, int32_t, SingleSamplePolicy);\
    template ScalarStatistics ScalarStatistics::FromMaskVoxels<T>(                     \
        const VolumeGrid<T>&, const LabelMask&, SingleSamplePolicy);                   \
    template VectorStatistics VectorStatistics::FromSamples<T>(                        \
        const VolumeGrid<T>&, const std::vector<size_t>&, SingleSamplePolicy);         \
    template VectorStatistics VectorStatistics::FromSeedNeighborhood<T>(               \
        const VolumeGrid<T>&, const std::vector<Index3>&, int32_t, SingleSamplePolicy);\
    template VectorStatistics VectorStatistics::FromMaskVoxels<T>(                     \
        const VolumeGrid<T>&, const LabelMask&, SingleSamplePolicy);

VOLSEG_INSTANTIATE_REGION_STATISTICS(uint8_t)
VOLSEG_INSTANTIATE_REGION_STATISTICS(int16_t)
VOLSEG_INSTANTIATE_REGION_STATISTICS(uint16_t)
VOLSEG_INSTANTIATE_REGION_STATISTICS(int32_t)
VOLSEG_INSTANTIATE_REGION_STATISTICS(float)
VOLSEG_INSTANTIATE_REGION_STATISTICS(double)

#undef VOLSEG_INSTANTIATE_REGION_STATISTICS

} // namespace Vol::Seg::Internal
