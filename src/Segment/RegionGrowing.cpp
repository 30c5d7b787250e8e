/**
 * @file RegionGrowing.cpp
 * @brief Seeded region growing implementation
 */

#include <VolSeg/Segment/RegionGrowing.h>
#include <VolSeg/Internal/FloodFill.h>
#include <VolSeg/Internal/RegionStatistics.h>
#include <VolSeg/Core/Exception.h>
#include <VolSeg/Core/Log.h>
#include <VolSeg/Core/Validate.h>
#include <VolSeg/Platform/Timer.h>

#include <string>
#include <utility>

namespace Vol::Seg::Segment {

using Internal::ScalarStatistics;
using Internal::VectorStatistics;

// =============================================================================
// Status and Results
// =============================================================================

const char* GrowStatusName(GrowStatus status) {
    switch (status) {
        case GrowStatus::Success:              return "Success";
        case GrowStatus::InsufficientSamples:  return "InsufficientSamples";
        case GrowStatus::SingularCovariance:   return "SingularCovariance";
        case GrowStatus::DegenerateStatistics: return "DegenerateStatistics";
    }
    return "Unknown";
}

namespace {

void ThrowForStatus(GrowStatus status, const std::string& funcName,
                    const std::string& message) {
    const std::string text = funcName + ": " + message;
    switch (status) {
        case GrowStatus::Success:
            return;
        case GrowStatus::InsufficientSamples:
            throw InsufficientSamplesException(text);
        case GrowStatus::SingularCovariance:
            throw SingularCovarianceException(text);
        case GrowStatus::DegenerateStatistics:
            throw DegenerateStatisticsException(text);
    }
}

} // anonymous namespace

void ConfidenceConnectedResult::ThrowIfFailed() const {
    ThrowForStatus(status, "ConfidenceConnected", message);
}

void VectorConfidenceConnectedResult::ThrowIfFailed() const {
    ThrowForStatus(status, "VectorConfidenceConnected", message);
}

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

template<typename T>
size_t GrowInterval(const VolumeGrid<T>& grid, const std::vector<Index3>& seeds,
                    double lower, double upper, Connectivity3d connectivity,
                    uint8_t label, LabelMask& mask) {
    const T* data = grid.Data();
    return Internal::FloodFill(seeds, connectivity,
        [data, lower, upper](size_t idx) {
            const double v = static_cast<double>(data[idx]);
            return lower <= v && v <= upper;
        },
        mask, label);
}

template<typename T>
size_t GrowMahalanobis(const VolumeGrid<T>& grid, const std::vector<Index3>& seeds,
                       const VectorStatistics& stats, double multiplier,
                       Connectivity3d connectivity, uint8_t label, LabelMask& mask) {
    Internal::VecX scratch(stats.Dimension());
    return Internal::FloodFill(seeds, connectivity,
        [&grid, &stats, &scratch, multiplier](size_t idx) {
            return stats.MahalanobisDistance(grid.VoxelPtr(idx), scratch) < multiplier;
        },
        mask, label);
}

void RecordScalar(ConfidenceConnectedResult& result, const ScalarStatistics& stats,
                  double lower, double upper) {
    result.sampleCount = stats.count;
    result.mean = stats.mean;
    result.variance = stats.variance;
    result.lower = lower;
    result.upper = upper;
}

void RecordVector(VectorConfidenceConnectedResult& result, const VectorStatistics& stats) {
    result.sampleCount = stats.count;
    result.mean = stats.mean.ToStdVector();
    result.covariance = stats.covariance.ToStdVector();
}

std::string IterationPrefix(int32_t iteration) {
    return "iteration " + std::to_string(iteration) + ": ";
}

} // anonymous namespace

// =============================================================================
// Connected Threshold
// =============================================================================

template<typename T>
LabelMask ConnectedThreshold(const VolumeGrid<T>& grid,
                             const std::vector<Index3>& seeds,
                             const ConnectedThresholdParams& params) {
    Validate::RequireScalarVolume(grid, "ConnectedThreshold");
    Validate::RequireSeeds(seeds, grid.Dims(), "ConnectedThreshold");
    Validate::RequireThresholdBounds(params.lower, params.upper, "ConnectedThreshold");
    Validate::RequirePositive(params.replaceValue, "replaceValue", "ConnectedThreshold");

    Platform::Timer timer(true);
    LabelMask mask = MakeMaskLike(grid);
    size_t count = GrowInterval(grid, seeds, params.lower, params.upper,
                                params.connectivity, params.replaceValue, mask);

    Log::Get()->debug("ConnectedThreshold: [{:.6g}, {:.6g}] from {} seeds -> {} voxels, {:.2f} ms",
                      params.lower, params.upper, seeds.size(), count, timer.ElapsedMs());
    return mask;
}

template<typename T>
LabelMask ConnectedThreshold(const VolumeGrid<T>& grid,
                             const std::vector<Index3>& seeds,
                             double lower, double upper,
                             uint8_t replaceValue) {
    ConnectedThresholdParams params;
    params.lower = lower;
    params.upper = upper;
    params.replaceValue = replaceValue;
    return ConnectedThreshold(grid, seeds, params);
}

// =============================================================================
// Confidence Connected
// =============================================================================

template<typename T>
ConfidenceConnectedResult ConfidenceConnected(const VolumeGrid<T>& grid,
                                              const std::vector<Index3>& seeds,
                                              const ConfidenceConnectedParams& params) {
    const char* funcName = "ConfidenceConnected";
    Validate::RequireScalarVolume(grid, funcName);
    Validate::RequireSeeds(seeds, grid.Dims(), funcName);
    Validate::RequireFinitePositive(params.multiplier, "multiplier", funcName);
    Validate::RequireNonNegative(params.numberOfIterations, "numberOfIterations", funcName);
    Validate::RequireNonNegative(params.initialNeighborhoodRadius,
                                 "initialNeighborhoodRadius", funcName);
    Validate::RequirePositive(params.replaceValue, "replaceValue", funcName);

    auto logger = Log::Get();
    Platform::ScopedTimer scoped(funcName);
    ConfidenceConnectedResult result;

    ScalarStatistics stats;
    try {
        stats = ScalarStatistics::FromSeedNeighborhood(grid, seeds,
                                                       params.initialNeighborhoodRadius,
                                                       params.singleSamplePolicy);
    } catch (const InsufficientSamplesException& e) {
        result.mask = MakeMaskLike(grid);
        result.status = GrowStatus::InsufficientSamples;
        result.message = IterationPrefix(0) + e.what();
        logger->warn("{}: {}, returning empty mask", funcName, result.message);
        return result;
    }

    // Iteration 0 from the seed neighborhood, then refine from each mask
    for (int32_t iteration = 0; iteration <= params.numberOfIterations; ++iteration) {
        if (iteration > 0) {
            try {
                stats = ScalarStatistics::FromMaskVoxels(grid, result.mask,
                                                         params.singleSamplePolicy);
            } catch (const InsufficientSamplesException& e) {
                result.status = GrowStatus::DegenerateStatistics;
                result.message = IterationPrefix(iteration) + e.what();
                logger->warn("{}: {}, keeping mask of iteration {}", funcName,
                             result.message, iteration - 1);
                return result;
            }
        }

        // Zero spread admits the mean only, whatever the multiplier
        const double sigma = stats.StdDev();
        const double halfWidth = sigma > 0.0 ? params.multiplier * sigma : 0.0;
        const double lower = stats.mean - halfWidth;
        const double upper = stats.mean + halfWidth;

        LabelMask mask = MakeMaskLike(grid);
        size_t count = GrowInterval(grid, seeds, lower, upper, params.connectivity,
                                    params.replaceValue, mask);

        logger->debug("{}: iteration {} n={} mean={:.6g} stddev={:.6g} "
                      "bounds=[{:.6g}, {:.6g}] -> {} voxels",
                      funcName, iteration, stats.count, stats.mean, sigma,
                      lower, upper, count);

        result.mask = std::move(mask);
        result.iterationsCompleted = iteration;
        RecordScalar(result, stats, lower, upper);
    }

    return result;
}

// =============================================================================
// Vector Confidence Connected
// =============================================================================

template<typename T>
VectorConfidenceConnectedResult VectorConfidenceConnected(
    const VolumeGrid<T>& grid,
    const std::vector<Index3>& seeds,
    const VectorConfidenceConnectedParams& params) {
    const char* funcName = "VectorConfidenceConnected";
    Validate::RequireVolumeNonEmpty(grid, funcName);
    Validate::RequireSeeds(seeds, grid.Dims(), funcName);
    Validate::RequireFinitePositive(params.multiplier, "multiplier", funcName);
    Validate::RequireNonNegative(params.numberOfIterations, "numberOfIterations", funcName);
    Validate::RequirePositive(params.replaceValue, "replaceValue", funcName);

    auto logger = Log::Get();
    Platform::ScopedTimer scoped(funcName);
    VectorConfidenceConnectedResult result;
    result.mask = MakeMaskLike(grid);

    for (int32_t iteration = 0; iteration <= params.numberOfIterations; ++iteration) {
        VectorStatistics stats;
        try {
            stats = (iteration == 0)
                ? VectorStatistics::FromSeedNeighborhood(grid, seeds, 0,
                                                         params.singleSamplePolicy)
                : VectorStatistics::FromMaskVoxels(grid, result.mask,
                                                   params.singleSamplePolicy);
        } catch (const SingularCovarianceException& e) {
            result.status = GrowStatus::SingularCovariance;
            result.message = IterationPrefix(iteration) + e.what();
        } catch (const InsufficientSamplesException& e) {
            result.status = (iteration == 0) ? GrowStatus::InsufficientSamples
                                             : GrowStatus::DegenerateStatistics;
            result.message = IterationPrefix(iteration) + e.what();
        }

        if (!result.Ok()) {
            if (iteration == 0) {
                logger->warn("{}: {}, returning empty mask", funcName, result.message);
            } else {
                logger->warn("{}: {}, keeping mask of iteration {}", funcName,
                             result.message, iteration - 1);
            }
            return result;
        }

        LabelMask mask = MakeMaskLike(grid);
        size_t count = GrowMahalanobis(grid, seeds, stats, params.multiplier,
                                       params.connectivity, params.replaceValue, mask);

        logger->debug("{}: iteration {} n={} degenerate={} -> {} voxels",
                      funcName, iteration, stats.count, stats.degenerate, count);

        result.mask = std::move(mask);
        result.iterationsCompleted = iteration;
        RecordVector(result, stats);
    }

    return result;
}

// =============================================================================
// Explicit Instantiations
// =============================================================================

#define VOLSEG_INSTANTIATE_REGION_GROWING(T)                                          \
    template LabelMask ConnectedThreshold<T>(                                         \
        const VolumeGrid<T>&, const std::vector<Index3>&,                             \
        const ConnectedThresholdParams&);                                             \
    template LabelMask ConnectedThreshold<T>(                                         \
        const VolumeGrid<T>&, const std::vector<Index3>&, double, double, uint8_t);   \
    template ConfidenceConnectedResult ConfidenceConnected<T>(                        \
        const VolumeGrid<T>&, const std::vector<Index3>&,                             \
        const ConfidenceConnectedParams&);                                            \
    template VectorConfidenceConnectedResult VectorConfidenceConnected<T>(            \
        const VolumeGrid<T>&, const std::vector<Index3>&,                             \
        const VectorConfidenceConnectedParams&);

VOLSEG_INSTANTIATE_REGION_GROWING(uint8_t)
VOLSEG_INSTANTIATE_REGION_GROWING(int16_t)
VOLSEG_INSTANTIATE_REGION_GROWING(uint16_t)
VOLSEG_INSTANTIATE_REGION_GROWING(int32_t)
VOLSEG_INSTANTIATE_REGION_GROWING(float)
VOLSEG_INSTANTIATE_REGION_GROWING(double)

#undef VOLSEG_INSTANTIATE_REGION_GROWING

} // namespace Vol::Seg::Segment
