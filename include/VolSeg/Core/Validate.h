#pragma once

/**
 * @file Validate.h
 * @brief Unified validation utilities for VolSeg
 *
 * Every public entry point validates its arguments before touching voxel
 * data, so construction-time errors never leave a partial result behind.
 *
 * Layered API:
 * - RequireVolumeNonEmpty() / RequireScalarVolume(): volume shape checks
 * - RequireSameDims() / RequireMask(): cross-volume checks
 * - RequireSeeds() / RequireThresholdBounds(): grower inputs
 * - RequirePositive() / RequireNonNegative(): scalar parameters
 * - RequireFinitePositive(): scalar factors that multiply other values
 *
 * Error message format: "<FuncName>: <what> ..."
 */

#include <VolSeg/Core/Exception.h>
#include <VolSeg/Core/Export.h>
#include <VolSeg/Core/Types.h>
#include <VolSeg/Core/VolumeGrid.h>

#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

namespace Vol::Seg::Validate {

// =============================================================================
// Internal Formatting
// =============================================================================

namespace Detail {

// Format double with limited precision (avoid long tails)
inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6g", val);
    return buf;
}

inline std::string FormatValue(int32_t val) {
    return std::to_string(val);
}

inline std::string FormatValue(int64_t val) {
    return std::to_string(val);
}

inline std::string FormatValue(size_t val) {
    return std::to_string(val);
}

} // namespace Detail

// =============================================================================
// Volume Validation
// =============================================================================

/**
 * @brief Check volume holds at least one voxel
 *
 * @throws InvalidArgumentException if volume is empty
 */
template<typename T>
inline void RequireVolumeNonEmpty(const VolumeGrid<T>& grid, const char* funcName) {
    if (grid.Empty()) {
        throw InvalidArgumentException(std::string(funcName) + ": volume is empty");
    }
}

/**
 * @brief Check volume is non-empty with one value per voxel
 *
 * @throws InvalidArgumentException if empty or vector-valued
 */
template<typename T>
inline void RequireScalarVolume(const VolumeGrid<T>& grid, const char* funcName) {
    RequireVolumeNonEmpty(grid, funcName);
    if (grid.Components() != 1) {
        throw InvalidArgumentException(
            std::string(funcName) + ": expected scalar volume, got " +
            std::to_string(grid.Components()) + " components per voxel");
    }
}

/**
 * @brief Check two volumes have identical dimensions
 *
 * @throws DimensionMismatchException if dimensions differ
 */
template<typename T, typename U>
inline void RequireSameDims(const VolumeGrid<T>& a, const VolumeGrid<U>& b,
                            const char* funcName) {
    if (a.Dims() != b.Dims()) {
        throw DimensionMismatchException(
            std::string(funcName) + ": " + ToString(a.Dims()) + " vs " +
            ToString(b.Dims()));
    }
}

/**
 * @brief Check a label mask is non-empty with one component
 *
 * @throws InvalidArgumentException if mask is empty
 * @throws DimensionMismatchException if mask has more than one component
 */
inline void RequireMask(const LabelMask& mask, const char* funcName) {
    RequireVolumeNonEmpty(mask, funcName);
    if (mask.Components() != 1) {
        throw DimensionMismatchException(
            std::string(funcName) + ": mask must have 1 component, got " +
            std::to_string(mask.Components()));
    }
}

// =============================================================================
// Grower Inputs
// =============================================================================

/**
 * @brief Check seed list is non-empty and every seed lies inside the volume
 *
 * @throws InvalidArgumentException if seeds is empty
 * @throws InvalidSeedException naming the first out-of-bounds seed
 */
inline void RequireSeeds(const std::vector<Index3>& seeds, const Size3& dims,
                         const char* funcName) {
    if (seeds.empty()) {
        throw InvalidArgumentException(std::string(funcName) + ": no seeds given");
    }
    for (size_t i = 0; i < seeds.size(); ++i) {
        if (!dims.Contains(seeds[i])) {
            throw InvalidSeedException(
                std::string(funcName) + ": seed " + std::to_string(i) + " at " +
                ToString(seeds[i]) + " outside volume " + ToString(dims));
        }
    }
}

/**
 * @brief Check threshold interval is ordered and finite
 *
 * @throws InvalidBoundsException if lower > upper or either is NaN
 */
inline void RequireThresholdBounds(double lower, double upper, const char* funcName) {
    if (std::isnan(lower) || std::isnan(upper)) {
        throw InvalidBoundsException(std::string(funcName) + ": bound is NaN");
    }
    if (lower > upper) {
        throw InvalidBoundsException(
            std::string(funcName) + ": lower " + Detail::FormatValue(lower) +
            " > upper " + Detail::FormatValue(upper));
    }
}

// =============================================================================
// Parameter Validation
// =============================================================================

/**
 * @brief Validate value is positive (> 0)
 */
template<typename T>
inline void RequirePositive(T value, const char* paramName, const char* funcName) {
    if (!(value > T(0))) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be > 0, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is non-negative (>= 0)
 */
template<typename T>
inline void RequireNonNegative(T value, const char* paramName, const char* funcName) {
    if (value < T(0)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be >= 0, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is finite and > 0
 */
inline void RequireFinitePositive(double value, const char* paramName, const char* funcName) {
    if (!std::isfinite(value) || !(value > 0.0)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be finite and > 0, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate per-axis radius is non-negative
 */
inline void RequireRadius(const Radius3& radius, const char* funcName) {
    if (!radius.IsValid()) {
        throw InvalidArgumentException(
            std::string(funcName) + ": radius must be >= 0 on every axis, got (" +
            std::to_string(radius.x) + ", " + std::to_string(radius.y) + ", " +
            std::to_string(radius.z) + ")");
    }
}

} // namespace Vol::Seg::Validate
