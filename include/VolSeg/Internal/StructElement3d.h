#pragma once

/**
 * @file StructElement3d.h
 * @brief 3D structuring elements for binary morphology
 *
 * This module provides:
 * - Predefined shapes: ball (ellipsoid), box, cross, annulus
 * - Custom elements from an explicit offset list
 * - Reflection and symmetry queries
 *
 * An element is materialized once into its offset set (relative to the
 * center voxel) and then read by every erosion/dilation that uses it.
 *
 * Shape definitions for per-axis radius r = (rx, ry, rz) and offset d:
 * - Ball:    sum over axes with r_i > 0 of (d_i / r_i)^2 <= 1, d_i = 0 where r_i = 0
 * - Box:     |d_i| <= r_i on every axis
 * - Cross:   at most one non-zero d_i, with |d_i| <= r_i
 * - Annulus: in Ball(r) and not in Ball(r - thickness)
 */

#include <VolSeg/Core/Types.h>

#include <memory>
#include <vector>

namespace Vol::Seg::Internal {

// =============================================================================
// Types
// =============================================================================

/// Structuring element shape type
enum class StructElementShape {
    Ball,       ///< Euclidean ball / ellipsoid
    Box,        ///< Chebyshev box
    Cross,      ///< Axis-aligned arms
    Annulus,    ///< Ball shell
    Custom      ///< User-defined offsets
};

/**
 * @brief Structuring element as a finite set of 3D offsets
 */
class StructElement3d {
public:
    // =========================================================================
    // Constructors
    // =========================================================================

    /// Default constructor (empty structuring element)
    StructElement3d();

    StructElement3d(const StructElement3d& other);
    StructElement3d(StructElement3d&& other) noexcept;
    ~StructElement3d();
    StructElement3d& operator=(const StructElement3d& other);
    StructElement3d& operator=(StructElement3d&& other) noexcept;

    // =========================================================================
    // Factory Methods
    // =========================================================================

    /**
     * @brief Ellipsoidal ball
     *
     * @param radius Per-axis radius (>= 0); radius 0 everywhere = single voxel
     * @throws InvalidArgumentException if any radius is negative
     */
    static StructElement3d Ball(const Radius3& radius);
    static StructElement3d Ball(int32_t radius) { return Ball(Radius3(radius)); }

    /**
     * @brief Box of size (2rx+1) x (2ry+1) x (2rz+1)
     */
    static StructElement3d Box(const Radius3& radius);
    static StructElement3d Box(int32_t radius) { return Box(Radius3(radius)); }

    /**
     * @brief Cross with arm length r_i along axis i
     *
     * Radius 1 gives the 6-neighborhood plus center.
     */
    static StructElement3d Cross(const Radius3& radius);
    static StructElement3d Cross(int32_t radius) { return Cross(Radius3(radius)); }

    /**
     * @brief Ball shell
     *
     * @param radius Outer per-axis radius
     * @param thickness Shell thickness (>= 1); inner radius is radius - thickness
     * @param includeCenter Also include the zero offset
     * @throws InvalidArgumentException if radius < 0 or thickness < 1
     */
    static StructElement3d Annulus(const Radius3& radius, int32_t thickness = 1,
                                   bool includeCenter = false);
    static StructElement3d Annulus(int32_t radius, int32_t thickness = 1,
                                   bool includeCenter = false) {
        return Annulus(Radius3(radius), thickness, includeCenter);
    }

    /**
     * @brief Element from explicit offsets (duplicates are removed)
     */
    static StructElement3d FromOffsets(const std::vector<Index3>& offsets);

    // =========================================================================
    // Properties
    // =========================================================================

    /// True if the element holds no offsets
    bool Empty() const;

    /// Number of offsets
    size_t Size() const;

    /// Shape the element was built as
    StructElementShape Shape() const;

    /// Largest |offset| per axis
    Radius3 Extent() const;

    /// True if offset is in the element
    bool Contains(const Index3& offset) const;

    /// True if the zero offset is in the element
    bool ContainsOrigin() const { return Contains(Index3(0, 0, 0)); }

    /// True if -d is in the element for every d in it
    bool IsSymmetric() const;

    /// Offsets in (z, y, x) order
    const std::vector<Index3>& Offsets() const;

    // =========================================================================
    // Transformations
    // =========================================================================

    /// Point reflection through the center (d -> -d)
    StructElement3d Reflect() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace Vol::Seg::Internal
