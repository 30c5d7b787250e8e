#pragma once

/**
 * @file Morphology.h
 * @brief Binary morphology for cleaning up segmentation masks
 *
 * Typical use after region growing:
 * @code
 * auto se = Morphology::MakeStructuringElement(Morphology::SEShape::Ball, 1);
 * LabelMask cleaned = Morphology::Closing(Morphology::Opening(mask, se), se);
 * @endcode
 *
 * All operations are pure: they return a new mask with the input's
 * dimensions and geometry and never modify their arguments.
 */

#include <VolSeg/Core/Export.h>
#include <VolSeg/Core/Types.h>
#include <VolSeg/Core/VolumeGrid.h>
#include <VolSeg/Internal/StructElement3d.h>

#include <cstdint>
#include <vector>

namespace Vol::Seg::Morphology {

// =============================================================================
// Structuring Element
// =============================================================================

/// Structuring element shapes
enum class SEShape {
    Ball,
    Box,
    Cross,
    Annulus,
    Custom
};

/**
 * @brief 3D structuring element
 *
 * Built once from a shape and radius into a fixed offset set, then shared
 * read-only by any number of morphology calls.
 */
class VOLSEG_API StructuringElement {
public:
    /// Default: single-voxel element (identity for dilation and erosion)
    StructuringElement();

    static StructuringElement Ball(const Radius3& radius);
    static StructuringElement Box(const Radius3& radius);
    static StructuringElement Cross(const Radius3& radius);

    /**
     * @brief Ball shell of the given thickness
     * @param includeCenter Also include the center voxel
     */
    static StructuringElement Annulus(const Radius3& radius, int32_t thickness = 1,
                                      bool includeCenter = false);

    /// Element from explicit offsets relative to the center voxel
    static StructuringElement FromOffsets(const std::vector<Index3>& offsets);

    bool Empty() const { return se_.Empty(); }
    SEShape Shape() const;
    size_t Size() const { return se_.Size(); }
    Radius3 Extent() const { return se_.Extent(); }
    bool Contains(const Index3& offset) const { return se_.Contains(offset); }
    bool IsSymmetric() const { return se_.IsSymmetric(); }
    const std::vector<Index3>& Offsets() const { return se_.Offsets(); }

    /// Point reflection (d -> -d)
    StructuringElement Reflect() const;

    /// Underlying offset set
    const Internal::StructElement3d& Element() const { return se_; }

private:
    explicit StructuringElement(Internal::StructElement3d se);

    Internal::StructElement3d se_;
};

/**
 * @brief Build a structuring element from shape and per-axis radius
 *
 * @param shape Ball, Box, Cross or Annulus (thickness 1, center excluded)
 * @param radius Non-negative radius per axis
 * @throws InvalidArgumentException on negative radius or SEShape::Custom
 */
VOLSEG_API StructuringElement MakeStructuringElement(SEShape shape, const Radius3& radius);

/// Isotropic radius overload
VOLSEG_API StructuringElement MakeStructuringElement(SEShape shape, int32_t radius);

// =============================================================================
// Binary Morphology
// =============================================================================

/**
 * @brief Dilation: voxel set iff the reflected element centered there hits the mask
 *
 * Each foreground voxel u spreads to u + o for every offset o; targets
 * leaving the volume are dropped. For symmetric elements this is the same
 * as probing u + o.
 *
 * @param mask Single-component label mask (non-zero = foreground)
 * @param se Non-empty structuring element
 * @param foreground Value written for output foreground voxels
 * @throws InvalidArgumentException if mask or se is empty
 * @throws DimensionMismatchException if mask has more than one component
 */
VOLSEG_API LabelMask Dilation(const LabelMask& mask, const StructuringElement& se,
                              uint8_t foreground = 1);

/**
 * @brief Erosion: voxel set iff the element centered there fits the mask
 *
 * Offsets leaving the volume count as satisfied, so foreground touching the
 * volume border is not eroded from outside.
 */
VOLSEG_API LabelMask Erosion(const LabelMask& mask, const StructuringElement& se,
                             uint8_t foreground = 1);

/// Opening: Dilation(Erosion(mask)), removes components smaller than se.
/// Never adds a voxel, for any element.
VOLSEG_API LabelMask Opening(const LabelMask& mask, const StructuringElement& se,
                             uint8_t foreground = 1);

/// Closing: Erosion(Dilation(mask)), fills holes smaller than se.
/// Never removes a voxel, for any element.
VOLSEG_API LabelMask Closing(const LabelMask& mask, const StructuringElement& se,
                             uint8_t foreground = 1);

/// Opening with an isotropic ball of given radius
VOLSEG_API LabelMask OpeningBall(const LabelMask& mask, int32_t radius,
                                 uint8_t foreground = 1);

/// Closing with an isotropic ball of given radius
VOLSEG_API LabelMask ClosingBall(const LabelMask& mask, int32_t radius,
                                 uint8_t foreground = 1);

// =============================================================================
// Mask Set Operations
// =============================================================================

/// Voxelwise a | b; masks must have equal dimensions
VOLSEG_API LabelMask MaskUnion(const LabelMask& a, const LabelMask& b,
                               uint8_t foreground = 1);

/// Voxelwise a & b
VOLSEG_API LabelMask MaskIntersection(const LabelMask& a, const LabelMask& b,
                                      uint8_t foreground = 1);

/// Voxelwise a & !b
VOLSEG_API LabelMask MaskDifference(const LabelMask& a, const LabelMask& b,
                                    uint8_t foreground = 1);

} // namespace Vol::Seg::Morphology
