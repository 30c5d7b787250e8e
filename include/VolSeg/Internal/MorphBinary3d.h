#pragma once

/**
 * @file MorphBinary3d.h
 * @brief Binary morphology on dense 3D label masks
 *
 * This module provides:
 * - Basic operations: dilation, erosion
 * - Compound operations: opening, closing
 * - Set operations: union, intersection, difference
 *
 * Masks are single-component VolumeGrid<uint8_t>; any non-zero voxel is
 * foreground. Outputs are new masks holding 0 and the requested foreground
 * value, with the input's geometry. Work is split over output z-slices.
 *
 * Dilation translates by +o and erosion reads mask(v + o), so the two form an
 * adjoint pair for any element: opening never adds a voxel and closing
 * never removes one, symmetric or not.
 *
 * Boundary handling:
 * - Dilation ignores offsets that leave the volume
 * - Erosion treats offsets that leave the volume as satisfied
 */

#include <VolSeg/Core/VolumeGrid.h>
#include <VolSeg/Internal/StructElement3d.h>

#include <cstdint>

namespace Vol::Seg::Internal {

// =============================================================================
// Basic Morphological Operations
// =============================================================================

/**
 * @brief Dilate mask with structuring element
 *
 * out(v) = foreground iff mask(v - o) != 0 for some offset o with v - o
 * in bounds (Minkowski sum, each foreground voxel u spreads to u + o).
 *
 * @param mask Input mask (1 component)
 * @param se Structuring element (non-empty)
 * @param foreground Value written for foreground voxels
 * @return Dilated mask
 */
LabelMask Dilate(const LabelMask& mask, const StructElement3d& se, uint8_t foreground = 1);

/**
 * @brief Erode mask with structuring element
 *
 * out(v) = foreground iff mask(v + o) != 0 for every in-bounds offset o.
 *
 * @param mask Input mask (1 component)
 * @param se Structuring element (non-empty)
 * @param foreground Value written for foreground voxels
 * @return Eroded mask
 */
LabelMask Erode(const LabelMask& mask, const StructElement3d& se, uint8_t foreground = 1);

// =============================================================================
// Compound Operations
// =============================================================================

/**
 * @brief Opening: Dilate(Erode(mask, se), se)
 *
 * Removes foreground components the element does not fit into.
 */
LabelMask Opening(const LabelMask& mask, const StructElement3d& se, uint8_t foreground = 1);

/**
 * @brief Closing: Erode(Dilate(mask, se), se)
 *
 * Fills background holes the element does not fit into.
 */
LabelMask Closing(const LabelMask& mask, const StructElement3d& se, uint8_t foreground = 1);

// =============================================================================
// Set Operations
// =============================================================================

/// out = a | b
LabelMask MaskUnion(const LabelMask& a, const LabelMask& b, uint8_t foreground = 1);

/// out = a & b
LabelMask MaskIntersection(const LabelMask& a, const LabelMask& b, uint8_t foreground = 1);

/// out = a & !b
LabelMask MaskDifference(const LabelMask& a, const LabelMask& b, uint8_t foreground = 1);

} // namespace Vol::Seg::Internal
