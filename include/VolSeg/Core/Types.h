#pragma once

/**
 * @file Types.h
 * @brief Core type definitions for VolSeg
 */

#include <VolSeg/Core/Export.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Vol::Seg {

// =============================================================================
// Index / Size Types
// =============================================================================

/**
 * @brief Integer voxel coordinate (i, j, k) = (x, y, z)
 */
struct VOLSEG_API Index3 {
    int32_t x = 0;
    int32_t y = 0;
    int32_t z = 0;

    Index3() = default;
    Index3(int32_t x_, int32_t y_, int32_t z_) : x(x_), y(y_), z(z_) {}

    Index3 operator+(const Index3& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }
    Index3 operator-(const Index3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }
    Index3 operator-() const { return {-x, -y, -z}; }

    bool operator==(const Index3& other) const {
        return x == other.x && y == other.y && z == other.z;
    }
    bool operator!=(const Index3& other) const { return !(*this == other); }

    /// Lexicographic (z, y, x) order, i.e. memory order
    bool operator<(const Index3& other) const {
        if (z != other.z) return z < other.z;
        if (y != other.y) return y < other.y;
        return x < other.x;
    }
};

/**
 * @brief Volume dimensions (nx, ny, nz)
 */
struct VOLSEG_API Size3 {
    int32_t x = 0;
    int32_t y = 0;
    int32_t z = 0;

    Size3() = default;
    Size3(int32_t x_, int32_t y_, int32_t z_) : x(x_), y(y_), z(z_) {}

    /// Number of voxels
    size_t Volume() const {
        if (x <= 0 || y <= 0 || z <= 0) return 0;
        return static_cast<size_t>(x) * static_cast<size_t>(y) * static_cast<size_t>(z);
    }

    bool Empty() const { return Volume() == 0; }

    bool Contains(const Index3& idx) const {
        return idx.x >= 0 && idx.x < x &&
               idx.y >= 0 && idx.y < y &&
               idx.z >= 0 && idx.z < z;
    }

    bool operator==(const Size3& other) const {
        return x == other.x && y == other.y && z == other.z;
    }
    bool operator!=(const Size3& other) const { return !(*this == other); }
};

/**
 * @brief Per-axis non-negative integer radius
 */
struct VOLSEG_API Radius3 {
    int32_t x = 0;
    int32_t y = 0;
    int32_t z = 0;

    Radius3() = default;
    /// Same radius on every axis
    explicit Radius3(int32_t r) : x(r), y(r), z(r) {}
    Radius3(int32_t x_, int32_t y_, int32_t z_) : x(x_), y(y_), z(z_) {}

    int32_t operator[](int axis) const { return axis == 0 ? x : (axis == 1 ? y : z); }

    bool IsValid() const { return x >= 0 && y >= 0 && z >= 0; }

    bool operator==(const Radius3& other) const {
        return x == other.x && y == other.y && z == other.z;
    }
};

// =============================================================================
// Geometry Metadata
// =============================================================================

/**
 * @brief Physical placement of a volume
 *
 * Not interpreted by any algorithm. Carried from a source grid onto every
 * mask derived from it so that external viewers can overlay the result.
 */
struct VOLSEG_API VolumeGeometry {
    std::array<double, 3> spacing{{1.0, 1.0, 1.0}};     ///< Voxel size (mm)
    std::array<double, 3> origin{{0.0, 0.0, 0.0}};      ///< Position of voxel (0,0,0)
    std::array<double, 9> direction{{1.0, 0.0, 0.0,     ///< Row-major direction cosines
                                     0.0, 1.0, 0.0,
                                     0.0, 0.0, 1.0}};

    bool operator==(const VolumeGeometry& other) const {
        return spacing == other.spacing && origin == other.origin &&
               direction == other.direction;
    }
    bool operator!=(const VolumeGeometry& other) const { return !(*this == other); }
};

// =============================================================================
// Enums
// =============================================================================

/**
 * @brief Voxel neighborhood used by flood fill
 */
enum class Connectivity3d {
    Six,            ///< Face neighbors
    Eighteen,       ///< Face and edge neighbors
    TwentySix       ///< Face, edge and corner neighbors
};

/**
 * @brief Offsets of a neighborhood, face neighbors first (-x, +x, -y, +y, -z, +z)
 */
VOLSEG_API const std::vector<Index3>& NeighborOffsets(Connectivity3d connectivity);

/// "(x, y, z)" for error messages and logs
VOLSEG_API std::string ToString(const Index3& idx);

/// "NXxNYxNZ" (e.g. "64x64x32") for error messages and logs
VOLSEG_API std::string ToString(const Size3& size);

} // namespace Vol::Seg
