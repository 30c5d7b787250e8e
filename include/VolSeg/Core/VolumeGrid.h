#pragma once

/**
 * @file VolumeGrid.h
 * @brief Dense 3D voxel container (scalar or vector-valued)
 *
 * Storage is interleaved and x-fastest:
 *   element(x, y, z, c) = data[((z * ny + y) * nx + x) * components + c]
 *
 * Unlike a 2D image handle, a VolumeGrid has value semantics: copies are
 * deep, so a mask returned by a grower belongs to the caller alone.
 */

#include <VolSeg/Core/Exception.h>
#include <VolSeg/Core/Types.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace Vol::Seg {

template<typename T>
class VolumeGrid {
public:
    using ValueType = T;

    // =========================================================================
    // Constructors
    // =========================================================================

    /// Default constructor (empty volume)
    VolumeGrid() = default;

    /**
     * @brief Create volume filled with a constant
     *
     * @param size Dimensions (nx, ny, nz), each > 0
     * @param components Values per voxel (>= 1)
     * @param fill Initial value of every element
     * @throws InvalidArgumentException if size or components are invalid
     */
    explicit VolumeGrid(const Size3& size, int32_t components = 1, T fill = T())
        : size_(size), components_(components) {
        if (size.x <= 0 || size.y <= 0 || size.z <= 0) {
            throw InvalidArgumentException("VolumeGrid: dimensions must be > 0, got " +
                                           ToString(size));
        }
        if (components < 1) {
            throw InvalidArgumentException("VolumeGrid: components must be >= 1, got " +
                                           std::to_string(components));
        }
        data_.assign(size.Volume() * static_cast<size_t>(components), fill);
    }

    VolumeGrid(int32_t nx, int32_t ny, int32_t nz, int32_t components = 1, T fill = T())
        : VolumeGrid(Size3(nx, ny, nz), components, fill) {}

    /**
     * @brief Create volume from raw interleaved data (copies data)
     *
     * @param data Pointer to size.Volume() * components elements
     */
    static VolumeGrid FromData(const T* data, const Size3& size, int32_t components = 1) {
        VolumeGrid grid(size, components);
        if (data == nullptr) {
            throw InvalidArgumentException("VolumeGrid::FromData: data is null");
        }
        std::copy(data, data + grid.data_.size(), grid.data_.begin());
        return grid;
    }

    /// Create a zero-filled grid of another element type with the same shape and geometry
    template<typename U>
    static VolumeGrid Like(const VolumeGrid<U>& other, int32_t components = 1, T fill = T()) {
        VolumeGrid grid(other.Dims(), components, fill);
        grid.SetGeometry(other.Geometry());
        return grid;
    }

    // =========================================================================
    // Basic Properties
    // =========================================================================

    int32_t SizeX() const { return size_.x; }
    int32_t SizeY() const { return size_.y; }
    int32_t SizeZ() const { return size_.z; }
    const Size3& Dims() const { return size_; }

    /// Values per voxel
    int32_t Components() const { return components_; }

    /// Number of voxels
    size_t VoxelCount() const { return size_.Volume(); }

    /// Number of stored elements (voxels * components)
    size_t ElementCount() const { return data_.size(); }

    bool Empty() const { return data_.empty(); }

    const VolumeGeometry& Geometry() const { return geometry_; }
    void SetGeometry(const VolumeGeometry& geometry) { geometry_ = geometry; }

    // =========================================================================
    // Indexing
    // =========================================================================

    bool Contains(const Index3& idx) const { return size_.Contains(idx); }

    /// Linear voxel index, unchecked
    size_t LinearIndex(const Index3& idx) const {
        return (static_cast<size_t>(idx.z) * static_cast<size_t>(size_.y) +
                static_cast<size_t>(idx.y)) * static_cast<size_t>(size_.x) +
               static_cast<size_t>(idx.x);
    }

    /// Inverse of LinearIndex, unchecked
    Index3 IndexOf(size_t linear) const {
        const size_t nx = static_cast<size_t>(size_.x);
        const size_t ny = static_cast<size_t>(size_.y);
        return {static_cast<int32_t>(linear % nx),
                static_cast<int32_t>((linear / nx) % ny),
                static_cast<int32_t>(linear / (nx * ny))};
    }

    // =========================================================================
    // Data Access
    // =========================================================================

    /**
     * @brief Get one component of a voxel
     *
     * @throws OutOfRangeException if idx or component is outside the volume
     */
    T ValueAt(const Index3& idx, int32_t component = 0) const {
        RequireInside(idx, component, "VolumeGrid::ValueAt");
        return data_[LinearIndex(idx) * static_cast<size_t>(components_) +
                     static_cast<size_t>(component)];
    }

    /**
     * @brief Set one component of a voxel
     *
     * @throws OutOfRangeException if idx or component is outside the volume
     */
    void SetValue(const Index3& idx, T value, int32_t component = 0) {
        RequireInside(idx, component, "VolumeGrid::SetValue");
        data_[LinearIndex(idx) * static_cast<size_t>(components_) +
              static_cast<size_t>(component)] = value;
    }

    /// Pointer to the Components() values of a voxel (checked)
    const T* VoxelAt(const Index3& idx) const {
        RequireInside(idx, 0, "VolumeGrid::VoxelAt");
        return data_.data() + LinearIndex(idx) * static_cast<size_t>(components_);
    }

    /// Pointer to the Components() values of a voxel by linear index (unchecked)
    const T* VoxelPtr(size_t linear) const {
        return data_.data() + linear * static_cast<size_t>(components_);
    }
    T* VoxelPtr(size_t linear) {
        return data_.data() + linear * static_cast<size_t>(components_);
    }

    /// Element access by linear element index (unchecked)
    T& operator[](size_t i) { return data_[i]; }
    const T& operator[](size_t i) const { return data_[i]; }

    T* Data() { return data_.data(); }
    const T* Data() const { return data_.data(); }

    void Fill(T value) { std::fill(data_.begin(), data_.end(), value); }

    /// Number of voxels with any non-zero component
    size_t CountNonZero() const {
        size_t count = 0;
        const size_t nvox = VoxelCount();
        for (size_t i = 0; i < nvox; ++i) {
            const T* v = VoxelPtr(i);
            for (int32_t c = 0; c < components_; ++c) {
                if (v[c] != T()) {
                    ++count;
                    break;
                }
            }
        }
        return count;
    }

    // =========================================================================
    // Neighborhoods
    // =========================================================================

    /**
     * @brief Face-connected neighbors clipped to bounds
     *
     * Order: -x, +x, -y, +y, -z, +z. Boundary voxels have fewer than six.
     */
    std::vector<Index3> Neighbors6(const Index3& idx) const {
        return Neighbors(idx, Connectivity3d::Six);
    }

    /// In-bounds neighbors for the given connectivity
    std::vector<Index3> Neighbors(const Index3& idx, Connectivity3d connectivity) const {
        RequireInside(idx, 0, "VolumeGrid::Neighbors");
        std::vector<Index3> result;
        for (const auto& offset : NeighborOffsets(connectivity)) {
            Index3 n = idx + offset;
            if (Contains(n)) result.push_back(n);
        }
        return result;
    }

    /// Same dimensions, components, geometry and voxel values
    bool operator==(const VolumeGrid& other) const {
        return size_ == other.size_ && components_ == other.components_ &&
               geometry_ == other.geometry_ && data_ == other.data_;
    }
    bool operator!=(const VolumeGrid& other) const { return !(*this == other); }

private:
    void RequireInside(const Index3& idx, int32_t component, const char* funcName) const {
        if (!Contains(idx)) {
            throw OutOfRangeException(std::string(funcName) + ": " + ToString(idx) +
                                      " outside volume " + ToString(size_));
        }
        if (component < 0 || component >= components_) {
            throw OutOfRangeException(std::string(funcName) + ": component " +
                                      std::to_string(component) + " of " +
                                      std::to_string(components_));
        }
    }

    Size3 size_;
    int32_t components_ = 1;
    VolumeGeometry geometry_;
    std::vector<T> data_;
};

/// Binary/label mask: non-zero = in region
using LabelMask = VolumeGrid<uint8_t>;

/// Create an all-zero mask with the shape and geometry of a grid
template<typename T>
LabelMask MakeMaskLike(const VolumeGrid<T>& grid) {
    return LabelMask::Like(grid, 1, 0);
}

extern template class VolumeGrid<uint8_t>;
extern template class VolumeGrid<int16_t>;
extern template class VolumeGrid<uint16_t>;
extern template class VolumeGrid<int32_t>;
extern template class VolumeGrid<float>;
extern template class VolumeGrid<double>;

} // namespace Vol::Seg
