#pragma once

/**
 * @file FloodFill.h
 * @brief Breadth-first seeded flood fill over a 3D grid
 *
 * The frontier is an explicit FIFO of linear voxel indices and the visited
 * set is a byte array keyed by the same index. Every voxel is tested at most
 * once: it is marked visited when first reached, whether or not it is
 * admitted.
 *
 * The admitted set is the maximal connected set of admissible voxels that
 * contains the admissible seeds, independent of traversal order.
 */

#include <VolSeg/Core/Types.h>
#include <VolSeg/Core/VolumeGrid.h>

#include <cstdint>
#include <vector>

namespace Vol::Seg::Internal {

/**
 * @brief Flood fill from seeds, labeling every admitted voxel in mask
 *
 * @param seeds Seed coordinates, all inside mask (caller validates)
 * @param connectivity Neighborhood to expand through
 * @param admit Predicate admit(size_t linearIndex) -> bool
 * @param mask Output mask, same dimensions as the volume; labeled voxels are
 *             set to label, other voxels are left untouched
 * @param label Value written for admitted voxels (non-zero)
 * @return Number of admitted voxels
 */
template<typename Admit>
size_t FloodFill(const std::vector<Index3>& seeds,
                 Connectivity3d connectivity,
                 Admit&& admit,
                 LabelMask& mask,
                 uint8_t label) {
    const Size3& dims = mask.Dims();
    const int64_t nx = dims.x;
    const int64_t nxy = static_cast<int64_t>(dims.x) * dims.y;

    const auto& offsets = NeighborOffsets(connectivity);
    std::vector<int64_t> deltas;
    deltas.reserve(offsets.size());
    for (const auto& o : offsets) {
        deltas.push_back(o.x + o.y * nx + o.z * nxy);
    }

    std::vector<uint8_t> visited(mask.VoxelCount(), 0);
    std::vector<size_t> queue;
    size_t head = 0;
    uint8_t* out = mask.Data();

    for (const auto& seed : seeds) {
        size_t idx = mask.LinearIndex(seed);
        if (visited[idx]) continue;
        visited[idx] = 1;
        if (admit(idx)) {
            out[idx] = label;
            queue.push_back(idx);
        }
    }

    while (head < queue.size()) {
        const size_t idx = queue[head++];
        const Index3 p = mask.IndexOf(idx);

        for (size_t n = 0; n < offsets.size(); ++n) {
            const Index3& o = offsets[n];
            const int32_t x = p.x + o.x;
            const int32_t y = p.y + o.y;
            const int32_t z = p.z + o.z;
            if (x < 0 || x >= dims.x || y < 0 || y >= dims.y || z < 0 || z >= dims.z) {
                continue;
            }

            const size_t nidx = static_cast<size_t>(static_cast<int64_t>(idx) + deltas[n]);
            if (visited[nidx]) continue;
            visited[nidx] = 1;

            if (admit(nidx)) {
                out[nidx] = label;
                queue.push_back(nidx);
            }
        }
    }

    return queue.size();
}

} // namespace Vol::Seg::Internal
