/**
 * @file Types.cpp
 * @brief Neighborhood offset tables
 */

#include <VolSeg/Core/Types.h>

#include <cstdlib>

namespace Vol::Seg {

namespace {

std::vector<Index3> BuildOffsets(int maxNonZero) {
    // Face neighbors first, in a fixed order
    std::vector<Index3> offsets = {
        {-1, 0, 0}, {1, 0, 0},
        {0, -1, 0}, {0, 1, 0},
        {0, 0, -1}, {0, 0, 1}
    };
    if (maxNonZero <= 1) return offsets;

    for (int32_t dz = -1; dz <= 1; ++dz) {
        for (int32_t dy = -1; dy <= 1; ++dy) {
            for (int32_t dx = -1; dx <= 1; ++dx) {
                int nonZero = std::abs(dx) + std::abs(dy) + std::abs(dz);
                if (nonZero >= 2 && nonZero <= maxNonZero) {
                    offsets.emplace_back(dx, dy, dz);
                }
            }
        }
    }
    return offsets;
}

} // anonymous namespace

const std::vector<Index3>& NeighborOffsets(Connectivity3d connectivity) {
    static const std::vector<Index3> six = BuildOffsets(1);
    static const std::vector<Index3> eighteen = BuildOffsets(2);
    static const std::vector<Index3> twentySix = BuildOffsets(3);

    switch (connectivity) {
        case Connectivity3d::Eighteen:  return eighteen;
        case Connectivity3d::TwentySix: return twentySix;
        case Connectivity3d::Six:
        default:                        return six;
    }
}

std::string ToString(const Index3& idx) {
    return "(" + std::to_string(idx.x) + ", " + std::to_string(idx.y) + ", " +
           std::to_string(idx.z) + ")";
}

std::string ToString(const Size3& size) {
    return std::to_string(size.x) + "x" + std::to_string(size.y) + "x" +
           std::to_string(size.z);
}

} // namespace Vol::Seg
