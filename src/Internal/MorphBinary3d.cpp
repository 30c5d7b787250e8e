#include <VolSeg/Internal/MorphBinary3d.h>
#include <VolSeg/Core/Exception.h>
#include <VolSeg/Core/Validate.h>
#include <VolSeg/Platform/Thread.h>

#include <string>
#include <vector>

namespace Vol::Seg::Internal {

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

void RequireElement(const StructElement3d& se, const char* funcName) {
    if (se.Empty()) {
        throw InvalidArgumentException(std::string(funcName) +
                                       ": structuring element is empty");
    }
}

// Offset with its linear delta precomputed for the mask layout
struct LinearOffset {
    Index3 d;
    int64_t delta;
};

std::vector<LinearOffset> MakeLinearOffsets(const StructElement3d& se, const Size3& dims) {
    const int64_t nx = dims.x;
    const int64_t nxy = static_cast<int64_t>(dims.x) * dims.y;

    std::vector<LinearOffset> result;
    result.reserve(se.Size());
    for (const auto& o : se.Offsets()) {
        result.push_back({o, o.x + o.y * nx + o.z * nxy});
    }
    return result;
}

// Shared sweep over mask(v + o): anyMode ? OR over in-bounds offsets : AND over them
LabelMask Sweep(const LabelMask& mask, const StructElement3d& se, uint8_t foreground,
                bool anyMode) {
    const Size3& dims = mask.Dims();
    const auto offsets = MakeLinearOffsets(se, dims);
    const Radius3 ext = se.Extent();

    LabelMask out = LabelMask::Like(mask, 1, 0);
    const uint8_t* src = mask.Data();
    uint8_t* dst = out.Data();
    const size_t sliceSize = static_cast<size_t>(dims.x) * static_cast<size_t>(dims.y);

    Platform::ParallelForRange(0, static_cast<size_t>(dims.z),
        [&](size_t zBegin, size_t zEnd) {
            for (size_t zz = zBegin; zz < zEnd; ++zz) {
                const int32_t z = static_cast<int32_t>(zz);
                const bool zInterior = z >= ext.z && z < dims.z - ext.z;

                for (int32_t y = 0; y < dims.y; ++y) {
                    const bool yInterior = y >= ext.y && y < dims.y - ext.y;
                    const int64_t rowBase = (static_cast<int64_t>(z) * dims.y + y) * dims.x;

                    for (int32_t x = 0; x < dims.x; ++x) {
                        const bool interior = zInterior && yInterior &&
                                              x >= ext.x && x < dims.x - ext.x;
                        const int64_t idx = rowBase + x;

                        bool hit = !anyMode;
                        for (const auto& o : offsets) {
                            if (!interior) {
                                const int32_t px = x + o.d.x;
                                const int32_t py = y + o.d.y;
                                const int32_t pz = z + o.d.z;
                                if (px < 0 || px >= dims.x || py < 0 || py >= dims.y ||
                                    pz < 0 || pz >= dims.z) {
                                    continue;
                                }
                            }
                            const bool set = src[idx + o.delta] != 0;
                            if (anyMode && set) {
                                hit = true;
                                break;
                            }
                            if (!anyMode && !set) {
                                hit = false;
                                break;
                            }
                        }
                        if (hit) dst[idx] = foreground;
                    }
                }
            }
        }, sliceSize * offsets.size());

    return out;
}

template<typename Op>
LabelMask Combine(const LabelMask& a, const LabelMask& b, uint8_t foreground,
                  const char* funcName, Op&& op) {
    Validate::RequireMask(a, funcName);
    Validate::RequireMask(b, funcName);
    Validate::RequireSameDims(a, b, funcName);

    LabelMask out = LabelMask::Like(a, 1, 0);
    const uint8_t* pa = a.Data();
    const uint8_t* pb = b.Data();
    uint8_t* po = out.Data();
    const size_t n = a.VoxelCount();
    for (size_t i = 0; i < n; ++i) {
        if (op(pa[i] != 0, pb[i] != 0)) po[i] = foreground;
    }
    return out;
}

} // anonymous namespace

// =============================================================================
// Basic Morphological Operations
// =============================================================================

LabelMask Dilate(const LabelMask& mask, const StructElement3d& se, uint8_t foreground) {
    Validate::RequireMask(mask, "Dilate");
    RequireElement(se, "Dilate");
    // Minkowski sum: out(v) reads mask(v - o)
    return Sweep(mask, se.Reflect(), foreground, true);
}

LabelMask Erode(const LabelMask& mask, const StructElement3d& se, uint8_t foreground) {
    Validate::RequireMask(mask, "Erode");
    RequireElement(se, "Erode");
    return Sweep(mask, se, foreground, false);
}

// =============================================================================
// Compound Operations
// =============================================================================

LabelMask Opening(const LabelMask& mask, const StructElement3d& se, uint8_t foreground) {
    return Dilate(Erode(mask, se, foreground), se, foreground);
}

LabelMask Closing(const LabelMask& mask, const StructElement3d& se, uint8_t foreground) {
    return Erode(Dilate(mask, se, foreground), se, foreground);
}

// =============================================================================
// Set Operations
// =============================================================================

LabelMask MaskUnion(const LabelMask& a, const LabelMask& b, uint8_t foreground) {
    return Combine(a, b, foreground, "MaskUnion",
                   [](bool x, bool y) { return x || y; });
}

LabelMask MaskIntersection(const LabelMask& a, const LabelMask& b, uint8_t foreground) {
    return Combine(a, b, foreground, "MaskIntersection",
                   [](bool x, bool y) { return x && y; });
}

LabelMask MaskDifference(const LabelMask& a, const LabelMask& b, uint8_t foreground) {
    return Combine(a, b, foreground, "MaskDifference",
                   [](bool x, bool y) { return x && !y; });
}

} // namespace Vol::Seg::Internal
