#include <VolSeg/Internal/StructElement3d.h>
#include <VolSeg/Core/Exception.h>
#include <VolSeg/Core/Validate.h>

#include <algorithm>
#include <cstdlib>
#include <string>

namespace Vol::Seg::Internal {

// =============================================================================
// Implementation Details
// =============================================================================

struct StructElement3d::Impl {
    StructElementShape shape = StructElementShape::Custom;
    std::vector<Index3> offsets;  // Sorted (z, y, x), unique
    Radius3 extent;

    void Finalize() {
        std::sort(offsets.begin(), offsets.end());
        offsets.erase(std::unique(offsets.begin(), offsets.end()), offsets.end());
        extent = Radius3(0);
        for (const auto& o : offsets) {
            extent.x = std::max(extent.x, std::abs(o.x));
            extent.y = std::max(extent.y, std::abs(o.y));
            extent.z = std::max(extent.z, std::abs(o.z));
        }
    }
};

namespace {

// Ellipsoid membership; axes with radius 0 only admit d = 0
bool InEllipsoid(const Index3& d, int32_t rx, int32_t ry, int32_t rz) {
    if (rx < 0 || ry < 0 || rz < 0) return false;

    const int32_t dv[3] = {d.x, d.y, d.z};
    const int32_t rv[3] = {rx, ry, rz};
    double sum = 0.0;
    for (int axis = 0; axis < 3; ++axis) {
        if (rv[axis] == 0) {
            if (dv[axis] != 0) return false;
            continue;
        }
        double t = static_cast<double>(dv[axis]) / static_cast<double>(rv[axis]);
        sum += t * t;
    }
    return sum <= 1.0;
}

template<typename Pred>
std::vector<Index3> CollectInBox(const Radius3& r, Pred&& pred) {
    std::vector<Index3> offsets;
    for (int32_t z = -r.z; z <= r.z; ++z) {
        for (int32_t y = -r.y; y <= r.y; ++y) {
            for (int32_t x = -r.x; x <= r.x; ++x) {
                Index3 d(x, y, z);
                if (pred(d)) offsets.push_back(d);
            }
        }
    }
    return offsets;
}

} // anonymous namespace

// =============================================================================
// Constructors
// =============================================================================

StructElement3d::StructElement3d() : impl_(std::make_unique<Impl>()) {}

StructElement3d::StructElement3d(const StructElement3d& other)
    : impl_(std::make_unique<Impl>(*other.impl_)) {}

StructElement3d::StructElement3d(StructElement3d&& other) noexcept = default;

StructElement3d::~StructElement3d() = default;

StructElement3d& StructElement3d::operator=(const StructElement3d& other) {
    if (this != &other) {
        impl_ = std::make_unique<Impl>(*other.impl_);
    }
    return *this;
}

StructElement3d& StructElement3d::operator=(StructElement3d&& other) noexcept = default;

// =============================================================================
// Factory Methods
// =============================================================================

StructElement3d StructElement3d::Ball(const Radius3& radius) {
    Validate::RequireRadius(radius, "StructElement3d::Ball");

    StructElement3d se;
    se.impl_->shape = StructElementShape::Ball;
    se.impl_->offsets = CollectInBox(radius, [&](const Index3& d) {
        return InEllipsoid(d, radius.x, radius.y, radius.z);
    });
    se.impl_->Finalize();
    return se;
}

StructElement3d StructElement3d::Box(const Radius3& radius) {
    Validate::RequireRadius(radius, "StructElement3d::Box");

    StructElement3d se;
    se.impl_->shape = StructElementShape::Box;
    se.impl_->offsets = CollectInBox(radius, [](const Index3&) { return true; });
    se.impl_->Finalize();
    return se;
}

StructElement3d StructElement3d::Cross(const Radius3& radius) {
    Validate::RequireRadius(radius, "StructElement3d::Cross");

    StructElement3d se;
    se.impl_->shape = StructElementShape::Cross;
    se.impl_->offsets = CollectInBox(radius, [](const Index3& d) {
        int nonZero = (d.x != 0) + (d.y != 0) + (d.z != 0);
        return nonZero <= 1;
    });
    se.impl_->Finalize();
    return se;
}

StructElement3d StructElement3d::Annulus(const Radius3& radius, int32_t thickness,
                                         bool includeCenter) {
    Validate::RequireRadius(radius, "StructElement3d::Annulus");
    if (thickness < 1) {
        throw InvalidArgumentException("StructElement3d::Annulus: thickness must be >= 1, got " +
                                       std::to_string(thickness));
    }

    const Radius3 inner(radius.x - thickness, radius.y - thickness, radius.z - thickness);

    StructElement3d se;
    se.impl_->shape = StructElementShape::Annulus;
    se.impl_->offsets = CollectInBox(radius, [&](const Index3& d) {
        if (includeCenter && d == Index3(0, 0, 0)) return true;
        return InEllipsoid(d, radius.x, radius.y, radius.z) &&
               !InEllipsoid(d, inner.x, inner.y, inner.z);
    });
    se.impl_->Finalize();
    return se;
}

StructElement3d StructElement3d::FromOffsets(const std::vector<Index3>& offsets) {
    StructElement3d se;
    se.impl_->shape = StructElementShape::Custom;
    se.impl_->offsets = offsets;
    se.impl_->Finalize();
    return se;
}

// =============================================================================
// Properties
// =============================================================================

bool StructElement3d::Empty() const {
    return impl_->offsets.empty();
}

size_t StructElement3d::Size() const {
    return impl_->offsets.size();
}

StructElementShape StructElement3d::Shape() const {
    return impl_->shape;
}

Radius3 StructElement3d::Extent() const {
    return impl_->extent;
}

bool StructElement3d::Contains(const Index3& offset) const {
    return std::binary_search(impl_->offsets.begin(), impl_->offsets.end(), offset);
}

bool StructElement3d::IsSymmetric() const {
    for (const auto& o : impl_->offsets) {
        if (!Contains(-o)) return false;
    }
    return true;
}

const std::vector<Index3>& StructElement3d::Offsets() const {
    return impl_->offsets;
}

// =============================================================================
// Transformations
// =============================================================================

StructElement3d StructElement3d::Reflect() const {
    StructElement3d se;
    se.impl_->shape = impl_->shape;
    se.impl_->offsets.reserve(impl_->offsets.size());
    for (const auto& o : impl_->offsets) {
        se.impl_->offsets.push_back(-o);
    }
    se.impl_->Finalize();
    return se;
}

} // namespace Vol::Seg::Internal
