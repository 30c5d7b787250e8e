/**
 * @file Morphology.cpp
 * @brief Implementation of binary morphology (public API)
 */

#include <VolSeg/Morphology/Morphology.h>
#include <VolSeg/Internal/MorphBinary3d.h>
#include <VolSeg/Core/Exception.h>
#include <VolSeg/Core/Log.h>
#include <VolSeg/Core/Validate.h>
#include <VolSeg/Platform/Timer.h>

#include <string>
#include <utility>

namespace Vol::Seg::Morphology {

namespace {

SEShape ToPublicShape(Internal::StructElementShape shape) {
    switch (shape) {
        case Internal::StructElementShape::Ball:    return SEShape::Ball;
        case Internal::StructElementShape::Box:     return SEShape::Box;
        case Internal::StructElementShape::Cross:   return SEShape::Cross;
        case Internal::StructElementShape::Annulus: return SEShape::Annulus;
        case Internal::StructElementShape::Custom:  return SEShape::Custom;
    }
    return SEShape::Custom;
}

void RequireElement(const StructuringElement& se, const char* funcName) {
    if (se.Empty()) {
        throw InvalidArgumentException(std::string(funcName) +
                                       ": structuring element is empty");
    }
}

void LogDone(const char* op, const LabelMask& in, const LabelMask& out,
             const StructuringElement& se, const Platform::Timer& timer) {
    auto logger = Log::Get();
    if (logger->should_log(spdlog::level::debug)) {
        logger->debug("{}: {} -> {} voxels, element {} offsets, {:.2f} ms", op,
                      in.CountNonZero(), out.CountNonZero(), se.Size(), timer.ElapsedMs());
    }
}

} // anonymous namespace

// =============================================================================
// StructuringElement Implementation
// =============================================================================

StructuringElement::StructuringElement()
    : se_(Internal::StructElement3d::Box(0)) {}

StructuringElement::StructuringElement(Internal::StructElement3d se)
    : se_(std::move(se)) {}

StructuringElement StructuringElement::Ball(const Radius3& radius) {
    return StructuringElement(Internal::StructElement3d::Ball(radius));
}

StructuringElement StructuringElement::Box(const Radius3& radius) {
    return StructuringElement(Internal::StructElement3d::Box(radius));
}

StructuringElement StructuringElement::Cross(const Radius3& radius) {
    return StructuringElement(Internal::StructElement3d::Cross(radius));
}

StructuringElement StructuringElement::Annulus(const Radius3& radius, int32_t thickness,
                                               bool includeCenter) {
    return StructuringElement(
        Internal::StructElement3d::Annulus(radius, thickness, includeCenter));
}

StructuringElement StructuringElement::FromOffsets(const std::vector<Index3>& offsets) {
    return StructuringElement(Internal::StructElement3d::FromOffsets(offsets));
}

SEShape StructuringElement::Shape() const {
    return ToPublicShape(se_.Shape());
}

StructuringElement StructuringElement::Reflect() const {
    return StructuringElement(se_.Reflect());
}

StructuringElement MakeStructuringElement(SEShape shape, const Radius3& radius) {
    switch (shape) {
        case SEShape::Ball:    return StructuringElement::Ball(radius);
        case SEShape::Box:     return StructuringElement::Box(radius);
        case SEShape::Cross:   return StructuringElement::Cross(radius);
        case SEShape::Annulus: return StructuringElement::Annulus(radius);
        case SEShape::Custom:
            break;
    }
    throw InvalidArgumentException(
        "MakeStructuringElement: custom elements are built with FromOffsets");
}

StructuringElement MakeStructuringElement(SEShape shape, int32_t radius) {
    return MakeStructuringElement(shape, Radius3(radius));
}

// =============================================================================
// Binary Morphology
// =============================================================================

LabelMask Dilation(const LabelMask& mask, const StructuringElement& se, uint8_t foreground) {
    Validate::RequireMask(mask, "Dilation");
    RequireElement(se, "Dilation");

    Platform::Timer timer(true);
    LabelMask out = Internal::Dilate(mask, se.Element(), foreground);
    LogDone("Dilation", mask, out, se, timer);
    return out;
}

LabelMask Erosion(const LabelMask& mask, const StructuringElement& se, uint8_t foreground) {
    Validate::RequireMask(mask, "Erosion");
    RequireElement(se, "Erosion");

    Platform::Timer timer(true);
    LabelMask out = Internal::Erode(mask, se.Element(), foreground);
    LogDone("Erosion", mask, out, se, timer);
    return out;
}

LabelMask Opening(const LabelMask& mask, const StructuringElement& se, uint8_t foreground) {
    Validate::RequireMask(mask, "Opening");
    RequireElement(se, "Opening");

    Platform::Timer timer(true);
    LabelMask out = Internal::Opening(mask, se.Element(), foreground);
    LogDone("Opening", mask, out, se, timer);
    return out;
}

LabelMask Closing(const LabelMask& mask, const StructuringElement& se, uint8_t foreground) {
    Validate::RequireMask(mask, "Closing");
    RequireElement(se, "Closing");

    Platform::Timer timer(true);
    LabelMask out = Internal::Closing(mask, se.Element(), foreground);
    LogDone("Closing", mask, out, se, timer);
    return out;
}

LabelMask OpeningBall(const LabelMask& mask, int32_t radius, uint8_t foreground) {
    return Opening(mask, StructuringElement::Ball(Radius3(radius)), foreground);
}

LabelMask ClosingBall(const LabelMask& mask, int32_t radius, uint8_t foreground) {
    return Closing(mask, StructuringElement::Ball(Radius3(radius)), foreground);
}

// =============================================================================
// Mask Set Operations
// =============================================================================

LabelMask MaskUnion(const LabelMask& a, const LabelMask& b, uint8_t foreground) {
    return Internal::MaskUnion(a, b, foreground);
}

LabelMask MaskIntersection(const LabelMask& a, const LabelMask& b, uint8_t foreground) {
    return Internal::MaskIntersection(a, b, foreground);
}

LabelMask MaskDifference(const LabelMask& a, const LabelMask& b, uint8_t foreground) {
    return Internal::MaskDifference(a, b, foreground);
}

} // namespace Vol::Seg::Morphology
