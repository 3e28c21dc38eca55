#pragma once

#include "../nodes/common.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace marionette::core::param {

using math::Vec2;
using math::Vec2Array;

enum class InterpolateMode {
    Nearest,
    Linear,
    Cubic,
    Step,
};

inline std::optional<InterpolateMode> parseInterpolateMode(const std::string& value) {
    if (value == "Nearest" || value == "nearest") return InterpolateMode::Nearest;
    if (value == "Linear" || value == "linear") return InterpolateMode::Linear;
    if (value == "Cubic" || value == "cubic") return InterpolateMode::Cubic;
    if (value == "Step" || value == "step") return InterpolateMode::Step;
    return std::nullopt;
}

// Per-vertex displacement stored in a deform keypoint.
struct DeformSlot {
    Vec2Array vertexOffsets{};
};

inline DeformSlot operator+(const DeformSlot& a, const DeformSlot& b) {
    DeformSlot out = a;
    out.vertexOffsets += b.vertexOffsets;
    return out;
}

inline DeformSlot operator-(const DeformSlot& a, const DeformSlot& b) {
    DeformSlot out = a;
    out.vertexOffsets -= b.vertexOffsets;
    return out;
}

inline DeformSlot operator*(const DeformSlot& a, float s) {
    DeformSlot out = a;
    out.vertexOffsets *= s;
    return out;
}

// Endpoints are returned unchanged so that breakpoints reproduce stored values exactly.
inline float lerpValue(float a, float b, float t) {
    if (t <= 0.0f) return a;
    if (t >= 1.0f) return b;
    return a * (1.0f - t) + b * t;
}

inline Vec2 lerpValue(const Vec2& a, const Vec2& b, float t) {
    return Vec2{lerpValue(a.x, b.x, t), lerpValue(a.y, b.y, t)};
}

inline DeformSlot lerpValue(const DeformSlot& a, const DeformSlot& b, float t) {
    if (a.vertexOffsets.size() != b.vertexOffsets.size()) {
        throw std::logic_error("deform slots differ in length");
    }
    if (t <= 0.0f) return a;
    if (t >= 1.0f) return b;
    DeformSlot out;
    out.vertexOffsets = Vec2Array(a.vertexOffsets.size());
    for (std::size_t i = 0; i < a.vertexOffsets.size(); ++i) {
        out.vertexOffsets.x[i] = lerpValue(a.vertexOffsets.x[i], b.vertexOffsets.x[i], t);
        out.vertexOffsets.y[i] = lerpValue(a.vertexOffsets.y[i], b.vertexOffsets.y[i], t);
    }
    return out;
}

// Catmull-Rom segment between p1 (t = 0) and p2 (t = 1).
template <typename T>
inline T cubicValue(const T& p0, const T& p1, const T& p2, const T& p3, float t) {
    if (t <= 0.0f) return p1;
    if (t >= 1.0f) return p2;
    const float t2 = t * t;
    const float t3 = t2 * t;
    const T a = p1 * 2.0f;
    const T b = (p2 - p0) * t;
    const T c = (p0 * 2.0f - p1 * 5.0f + p2 * 4.0f - p3) * t2;
    const T d = (p1 * 3.0f - p2 * 3.0f + p3 - p0) * t3;
    return (a + b + c + d) * 0.5f;
}

} // namespace marionette::core::param
