#pragma once

#include "math/mat3.hpp"
#include "math/transform.hpp"
#include "math/types.hpp"
#include "math/veca.hpp"

#include <cmath>

namespace marionette::core::math {

inline bool isFinite(const Vec2& v) {
    return std::isfinite(v.x) && std::isfinite(v.y);
}

// Rotates p about pivot by the given angle (radians, counter-clockwise in a y-up frame).
inline Vec2 rotateAbout(const Vec2& p, const Vec2& pivot, float c, float s) {
    const float dx = p.x - pivot.x;
    const float dy = p.y - pivot.y;
    return Vec2{pivot.x + dx * c - dy * s, pivot.y + dx * s + dy * c};
}

inline float clamp01(float v) {
    return v < 0.0f ? 0.0f : (v > 1.0f ? 1.0f : v);
}

} // namespace marionette::core::math
