#pragma once

#include "mat3.hpp"

#include <sstream>
#include <string>

namespace marionette::core::math {

struct Transform2D {
    Vec2 translation{0.0f, 0.0f};
    float rotation{0.0f};
    Vec2 scale{1.0f, 1.0f};

    static Transform2D identity() { return Transform2D{}; }

    // translation * rotation * scale
    Mat3x3 matrix() const {
        return multiply(Mat3x3::translation(translation),
                        multiply(Mat3x3::rotation(rotation), Mat3x3::scale(scale)));
    }

    // Additive offset; scale deltas of zero leave the scale untouched.
    Transform2D calcOffset(const Transform2D& offset) const {
        Transform2D out = *this;
        out.translation = translation + offset.translation;
        out.rotation = rotation + offset.rotation;
        out.scale = scale + offset.scale;
        return out;
    }

    std::string toString() const {
        std::ostringstream oss;
        oss << "t=(" << translation.x << "," << translation.y << ") "
            << "r=" << rotation << " "
            << "s=(" << scale.x << "," << scale.y << ")";
        return oss.str();
    }
};

} // namespace marionette::core::math
