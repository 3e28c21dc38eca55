#pragma once

#include "types.hpp"

#include <boost/qvm/mat.hpp>

namespace marionette::core::math {

// Row-major 2D affine matrix; the last row is always (0, 0, 1).
struct Mat3x3 {
    boost::qvm::mat<float, 3, 3> a{{
        {1, 0, 0},
        {0, 1, 0},
        {0, 0, 1},
    }};

    float* operator[](int r) { return a.a[r]; }
    const float* operator[](int r) const { return a.a[r]; }

    static Mat3x3 identity() { return Mat3x3{}; }
    static Mat3x3 translation(const Vec2& t);
    static Mat3x3 rotation(float radians);
    static Mat3x3 scale(const Vec2& s);
};

Mat3x3 multiply(const Mat3x3& a, const Mat3x3& b);
// Returns identity for a singular matrix.
Mat3x3 inverse(const Mat3x3& m);
Vec2 applyAffine(const Mat3x3& m, const Vec2& p);
bool isFiniteMatrix(const Mat3x3& m);

} // namespace marionette::core::math
