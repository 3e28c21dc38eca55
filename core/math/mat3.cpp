#include "mat3.hpp"

#include <boost/qvm/mat_operations.hpp>

#include <cmath>

namespace marionette::core::math {

Mat3x3 Mat3x3::translation(const Vec2& t) {
    Mat3x3 out;
    out.a.a[0][2] = t.x;
    out.a.a[1][2] = t.y;
    return out;
}

Mat3x3 Mat3x3::rotation(float radians) {
    const float c = std::cos(radians);
    const float s = std::sin(radians);
    Mat3x3 out;
    out.a.a[0][0] = c;
    out.a.a[0][1] = -s;
    out.a.a[1][0] = s;
    out.a.a[1][1] = c;
    return out;
}

Mat3x3 Mat3x3::scale(const Vec2& s) {
    Mat3x3 out;
    out.a.a[0][0] = s.x;
    out.a.a[1][1] = s.y;
    return out;
}

Mat3x3 multiply(const Mat3x3& a, const Mat3x3& b) {
    Mat3x3 out;
    out.a = boost::qvm::operator*(a.a, b.a);
    return out;
}

Mat3x3 inverse(const Mat3x3& m) {
    const float det = boost::qvm::determinant(m.a);
    if (det == 0.0f || !std::isfinite(det)) return Mat3x3{};
    Mat3x3 out;
    out.a = boost::qvm::inverse(m.a, det);
    return out;
}

Vec2 applyAffine(const Mat3x3& m, const Vec2& p) {
    Vec2 out;
    out.x = m.a.a[0][0] * p.x + m.a.a[0][1] * p.y + m.a.a[0][2];
    out.y = m.a.a[1][0] * p.x + m.a.a[1][1] * p.y + m.a.a[1][2];
    return out;
}

bool isFiniteMatrix(const Mat3x3& m) {
    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 3; ++c) {
            if (!std::isfinite(m.a.a[r][c])) return false;
        }
    }
    return true;
}

} // namespace marionette::core::math
