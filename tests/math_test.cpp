#include "../core/math.hpp"

#include <cassert>
#include <cmath>
#include <numbers>
#include <vector>

using marionette::core::math::Mat3x3;
using marionette::core::math::Transform2D;
using marionette::core::math::Vec2;
using marionette::core::math::Vec2Array;

namespace {

bool nearlyEqual(float a, float b, float eps = 1e-5f) {
    return std::fabs(a - b) <= eps;
}

void testSoALayout() {
    Vec2Array arr;
    arr.push_back(Vec2{1.0f, 10.0f});
    arr.push_back(Vec2{2.0f, 20.0f});
    arr.push_back(Vec2{3.0f, 30.0f});

    assert(arr.size() == 3);
    assert(arr.x.size() == 3 && arr.y.size() == 3);
    assert(arr.x[1] == 2.0f);
    assert(arr.y[2] == 30.0f);

    arr.set(1, Vec2{7.0f, 70.0f});
    assert(arr.at(1) == (Vec2{7.0f, 70.0f}));

    auto copy = Vec2Array::fromArray(arr.toArray());
    assert(copy.size() == arr.size());
    assert(copy.at(2) == arr.at(2));
}

void testPlusMinusMul() {
    Vec2Array lhs;
    Vec2Array rhs;
    for (int i = 0; i < 8; ++i) {
        lhs.push_back(Vec2{static_cast<float>(i), static_cast<float>(i + 100)});
        rhs.push_back(Vec2{1.0f, 2.0f});
    }

    lhs += rhs;
    for (int i = 0; i < 8; ++i) {
        auto v = lhs.at(static_cast<std::size_t>(i));
        assert(v.x == static_cast<float>(i + 1));
        assert(v.y == static_cast<float>(i + 102));
    }

    lhs -= rhs;
    lhs *= 2.0f;
    for (int i = 0; i < 8; ++i) {
        auto v = lhs.at(static_cast<std::size_t>(i));
        assert(v.x == static_cast<float>(i * 2));
        assert(v.y == static_cast<float>((i + 100) * 2));
    }

    Vec2Array zeros(4);
    zeros.fill(Vec2{0.5f, -0.5f});
    assert(zeros.at(3) == (Vec2{0.5f, -0.5f}));
}

void testTransformComposition() {
    Transform2D t;
    t.translation = Vec2{10.0f, 5.0f};
    t.rotation = std::numbers::pi_v<float> / 2.0f;
    t.scale = Vec2{2.0f, 2.0f};

    // scale, then rotate, then translate
    auto p = marionette::core::math::applyAffine(t.matrix(), Vec2{1.0f, 0.0f});
    assert(nearlyEqual(p.x, 10.0f));
    assert(nearlyEqual(p.y, 7.0f));

    auto identity = Transform2D::identity().matrix();
    auto q = marionette::core::math::applyAffine(identity, Vec2{3.0f, -4.0f});
    assert(q.x == 3.0f && q.y == -4.0f);
}

void testCalcOffsetIsAdditive() {
    Transform2D base;
    base.translation = Vec2{1.0f, 2.0f};
    base.rotation = 0.25f;
    base.scale = Vec2{1.0f, 1.0f};

    Transform2D offset;
    offset.translation = Vec2{0.5f, -1.0f};
    offset.rotation = 0.25f;
    offset.scale = Vec2{0.0f, 0.0f};

    auto out = base.calcOffset(offset);
    assert(out.translation == (Vec2{1.5f, 1.0f}));
    assert(out.rotation == 0.5f);
    assert(out.scale == (Vec2{1.0f, 1.0f}));
}

void testInverseAndSingular() {
    Transform2D t;
    t.translation = Vec2{3.0f, -2.0f};
    t.rotation = 0.7f;
    t.scale = Vec2{2.0f, 0.5f};
    auto m = t.matrix();
    auto inv = marionette::core::math::inverse(m);
    auto round = marionette::core::math::multiply(m, inv);
    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 3; ++c) {
            assert(nearlyEqual(round[r][c], r == c ? 1.0f : 0.0f));
        }
    }

    auto singular = Mat3x3::scale(Vec2{0.0f, 1.0f});
    auto fallback = marionette::core::math::inverse(singular);
    assert(fallback[0][0] == 1.0f && fallback[1][1] == 1.0f && fallback[0][2] == 0.0f);

    Mat3x3 bad;
    bad[0][2] = NAN;
    assert(!marionette::core::math::isFiniteMatrix(bad));
    assert(marionette::core::math::isFiniteMatrix(m));
}

void testRotateAbout() {
    const float half = std::numbers::pi_v<float> / 2.0f;
    auto p = marionette::core::math::rotateAbout(Vec2{2.0f, 1.0f}, Vec2{1.0f, 1.0f}, std::cos(half), std::sin(half));
    assert(nearlyEqual(p.x, 1.0f));
    assert(nearlyEqual(p.y, 2.0f));
    assert(marionette::core::math::clamp01(1.5f) == 1.0f);
    assert(marionette::core::math::clamp01(-0.5f) == 0.0f);
}

} // namespace

int main() {
    testSoALayout();
    testPlusMinusMul();
    testTransformComposition();
    testCalcOffsetIsAdditive();
    testInverseAndSingular();
    testRotateAbout();
    return 0;
}
