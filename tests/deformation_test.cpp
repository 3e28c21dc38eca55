#include "../core/nodes/deformation_stack.hpp"

#include <cassert>
#include <cmath>

using namespace marionette::core::nodes;

namespace {

constexpr float kHalfPi = 1.57079632679f;

bool nearlyEqual(float a, float b, float eps = 1e-4f) {
    return std::fabs(a - b) <= eps;
}

MeshData makeMesh() {
    MeshData mesh;
    mesh.vertices = Vec2Array{{0, 0}, {4, 0}, {0, 4}};
    mesh.uvs = Vec2Array{{0, 0}, {1, 0}, {0, 1}};
    mesh.indices = {0, 1, 2};
    mesh.origin = Vec2{2.0f, 0.0f};
    return mesh;
}

void testPushSumsDisplacements() {
    auto mesh = makeMesh();
    DeformationStack stack(&mesh, 7);
    stack.preUpdate();
    assert(stack.pending().size() == 3);

    assert(stack.push(Vec2Array{{1, 0}, {0, 0}, {0, -1}}));
    assert(stack.push(Vec2Array{{1, 0}, {0, 2}, {0, 0}}));
    assert(!stack.push(Vec2Array{{5, 5}}));

    Vec2Array local;
    stack.update(local);
    assert(local.size() == 3);
    assert(local[0].x == 2.0f && local[0].y == 0.0f);
    assert(local[1].x == 4.0f && local[1].y == 2.0f);
    assert(local[2].x == 0.0f && local[2].y == 3.0f);
    // base mesh untouched
    assert(mesh.vertices[1].y == 0.0f);

    stack.preUpdate();
    stack.update(local);
    assert(local[0].x == 0.0f && local[1].y == 0.0f);
}

void testRotationAboutOrigin() {
    auto mesh = makeMesh();
    DeformationStack stack(&mesh);
    stack.preUpdate();
    stack.pushRotation(kHalfPi);
    assert(stack.rotation() == kHalfPi);

    Vec2Array local;
    stack.update(local);
    assert(nearlyEqual(local[0].x, 2.0f) && nearlyEqual(local[0].y, -2.0f));
    assert(nearlyEqual(local[1].x, 2.0f) && nearlyEqual(local[1].y, 2.0f));
    assert(nearlyEqual(local[2].x, -2.0f) && nearlyEqual(local[2].y, -2.0f));
}

void testRotationAppliesAfterDeform() {
    auto mesh = makeMesh();
    DeformationStack stack(&mesh);
    stack.preUpdate();
    stack.push(Vec2Array{{0, 0}, {2, 0}, {0, 0}});
    stack.pushRotation(kHalfPi);

    Vec2Array local;
    stack.update(local);
    // (6, 0) turned a quarter about (2, 0)
    assert(nearlyEqual(local[1].x, 2.0f) && nearlyEqual(local[1].y, 4.0f));
}

void testToWorld() {
    auto mesh = makeMesh();
    DeformationStack stack(&mesh);
    stack.preUpdate();
    Vec2Array local;
    stack.update(local);

    Vec2Array world;
    DeformationStack::toWorld(Mat3x3::translation(Vec2{10.0f, 5.0f}), local, world);
    assert(world.size() == 3);
    assert(world[0].x == 10.0f && world[0].y == 5.0f);
    assert(world[2].x == 10.0f && world[2].y == 9.0f);

    DeformationStack::toWorld(Mat3x3::scale(Vec2{2.0f, -1.0f}), local, world);
    assert(world[1].x == 8.0f && world[2].y == -4.0f);
}

void testWithoutMesh() {
    DeformationStack stack;
    stack.preUpdate();
    assert(!stack.push(Vec2Array{{1, 1}}));
    Vec2Array local{{1, 1}};
    stack.update(local);
    assert(local.empty());
}

} // namespace

int main() {
    testPushSumsDisplacements();
    testRotationAboutOrigin();
    testRotationAppliesAfterDeform();
    testToWorld();
    testWithoutMesh();
    return 0;
}
