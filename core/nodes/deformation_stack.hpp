#pragma once

#include "mesh.hpp"

#include <cstdint>

namespace marionette::core::nodes {

// Per-mesh accumulator for one frame's displacement. Binding deforms are summed in
// push order; the physics rotation is applied after all of them.
class DeformationStack {
public:
    DeformationStack() = default;
    explicit DeformationStack(const MeshData* mesh, uint32_t uuid = 0);

    // Zeroes the pending displacement and rotation.
    void preUpdate();

    // Adds a per-vertex displacement. A length other than the mesh's vertex count is ignored.
    bool push(const Vec2Array& deform);
    // Rotation about the mesh origin, radians.
    void pushRotation(float angle) { rotation_ += angle; }

    const Vec2Array& pending() const { return pending_; }
    float rotation() const { return rotation_; }

    // Final local-space vertex positions.
    void update(Vec2Array& local) const;

    // Maps local positions through `world` into `out`.
    static void toWorld(const Mat3x3& world, const Vec2Array& local, Vec2Array& out);

private:
    const MeshData* mesh_{};
    uint32_t uuid_{0};
    Vec2Array pending_{};
    float rotation_{0.0f};
};

} // namespace marionette::core::nodes
