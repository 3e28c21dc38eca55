#include "deformation_stack.hpp"
#include "../debug_log.hpp"

#include <algorithm>
#include <cmath>

namespace marionette::core::nodes {

namespace {

[[maybe_unused]] float maxAbsVec2Array(const Vec2Array& arr) {
    float maxAbs = 0.0f;
    for (std::size_t i = 0; i < arr.size(); ++i) {
        maxAbs = std::max(maxAbs, std::max(std::fabs(arr.xAt(i)), std::fabs(arr.yAt(i))));
    }
    return maxAbs;
}

} // namespace

DeformationStack::DeformationStack(const MeshData* mesh, uint32_t uuid) : mesh_(mesh), uuid_(uuid) {
    if (mesh_) pending_.resize(mesh_->vertexCount());
}

void DeformationStack::preUpdate() {
    pending_.fill(Vec2{0.0f, 0.0f});
    rotation_ = 0.0f;
}

bool DeformationStack::push(const Vec2Array& deform) {
    if (deform.size() != pending_.size()) return false;
    pending_ += deform;
    MRNT_DBG_CODE({
        const float maxAbs = maxAbsVec2Array(pending_);
        if (maxAbs > 50.0f) {
            MRNT_DBG_LOG("[marionette][DeformationStack][StackLarge] uuid=%u maxAbs=%.6f\n", uuid_, maxAbs);
        }
    });
    return true;
}

void DeformationStack::update(Vec2Array& local) const {
    if (!mesh_) {
        local.clear();
        return;
    }
    const auto& base = mesh_->vertices;
    local.resize(base.size());
    for (std::size_t i = 0; i < base.size(); ++i) {
        local.xAt(i) = base.xAt(i) + pending_.xAt(i);
        local.yAt(i) = base.yAt(i) + pending_.yAt(i);
    }
    if (rotation_ == 0.0f) return;
    const float c = std::cos(rotation_);
    const float s = std::sin(rotation_);
    for (std::size_t i = 0; i < local.size(); ++i) {
        local.set(i, math::rotateAbout(local[i], mesh_->origin, c, s));
    }
}

void DeformationStack::toWorld(const Mat3x3& world, const Vec2Array& local, Vec2Array& out) {
    out.resize(local.size());
    for (std::size_t i = 0; i < local.size(); ++i) {
        out.set(i, math::applyAffine(world, local[i]));
    }
}

} // namespace marionette::core::nodes
