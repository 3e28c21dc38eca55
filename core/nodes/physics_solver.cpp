#include "physics_solver.hpp"
#include "../debug_log.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

namespace marionette::core::nodes {

namespace {

constexpr std::size_t kNoState = std::numeric_limits<std::size_t>::max();

Vec2 worldOrigin(const Mat3x3& m) {
    return Vec2{m[0][2], m[1][2]};
}

} // namespace

PhysicsSolver::PhysicsSolver(const NodeTree& tree, const RuntimeConfig& config, const std::vector<Mat3x3>& worldMatrices)
    : config_(config) {
    stateIndex_.assign(tree.size(), kNoState);
    output_.assign(tree.size(), 0.0f);
    for (auto id : tree.preOrder()) {
        const auto& n = tree.node(id);
        if (!n.physics) continue;
        PhysicsState s;
        s.node = id;
        s.uuid = n.uuid;
        s.params = *n.physics;
        if (id < worldMatrices.size() && math::isFinite(worldOrigin(worldMatrices[id]))) {
            s.anchor = worldOrigin(worldMatrices[id]);
            s.anchorSet = true;
        }
        placeBob(s);
        stateIndex_[id] = states_.size();
        states_.push_back(s);
    }
}

float PhysicsSolver::clampFrameDelta(float dt, float maxFrameDelta) {
    if (!std::isfinite(dt)) return 0.0f;
    return std::clamp(dt, 0.0f, std::max(0.0f, maxFrameDelta));
}

const PhysicsState* PhysicsSolver::state(NodeId id) const {
    if (id >= stateIndex_.size() || stateIndex_[id] == kNoState) return nullptr;
    return &states_[stateIndex_[id]];
}

bool PhysicsSolver::perturb(NodeId id, float angle, float velocity) {
    if (id >= stateIndex_.size() || stateIndex_[id] == kNoState) return false;
    auto& s = states_[stateIndex_[id]];
    s.angle = angle;
    s.velocity = velocity;
    placeBob(s);
    output_[id] = s.angle;
    return true;
}

void PhysicsSolver::reset() {
    for (auto& s : states_) {
        s.angle = 0.0f;
        s.velocity = 0.0f;
        s.anchorSet = false;
        placeBob(s);
        output_[s.node] = 0.0f;
    }
    divergences_ = 0;
}

void PhysicsSolver::placeBob(PhysicsState& s) const {
    const float len = s.params.length;
    s.bob = Vec2{s.anchor.x - std::sin(s.angle) * len, s.anchor.y + std::cos(s.angle) * len};
}

void PhysicsSolver::updateAnchor(PhysicsState& s, const Mat3x3& world) {
    const Vec2 anchor = worldOrigin(world);
    if (!guardFinite(s.uuid, "anchor", anchor)) return;
    if (!s.anchorSet) {
        s.anchor = anchor;
        s.anchorSet = true;
        placeBob(s);
        return;
    }
    if (anchor == s.anchor) return;
    s.anchor = anchor;
    const Vec2 dBob = s.bob - s.anchor;
    if (dBob.x == 0.0f && dBob.y == 0.0f) {
        placeBob(s);
        return;
    }
    s.angle = std::atan2(-dBob.x, dBob.y);
    placeBob(s);
}

void PhysicsSolver::settle(PhysicsState& s) const {
    if (std::fabs(s.angle) < config_.restEpsilon && std::fabs(s.velocity) < config_.restEpsilon) {
        s.angle = 0.0f;
        s.velocity = 0.0f;
    }
}

void PhysicsSolver::recover(PhysicsState& s, const char* context) {
    ++divergences_;
    std::fprintf(stderr, "[marionette][Physics] %s diverged on node %u (angle=%f velocity=%f); reset to rest (count=%zu)\n",
                 context, s.uuid, s.angle, s.velocity, divergences_);
    s.angle = 0.0f;
    s.velocity = 0.0f;
}

void PhysicsSolver::step(PhysicsState& s, float h) {
    const auto& p = s.params;
    const float kg = p.gravityScale * config_.gravity * config_.pixelsPerMeter / p.length;
    // Critical damping for the linearized system is 2 * sqrt(kg + restore). Without a
    // restoring force the damping acts on a unit frequency.
    const float stiffness = kg + p.restore;
    const float omega = stiffness > 0.0f ? std::sqrt(stiffness) : 1.0f;
    const float c = p.damping * 2.0f * omega;

    const float acc = -kg * std::sin(s.angle) - c * s.velocity - p.restore * s.angle;
    s.velocity += acc * h;
    s.angle += s.velocity * h;
    ++steps_;

    if (!std::isfinite(s.angle) || !std::isfinite(s.velocity)) {
        recover(s, "pendulum");
        return;
    }
    settle(s);
}

void PhysicsSolver::tick(float dt, const std::vector<Mat3x3>& worldMatrices) {
    const float frame = clampFrameDelta(dt, config_.maxFrameDelta);
    ++ticks_;
    for (auto& s : states_) {
        if (s.node < worldMatrices.size()) updateAnchor(s, worldMatrices[s.node]);
        if (!std::isfinite(s.angle) || !std::isfinite(s.velocity)) recover(s, "state");

        float h = frame;
        if (config_.physicsSubstep > 0.0f) {
            while (h > config_.physicsSubstep) {
                step(s, config_.physicsSubstep);
                h -= config_.physicsSubstep;
            }
        }
        if (h > 0.0f) step(s, h);

        placeBob(s);
        if (!math::isFinite(s.bob)) {
            recover(s, "bob");
            placeBob(s);
        }
        output_[s.node] = s.angle;
        if (tracePhysicsEnabled()) {
            std::fprintf(stderr, "[marionette][Physics] node=%u dt=%.6f angle=%.9f velocity=%.9f anchor=(%.3f,%.3f)\n",
                         s.uuid, frame, s.angle, s.velocity, s.anchor.x, s.anchor.y);
        }
    }
    MRNT_DBG_LOG("[marionette][Physics] tick=%llu steps=%llu\n", static_cast<unsigned long long>(ticks_),
                 static_cast<unsigned long long>(steps_));
}

} // namespace marionette::core::nodes
