#pragma once

#include "node.hpp"
#include "phys.hpp"
#include "../config.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace marionette::core::nodes {

struct PhysicsState {
    NodeId node{kInvalidNode};
    uint32_t uuid{0};
    PhysicsParams params{};
    float angle{0.0f};
    float velocity{0.0f};
    // Pendulum tip in world space; persists across ticks to sense anchor motion.
    Vec2 bob{0.0f, 0.0f};
    Vec2 anchor{0.0f, 0.0f};
    // False until an anchor has been observed; the first observation seats the bob without a swing.
    bool anchorSet{false};
};

// Pendulum integration for every physics-enabled node. The solver's output is consumed
// by the frame after the tick that produced it.
class PhysicsSolver {
public:
    PhysicsSolver() = default;
    // `worldMatrices` supplies the initial anchors, one matrix per node. Nodes without an
    // entry take their anchor from the first tick.
    PhysicsSolver(const NodeTree& tree, const RuntimeConfig& config, const std::vector<Mat3x3>& worldMatrices);

    // Advances every pendulum by dt seconds. Anchors are read from `worldMatrices`
    // (the previous frame's world transforms).
    void tick(float dt, const std::vector<Mat3x3>& worldMatrices);

    // Output angle per node (0 for nodes without physics).
    const std::vector<float>& output() const { return output_; }
    const std::vector<PhysicsState>& states() const { return states_; }
    const PhysicsState* state(NodeId id) const;

    // Overwrites a node's angle/velocity, e.g. to inject an impulse. Returns false for a node without physics.
    bool perturb(NodeId id, float angle, float velocity);
    // Back to rest; anchors are re-seated by the next tick.
    void reset();

    std::size_t divergenceCount() const { return divergences_; }
    uint64_t tickCount() const { return ticks_; }
    uint64_t stepCount() const { return steps_; }

    // Non-finite dt becomes 0; the result lies in [0, maxFrameDelta].
    static float clampFrameDelta(float dt, float maxFrameDelta);

private:
    void step(PhysicsState& s, float h);
    void settle(PhysicsState& s) const;
    void recover(PhysicsState& s, const char* context);
    void placeBob(PhysicsState& s) const;
    void updateAnchor(PhysicsState& s, const Mat3x3& world);

    RuntimeConfig config_{};
    std::vector<PhysicsState> states_{};
    std::vector<std::size_t> stateIndex_{};
    std::vector<float> output_{};
    std::size_t divergences_{0};
    uint64_t ticks_{0};
    uint64_t steps_{0};
};

} // namespace marionette::core::nodes
