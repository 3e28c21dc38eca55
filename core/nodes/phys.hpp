#pragma once

#include "common.hpp"
#include "../serde.hpp"

#include <cstddef>
#include <string>

namespace marionette::core::nodes {

// Static pendulum description of a physics-enabled node.
struct PhysicsParams {
    // Pendulum arm length in model units (pixels).
    float length{100.0f};
    float gravityScale{1.0f};
    // Fraction of critical damping; 1 settles without overshoot.
    float damping{0.5f};
    // Spring stiffness pulling the angle back to 0.
    float restore{0.0f};

    std::string validationError() const;
    serde::SerdeException deserializeFromFghj(const serde::Fghj& data);
};

// Finite check used by the solver; a failed check is reported on stderr with the node's uuid.
bool guardFinite(uint32_t uuid, const char* context, const Vec2& value);

} // namespace marionette::core::nodes
