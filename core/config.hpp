#pragma once

#include "serde.hpp"

#include <string>

namespace marionette::core {

struct RuntimeConfig {
    // Fixed integration step used to subdivide long frames.
    float physicsSubstep{0.01f};
    // Upper bound on a single update's dt; longer frames are truncated.
    float maxFrameDelta{10.0f};
    float gravity{9.8f};
    float pixelsPerMeter{1000.0f};
    // Angle/velocity magnitudes below this snap to exact rest.
    float restEpsilon{1e-7f};

    static RuntimeConfig defaults() { return RuntimeConfig{}; }

    // Overrides fields present in `data`; other keys are ignored.
    serde::SerdeException deserializeFromFghj(const serde::Fghj& data);
    // Applies MRNT_PHYSICS_SUBSTEP / MRNT_MAX_FRAME_DELTA when set.
    void applyEnvironment();
    bool valid() const;
};

// Defaults, then the JSON file (if non-empty path), then the environment.
RuntimeConfig inLoadRuntimeConfig(const std::string& path = {});

} // namespace marionette::core
