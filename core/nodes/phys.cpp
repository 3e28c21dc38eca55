#include "phys.hpp"

#include <cmath>
#include <cstdio>

namespace marionette::core::nodes {

std::string PhysicsParams::validationError() const {
    if (!std::isfinite(length) || length <= 0.0f) return "physics length must be positive";
    if (!std::isfinite(gravityScale)) return "physics gravity scale is not finite";
    if (!std::isfinite(damping) || damping < 0.0f) return "physics damping must be finite and non-negative";
    if (!std::isfinite(restore) || restore < 0.0f) return "physics restore must be finite and non-negative";
    return {};
}

serde::SerdeException PhysicsParams::deserializeFromFghj(const serde::Fghj& data) {
    try {
        length = data.get<float>("length", length);
        gravityScale = data.get<float>("gravity", gravityScale);
        if (auto g = data.get_optional<float>("gravity_scale")) gravityScale = *g;
        damping = data.get<float>("damping", damping);
        if (auto d = data.get_optional<float>("angle_damping")) damping = *d;
        restore = data.get<float>("restore", restore);
    } catch (const std::exception& ex) {
        return std::string(ex.what());
    }
    return std::nullopt;
}

bool guardFinite(uint32_t uuid, const char* context, const Vec2& value) {
    if (math::isFinite(value)) return true;
    std::fprintf(stderr, "[marionette][Physics] non-finite %s on node %u\n", context, uuid);
    return false;
}

} // namespace marionette::core::nodes
