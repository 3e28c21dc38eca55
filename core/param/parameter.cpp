#include "parameter.hpp"
#include "binding.hpp"
#include "../debug_log.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace marionette::core::param {

Parameter::Parameter(const std::string& n, bool vec2) : name(n), isVec2(vec2) {}

std::size_t Parameter::axisPointCount(std::size_t axis) const {
    if (axis == 0) return axisPoints[0].size();
    if (!isVec2) return 1;
    return axisPoints[1].size();
}

float Parameter::axisPointValue(std::size_t axis, std::size_t idx) const {
    const auto& arr = axisPoints[axis == 0 ? 0 : 1];
    if (idx < arr.size()) return arr[idx];
    return 0.0f;
}

Vec2 Parameter::clampToRange(const Vec2& v) const {
    return Vec2{std::clamp(v.x, min.x, max.x), isVec2 ? std::clamp(v.y, min.y, max.y) : v.y};
}

bool Parameter::setValue(float x) {
    return setValue(x, value.y);
}

bool Parameter::setValue(float x, float y) {
    if (!std::isfinite(x) || (isVec2 && !std::isfinite(y))) {
        if (traceParamBindingEnabled()) {
            std::fprintf(stderr, "[marionette][Param] ignoring non-finite value uuid=%u name=%s\n", uuid, name.c_str());
        }
        return false;
    }
    value = clampToRange(Vec2{x, isVec2 ? y : value.y});
    return true;
}

Vec2 Parameter::normalizedValue() const {
    const Vec2 v = clampToRange(value);
    const float rx = max.x - min.x;
    const float ry = max.y - min.y;
    float ox = (rx == 0.0f) ? 0.0f : (v.x - min.x) / rx;
    float oy = (!isVec2 || ry == 0.0f) ? 0.0f : (v.y - min.y) / ry;
    return Vec2{std::clamp(ox, 0.0f, 1.0f), std::clamp(oy, 0.0f, 1.0f)};
}

void Parameter::findOffset(const Vec2& offset, Vec2u& leftKeypoint, Vec2& subOffset) const {
    auto findAxis = [&](std::size_t axis, float val, std::size_t& left, float& frac) {
        const auto& arr = axisPoints[axis];
        if (arr.size() <= 1) {
            left = 0;
            frac = 0.0f;
            return;
        }
        left = 0;
        for (std::size_t i = 0; i + 1 < arr.size(); ++i) {
            left = i;
            if (val < arr[i + 1]) break;
        }
        const float lo = arr[left];
        const float hi = arr[left + 1];
        if (val <= lo) {
            frac = 0.0f;
        } else if (val >= hi) {
            frac = 1.0f;
        } else {
            frac = std::clamp((val - lo) / (hi - lo), 0.0f, 1.0f);
        }
    };

    findAxis(0, offset.x, leftKeypoint.x, subOffset.x);
    if (isVec2) {
        findAxis(1, offset.y, leftKeypoint.y, subOffset.y);
    } else {
        leftKeypoint.y = 0;
        subOffset.y = 0.0f;
    }
}

void Parameter::addBinding(const std::shared_ptr<ParameterBinding>& binding) {
    if (!binding) return;
    bindings.push_back(binding);
}

std::string Parameter::validationError() const {
    auto checkAxis = [&](std::size_t axis) -> std::string {
        const float lo = axis == 0 ? min.x : min.y;
        const float hi = axis == 0 ? max.x : max.y;
        if (!std::isfinite(lo) || !std::isfinite(hi) || lo > hi) {
            return "axis " + std::to_string(axis) + " range is invalid";
        }
        const auto& pts = axisPoints[axis];
        if (pts.empty()) return "axis " + std::to_string(axis) + " has no breakpoints";
        for (std::size_t i = 0; i < pts.size(); ++i) {
            if (!std::isfinite(pts[i]) || pts[i] < 0.0f || pts[i] > 1.0f) {
                return "axis " + std::to_string(axis) + " breakpoint outside [0, 1]";
            }
            if (i > 0 && !(pts[i - 1] < pts[i])) {
                return "axis " + std::to_string(axis) + " breakpoints are not strictly ascending";
            }
        }
        return {};
    };
    auto err = checkAxis(0);
    if (err.empty() && isVec2) err = checkAxis(1);
    if (err.empty() && (!std::isfinite(defaults.x) || !std::isfinite(defaults.y))) err = "defaults are not finite";
    return err;
}

serde::SerdeException Parameter::deserializeFromFghj(const serde::Fghj& data) {
    auto readVec2 = [](const serde::Fghj& node, Vec2& out) {
        if (node.empty()) {
            // scalar form for 1D parameters
            out.x = node.get_value<float>();
            return;
        }
        float dst[2]{out.x, out.y};
        serde::readFloats(node, dst, 2);
        out = Vec2{dst[0], dst[1]};
    };

    try {
        if (auto u = data.get_optional<uint32_t>("uuid")) uuid = *u;
        if (auto n = data.get_optional<std::string>("name")) name = *n;
        if (auto vec2 = data.get_optional<bool>("is_vec2")) isVec2 = *vec2;
        if (auto d = data.get_child_optional("defaults")) readVec2(*d, defaults);
        if (auto mn = data.get_child_optional("min")) readVec2(*mn, min);
        if (auto mx = data.get_child_optional("max")) readVec2(*mx, max);

        if (auto points = data.get_child_optional("axis_points")) {
            axisPoints[0].clear();
            axisPoints[1].clear();
            std::size_t axis = 0;
            for (const auto& axisNode : *points) {
                if (axis > 1) break;
                axisPoints[axis] = serde::readFloatList(axisNode.second);
                ++axis;
            }
        }
        if (!isVec2 || axisPoints[1].empty()) axisPoints[1] = {0.0f};
    } catch (const std::exception& ex) {
        return std::string(ex.what());
    }
    value = defaults;
    return std::nullopt;
}

} // namespace marionette::core::param
