#include "config.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace marionette::core {

namespace {

bool readEnvFloat(const char* name, float& out) {
    const char* v = std::getenv(name);
    if (!v || !*v) return false;
    char* end = nullptr;
    float parsed = std::strtof(v, &end);
    if (end == v || !std::isfinite(parsed)) {
        std::fprintf(stderr, "[marionette][Config] ignoring %s=%s (not a number)\n", name, v);
        return false;
    }
    out = parsed;
    return true;
}

} // namespace

serde::SerdeException RuntimeConfig::deserializeFromFghj(const serde::Fghj& data) {
    try {
        const serde::Fghj& phys = data.get_child("physics", data);
        physicsSubstep = phys.get<float>("substep", physicsSubstep);
        maxFrameDelta = phys.get<float>("max_frame_delta", maxFrameDelta);
        gravity = phys.get<float>("gravity", gravity);
        pixelsPerMeter = phys.get<float>("pixels_per_meter", pixelsPerMeter);
        pixelsPerMeter = phys.get<float>("pixelsPerMeter", pixelsPerMeter);
        restEpsilon = phys.get<float>("rest_epsilon", restEpsilon);
    } catch (const std::exception& e) {
        return std::string(e.what());
    }
    if (!valid()) return std::string("runtime config out of range");
    return std::nullopt;
}

void RuntimeConfig::applyEnvironment() {
    RuntimeConfig candidate = *this;
    bool touched = readEnvFloat("MRNT_PHYSICS_SUBSTEP", candidate.physicsSubstep);
    touched = readEnvFloat("MRNT_MAX_FRAME_DELTA", candidate.maxFrameDelta) || touched;
    if (!touched) return;
    if (!candidate.valid()) {
        std::fprintf(stderr, "[marionette][Config] environment overrides rejected (out of range)\n");
        return;
    }
    *this = candidate;
}

bool RuntimeConfig::valid() const {
    return std::isfinite(physicsSubstep) && physicsSubstep > 0.0f &&
           std::isfinite(maxFrameDelta) && maxFrameDelta >= 0.0f &&
           std::isfinite(gravity) &&
           std::isfinite(pixelsPerMeter) && pixelsPerMeter > 0.0f &&
           std::isfinite(restEpsilon) && restEpsilon >= 0.0f;
}

RuntimeConfig inLoadRuntimeConfig(const std::string& path) {
    RuntimeConfig config = RuntimeConfig::defaults();
    if (!path.empty()) {
        serde::Fghj pt;
        try {
            boost::property_tree::read_json(path, pt);
        } catch (const boost::property_tree::json_parser_error& e) {
            throw std::runtime_error("Failed to read runtime config: " + std::string(e.what()));
        }
        if (auto err = config.deserializeFromFghj(pt)) {
            throw std::runtime_error("Invalid runtime config " + path + ": " + *err);
        }
    }
    config.applyEnvironment();
    return config;
}

} // namespace marionette::core
