#include "parameter_system.hpp"
#include "../debug_log.hpp"

#include <cstdio>
#include <utility>

namespace marionette::core::param {

ParameterSystem::ParameterSystem(std::vector<std::shared_ptr<Parameter>> params) : params_(std::move(params)) {}

std::shared_ptr<Parameter> ParameterSystem::find(const std::string& name) const {
    for (const auto& p : params_) {
        if (p && p->name == name) return p;
    }
    return nullptr;
}

std::shared_ptr<Parameter> ParameterSystem::findByUuid(uint32_t uuid) const {
    for (const auto& p : params_) {
        if (p && p->uuid == uuid) return p;
    }
    return nullptr;
}

namespace {

bool assign(const std::shared_ptr<Parameter>& p, float vx, float vy, bool twoAxis) {
    if (!p) return false;
    const bool ok = twoAxis ? p->setValue(vx, vy) : p->setValue(vx);
    if (ok && traceParamBindingEnabled()) {
        std::fprintf(stderr, "[marionette][Param] set uuid=%u name=%s value=(%.6f,%.6f)\n", p->uuid, p->name.c_str(),
                     p->value.x, p->value.y);
    }
    return ok;
}

} // namespace

bool ParameterSystem::setValue(const std::string& name, float v) { return assign(find(name), v, 0.0f, false); }

bool ParameterSystem::setValue(const std::string& name, float vx, float vy) { return assign(find(name), vx, vy, true); }

bool ParameterSystem::setValue(uint32_t uuid, float v) { return assign(findByUuid(uuid), v, 0.0f, false); }

bool ParameterSystem::setValue(uint32_t uuid, float vx, float vy) { return assign(findByUuid(uuid), vx, vy, true); }

std::optional<Vec2> ParameterSystem::normalizedPosition(const std::string& name) const {
    auto p = find(name);
    if (!p) return std::nullopt;
    return p->normalizedValue();
}

std::optional<Vec2> ParameterSystem::normalizedPosition(uint32_t uuid) const {
    auto p = findByUuid(uuid);
    if (!p) return std::nullopt;
    return p->normalizedValue();
}

void ParameterSystem::reset() {
    for (auto& p : params_) {
        if (p) p->reset();
    }
}

} // namespace marionette::core::param
