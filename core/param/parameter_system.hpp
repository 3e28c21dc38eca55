#pragma once

#include "parameter.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace marionette::core::param {

// Ordered set of a puppet's parameters. Membership is fixed once the puppet is built;
// only parameter values change afterwards.
class ParameterSystem {
public:
    ParameterSystem() = default;
    explicit ParameterSystem(std::vector<std::shared_ptr<Parameter>> params);

    const std::vector<std::shared_ptr<Parameter>>& parameters() const { return params_; }
    std::size_t size() const { return params_.size(); }

    std::shared_ptr<Parameter> find(const std::string& name) const;
    std::shared_ptr<Parameter> findByUuid(uint32_t uuid) const;

    // Return false when no parameter matches or the value is not finite.
    bool setValue(const std::string& name, float v);
    bool setValue(const std::string& name, float vx, float vy);
    bool setValue(uint32_t uuid, float v);
    bool setValue(uint32_t uuid, float vx, float vy);

    std::optional<Vec2> normalizedPosition(const std::string& name) const;
    std::optional<Vec2> normalizedPosition(uint32_t uuid) const;

    // Restores every parameter to its default value.
    void reset();

private:
    std::vector<std::shared_ptr<Parameter>> params_{};
};

} // namespace marionette::core::param
