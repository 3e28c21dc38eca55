#pragma once

#include "values.hpp"
#include "../nodes/node.hpp"
#include "../serde.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace marionette::core::param {

using nodes::NodeId;
using nodes::NodeTree;

class Parameter;
struct Vec2u;

enum class BindingProperty : uint8_t {
    Translation,
    Rotation,
    Scale,
    Opacity,
    VertexDeform,
};

const char* bindingPropertyName(BindingProperty property);

struct BindTarget {
    uint32_t uuid{0};
    // Arena index, resolved by finalize().
    NodeId node{nodes::kInvalidNode};
    BindingProperty property{BindingProperty::Translation};
};

// Summed binding contributions for one node in one frame.
// All fields are offsets from the node's static local state.
struct NodeOffsets {
    Vec2 translation{0.0f, 0.0f};
    float rotation{0.0f};
    Vec2 scale{0.0f, 0.0f};
    float opacity{0.0f};
    Vec2Array deform{};
    bool hasDeform{false};

    void clear() {
        translation = Vec2{0.0f, 0.0f};
        rotation = 0.0f;
        scale = Vec2{0.0f, 0.0f};
        opacity = 0.0f;
        deform.fill(Vec2{0.0f, 0.0f});
        hasDeform = false;
    }
};

class ParameterBinding {
public:
    virtual ~ParameterBinding() = default;

    // Resolves the target node and checks the value grid against it. Throws PuppetLoadError.
    virtual void finalize(const NodeTree& tree) = 0;

    // Adds the interpolated value at (leftKeypoint, offset) into the target's slot of `out`.
    virtual void apply(const Vec2u& leftKeypoint, const Vec2& offset, std::vector<NodeOffsets>& out) const = 0;

    virtual void clear() = 0;
    virtual bool isSet(const Vec2u& index) const = 0;
    virtual uint32_t getSetCount() const = 0;
    virtual void reInterpolate() = 0;

    virtual InterpolateMode interpolateMode() const = 0;
    virtual void setInterpolateMode(InterpolateMode mode) = 0;
    virtual const BindTarget& getTarget() const = 0;
    virtual uint32_t getNodeUUID() const = 0;

    virtual serde::SerdeException deserializeFromFghj(const serde::Fghj& data) = 0;
};

// Maps a serialized binding name ("deform", "transform.t.x", ...) to the property and the
// component it drives (0 = x / scalar, 1 = y, -1 = both).
struct BindingName {
    BindingProperty property{BindingProperty::Translation};
    int component{-1};
};
std::optional<BindingName> parseBindingName(const std::string& name);

// Creates an empty binding of the type matching `name`; nullptr for an unknown name.
std::shared_ptr<ParameterBinding> makeBinding(Parameter* parameter, uint32_t nodeUuid, const std::string& name);

} // namespace marionette::core::param
