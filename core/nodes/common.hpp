#pragma once

#include "../math.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace marionette::core::nodes {

using math::Mat3x3;
using math::Transform2D;
using math::Vec2;
using math::Vec2Array;

// Index into the puppet's node arena.
using NodeId = uint32_t;
inline constexpr NodeId kInvalidNode = std::numeric_limits<NodeId>::max();

enum class NodeKind : uint8_t {
    Part,
    Composite,
    Mask,
};

enum class MaskingMode : uint8_t {
    Mask,
    DodgeMask,
};

inline bool isKnownNodeKind(NodeKind kind) {
    switch (kind) {
    case NodeKind::Part:
    case NodeKind::Composite:
    case NodeKind::Mask:
        return true;
    }
    return false;
}

inline const char* nodeKindName(NodeKind kind) {
    switch (kind) {
    case NodeKind::Part: return "Part";
    case NodeKind::Composite: return "Composite";
    case NodeKind::Mask: return "Mask";
    }
    return "Unknown";
}

inline std::optional<NodeKind> parseNodeKind(const std::string& value) {
    if (value == "Part") return NodeKind::Part;
    if (value == "Composite" || value == "Node") return NodeKind::Composite;
    if (value == "Mask") return NodeKind::Mask;
    return std::nullopt;
}

inline std::optional<MaskingMode> parseMaskingMode(const std::string& value) {
    if (value == "Mask" || value == "mask") return MaskingMode::Mask;
    if (value == "DodgeMask" || value == "dodge") return MaskingMode::DodgeMask;
    return std::nullopt;
}

inline bool hasMesh(NodeKind kind) {
    return kind == NodeKind::Part || kind == NodeKind::Mask;
}

} // namespace marionette::core::nodes
