#pragma once

#include "../nodes/common.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace marionette::core::render {

using nodes::Mat3x3;
using nodes::MaskingMode;
using nodes::NodeId;
using nodes::Vec2;
using nodes::Vec2Array;

// Everything a backend needs to draw one Part or Mask mesh for one frame.
struct PartDrawPacket {
    NodeId node{nodes::kInvalidNode};
    uint32_t uuid{0};
    std::string name{};
    bool isMask{false};
    float opacity{1.0f};
    float maskThreshold{0.0f};
    Mat3x3 modelMatrix{Mat3x3::identity()};
    Vec2 origin{};
    uint32_t vertexCount{0};
    uint32_t indexCount{0};
    // World space.
    Vec2Array vertices{};
    Vec2Array uvs{};
    std::vector<uint16_t> indices{};
};

enum class DrawGroupKind {
    Part,
    Masked,
};

// A plain Part group holds one packet in `parts`. A Masked group carries its mask source
// and the parts it clips in draw order.
struct DrawGroup {
    DrawGroupKind kind{DrawGroupKind::Part};
    std::vector<PartDrawPacket> parts{};
    PartDrawPacket mask{};
    MaskingMode mode{MaskingMode::Mask};
};

// Output of one Puppet::update. A self-contained value that stays valid after later updates.
struct FrameResult {
    uint64_t frame{0};
    float dt{0.0f};
    std::vector<DrawGroup> groups{};
    std::size_t physicsDivergences{0};

    std::size_t partCount() const {
        std::size_t n = 0;
        for (const auto& g : groups) n += g.parts.size();
        return n;
    }

    // nullptr when the part is not drawn this frame.
    const PartDrawPacket* findPart(uint32_t uuid) const {
        for (const auto& g : groups) {
            for (const auto& p : g.parts) {
                if (p.uuid == uuid) return &p;
            }
        }
        return nullptr;
    }
};

} // namespace marionette::core::render
