#include "mesh.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace marionette::core::nodes {

namespace {

void readFlatVec2(const serde::Fghj& node, Vec2Array& out) {
    out.clear();
    if (node.size() % 2 != 0) {
        throw std::runtime_error("flat coordinate array has odd length " + std::to_string(node.size()));
    }
    for (auto it = node.begin(); it != node.end();) {
        float x = it->second.get_value<float>();
        ++it;
        float y = it->second.get_value<float>();
        ++it;
        out.push_back(Vec2{x, y});
    }
}

} // namespace

std::string MeshData::validationError() const {
    if (vertices.empty()) return "mesh has no vertices";
    if (indices.size() % 3 != 0) return "triangle index count is not a multiple of 3";
    for (auto idx : indices) {
        if (static_cast<std::size_t>(idx) >= vertices.size()) {
            return "triangle index " + std::to_string(idx) + " out of range";
        }
    }
    for (std::size_t i = 0; i < vertices.size(); ++i) {
        if (!std::isfinite(vertices.xAt(i)) || !std::isfinite(vertices.yAt(i))) {
            return "vertex " + std::to_string(i) + " is not finite";
        }
    }
    if (!math::isFinite(origin)) return "origin is not finite";
    return {};
}

serde::SerdeException MeshData::deserializeFromFghj(const serde::Fghj& data) {
    vertices.clear();
    uvs.clear();
    indices.clear();
    origin = Vec2{0, 0};
    try {
        if (auto verts = data.get_child_optional("verts")) readFlatVec2(*verts, vertices);
        if (auto u = data.get_child_optional("uvs")) readFlatVec2(*u, uvs);
        if (auto idx = data.get_child_optional("indices")) indices = serde::readList<uint16_t>(*idx);
        if (auto o = data.get_child_optional("origin")) {
            float dst[2]{origin.x, origin.y};
            serde::readFloats(*o, dst, 2);
            origin = Vec2{dst[0], dst[1]};
        }
    } catch (const std::exception& e) {
        return std::string(e.what());
    }
    return std::nullopt;
}

} // namespace marionette::core::nodes
