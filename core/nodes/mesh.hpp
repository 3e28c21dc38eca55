#pragma once

#include "common.hpp"
#include "../serde.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace marionette::core::nodes {

struct MeshData {
    Vec2Array vertices{};
    Vec2Array uvs{};
    std::vector<uint16_t> indices{};
    // Pivot in local space; physics rotation is applied about it.
    Vec2 origin{0.0f, 0.0f};

    std::size_t vertexCount() const { return vertices.size(); }
    // Empty when the mesh is usable; otherwise a description of the first defect.
    std::string validationError() const;

    // Reads "verts"/"uvs" as flat [x0, y0, x1, y1, ...] arrays, "indices" and "origin".
    serde::SerdeException deserializeFromFghj(const serde::Fghj& data);
};

} // namespace marionette::core::nodes
