#include "binding_engine.hpp"
#include "parameter.hpp"
#include "../debug_log.hpp"

#include <cstdio>

namespace marionette::core::param {

BindingEngine::BindingEngine(const NodeTree& tree) {
    vertexCounts_.resize(tree.size(), 0);
    for (std::size_t i = 0; i < tree.size(); ++i) {
        const auto& n = tree.node(static_cast<NodeId>(i));
        if (nodes::hasMesh(n.kind)) vertexCounts_[i] = n.mesh.vertexCount();
    }
}

void BindingEngine::evaluate(const ParameterSystem& params, std::vector<NodeOffsets>& out) const {
    out.resize(vertexCounts_.size());
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i].deform.resize(vertexCounts_[i]);
        out[i].clear();
    }

    for (const auto& p : params.parameters()) {
        if (!p || p->bindings.empty()) continue;
        Vec2u left{};
        Vec2 sub{};
        const auto position = p->normalizedValue();
        p->findOffset(position, left, sub);
        if (traceParamBindingEnabled()) {
            std::fprintf(stderr,
                         "[marionette][BindingEngine] param=%u:%s pos=(%.6f,%.6f) left=(%zu,%zu) sub=(%.6f,%.6f) bindings=%zu\n",
                         p->uuid, p->name.c_str(), position.x, position.y, left.x, left.y, sub.x, sub.y, p->bindings.size());
        }
        for (const auto& b : p->bindings) {
            if (b) b->apply(left, sub, out);
        }
    }
}

} // namespace marionette::core::param
