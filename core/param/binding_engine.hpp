#pragma once

#include "binding.hpp"
#include "parameter_system.hpp"

#include <vector>

namespace marionette::core::param {

// Turns the current parameter values into per-node property offsets.
class BindingEngine {
public:
    BindingEngine() = default;
    explicit BindingEngine(const NodeTree& tree);

    // `out` is resized to one entry per node and overwritten. Deform lanes are sized to the
    // node's vertex count; nodes without a mesh get an empty lane.
    void evaluate(const ParameterSystem& params, std::vector<NodeOffsets>& out) const;

private:
    std::vector<std::size_t> vertexCounts_{};
};

} // namespace marionette::core::param
