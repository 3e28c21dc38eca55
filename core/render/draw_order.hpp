#pragma once

#include "part_draw_packet.hpp"
#include "../nodes/node.hpp"

#include <vector>

namespace marionette::core::render {

using nodes::NodeTree;

struct DrawGroupPlan {
    DrawGroupKind kind{DrawGroupKind::Part};
    NodeId mask{nodes::kInvalidNode};
    MaskingMode mode{MaskingMode::Mask};
    std::vector<NodeId> parts{};
};

// Compositing order over Parts and Masks: effective zsort ascending, ties broken by
// pre-order index. zsort is static, so the order is fixed at construction.
class DrawOrderResolver {
public:
    DrawOrderResolver() = default;
    explicit DrawOrderResolver(const NodeTree& tree);

    // Every Part and Mask in compositing order.
    const std::vector<NodeId>& order() const { return order_; }
    // Order folded into draw groups; a mask group sits at its first masked part.
    const std::vector<DrawGroupPlan>& groups() const { return groups_; }

private:
    std::vector<NodeId> order_{};
    std::vector<DrawGroupPlan> groups_{};
};

std::vector<NodeId> resolveOrder(const NodeTree& tree);
std::vector<DrawGroupPlan> resolveGroups(const NodeTree& tree, const std::vector<NodeId>& order);

} // namespace marionette::core::render
