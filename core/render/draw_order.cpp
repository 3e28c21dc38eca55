#include "draw_order.hpp"
#include "../debug_log.hpp"

#include <algorithm>
#include <unordered_map>
#include <utility>

namespace marionette::core::render {

std::vector<NodeId> resolveOrder(const NodeTree& tree) {
    std::vector<NodeId> out;
    for (auto id : tree.preOrder()) {
        if (nodes::hasMesh(tree.node(id).kind)) out.push_back(id);
    }
    std::stable_sort(out.begin(), out.end(), [&](NodeId a, NodeId b) {
        const float za = tree.effectiveZSort(a);
        const float zb = tree.effectiveZSort(b);
        if (za != zb) return za < zb;
        return tree.preOrderIndex(a) < tree.preOrderIndex(b);
    });
    return out;
}

std::vector<DrawGroupPlan> resolveGroups(const NodeTree& tree, const std::vector<NodeId>& order) {
    // part -> mask that clips it
    std::unordered_map<NodeId, NodeId> maskOf;
    for (auto id : order) {
        const auto& n = tree.node(id);
        if (n.kind != nodes::NodeKind::Mask) continue;
        for (auto uuid : n.mask.maskedParts) {
            auto part = tree.findByUuid(uuid);
            if (part != nodes::kInvalidNode) maskOf.emplace(part, id);
        }
    }

    std::vector<DrawGroupPlan> groups;
    std::unordered_map<NodeId, std::size_t> groupOfMask;
    for (auto id : order) {
        if (tree.node(id).kind != nodes::NodeKind::Part) continue;
        auto it = maskOf.find(id);
        if (it == maskOf.end()) {
            DrawGroupPlan plan;
            plan.kind = DrawGroupKind::Part;
            plan.parts.push_back(id);
            groups.push_back(std::move(plan));
            continue;
        }
        const NodeId mask = it->second;
        auto git = groupOfMask.find(mask);
        if (git == groupOfMask.end()) {
            DrawGroupPlan plan;
            plan.kind = DrawGroupKind::Masked;
            plan.mask = mask;
            plan.mode = tree.node(mask).mask.mode;
            groupOfMask.emplace(mask, groups.size());
            groups.push_back(std::move(plan));
            git = groupOfMask.find(mask);
        }
        groups[git->second].parts.push_back(id);
    }
    return groups;
}

DrawOrderResolver::DrawOrderResolver(const NodeTree& tree) {
    order_ = resolveOrder(tree);
    groups_ = resolveGroups(tree, order_);
    MRNT_DBG_LOG("[marionette][DrawOrder] drawables=%zu groups=%zu\n", order_.size(), groups_.size());
}

} // namespace marionette::core::render
