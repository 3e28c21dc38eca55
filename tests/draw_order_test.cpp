#include "../core/render/draw_order.hpp"

#include <cassert>
#include <string>
#include <vector>

using namespace marionette::core::nodes;
using marionette::core::render::DrawGroupKind;
using marionette::core::render::DrawOrderResolver;
using marionette::core::render::resolveGroups;
using marionette::core::render::resolveOrder;

namespace {

Node makeNode(uint32_t uuid, const std::string& name, NodeKind kind, NodeId parent, float zsort) {
    Node n;
    n.uuid = uuid;
    n.name = name;
    n.kind = kind;
    n.parent = parent;
    n.zsort = zsort;
    if (hasMesh(kind)) {
        n.mesh.vertices = Vec2Array{{0, 0}, {1, 0}, {0, 1}};
        n.mesh.uvs = Vec2Array{{0, 0}, {1, 0}, {0, 1}};
        n.mesh.indices = {0, 1, 2};
    }
    return n;
}

// Root
//   Back (Part, -1)
//   Body (Composite, 2)
//     Eye (Part, 0)
//     EyeMask (Mask, 0) clips Eye and Iris
//     Iris (Part, 0.5)
//   Front (Part, 2)
//   EmptyMask (Mask, 5) clips nothing
NodeTree makeTree() {
    NodeTree tree;
    tree.addNode(makeNode(1, "Root", NodeKind::Composite, kInvalidNode, 0.0f));
    tree.addNode(makeNode(10, "Back", NodeKind::Part, 0, -1.0f));
    tree.addNode(makeNode(20, "Body", NodeKind::Composite, 0, 2.0f));
    tree.addNode(makeNode(21, "Eye", NodeKind::Part, 2, 0.0f));
    auto mask = makeNode(22, "EyeMask", NodeKind::Mask, 2, 0.0f);
    mask.mask.maskedParts = {21, 23};
    mask.mask.mode = MaskingMode::DodgeMask;
    tree.addNode(mask);
    tree.addNode(makeNode(23, "Iris", NodeKind::Part, 2, 0.5f));
    tree.addNode(makeNode(30, "Front", NodeKind::Part, 0, 2.0f));
    tree.addNode(makeNode(40, "EmptyMask", NodeKind::Mask, 0, 5.0f));
    tree.seal();
    return tree;
}

void testOrderByZSortThenPreOrder() {
    auto tree = makeTree();
    DrawOrderResolver resolver(tree);
    const std::vector<NodeId> expected{1, 3, 4, 6, 5, 7};
    assert(resolver.order() == expected);
    // composites are never drawn
    for (auto id : resolver.order()) assert(tree.node(id).kind != NodeKind::Composite);
}

void testOrderIsDeterministic() {
    auto tree = makeTree();
    const auto first = resolveOrder(tree);
    for (int i = 0; i < 10; ++i) assert(resolveOrder(tree) == first);

    auto other = makeTree();
    assert(resolveOrder(other) == first);
}

void testMaskGroups() {
    auto tree = makeTree();
    DrawOrderResolver resolver(tree);
    const auto& groups = resolver.groups();
    assert(groups.size() == 3);

    assert(groups[0].kind == DrawGroupKind::Part);
    assert(groups[0].parts.size() == 1 && groups[0].parts[0] == 1);

    // the masked group takes the slot of its first masked part
    assert(groups[1].kind == DrawGroupKind::Masked);
    assert(groups[1].mask == 4);
    assert(groups[1].mode == MaskingMode::DodgeMask);
    assert(groups[1].parts.size() == 2);
    assert(groups[1].parts[0] == 3 && groups[1].parts[1] == 5);

    assert(groups[2].kind == DrawGroupKind::Part);
    assert(groups[2].parts[0] == 6);

    for (const auto& g : groups) assert(g.mask != 7);
}

void testGroupsWithoutMasks() {
    NodeTree tree;
    tree.addNode(makeNode(1, "Root", NodeKind::Composite, kInvalidNode, 0.0f));
    tree.addNode(makeNode(2, "A", NodeKind::Part, 0, 1.0f));
    tree.addNode(makeNode(3, "B", NodeKind::Part, 0, 0.0f));
    tree.seal();

    const auto order = resolveOrder(tree);
    assert(order.size() == 2 && order[0] == 2 && order[1] == 1);
    const auto groups = resolveGroups(tree, order);
    assert(groups.size() == 2);
    assert(groups[0].parts[0] == 2);
    assert(groups[0].mask == kInvalidNode);
}

void testEmptyTreeOfDrawables() {
    NodeTree tree;
    tree.addNode(makeNode(1, "Root", NodeKind::Composite, kInvalidNode, 0.0f));
    tree.seal();
    DrawOrderResolver resolver(tree);
    assert(resolver.order().empty());
    assert(resolver.groups().empty());
}

} // namespace

int main() {
    testOrderByZSortThenPreOrder();
    testOrderIsDeterministic();
    testMaskGroups();
    testGroupsWithoutMasks();
    testEmptyTreeOfDrawables();
    return 0;
}
