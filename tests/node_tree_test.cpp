#include "../core/errors.hpp"
#include "../core/nodes/node.hpp"

#include <cassert>
#include <cmath>
#include <stdexcept>
#include <string>

using marionette::core::LoadErrorKind;
using marionette::core::PuppetLoadError;
using namespace marionette::core::nodes;

namespace {

bool nearlyEqual(float a, float b, float eps = 1e-5f) {
    return std::fabs(a - b) <= eps;
}

Node makeNode(uint32_t uuid, const std::string& name, NodeKind kind, NodeId parent) {
    Node n;
    n.uuid = uuid;
    n.name = name;
    n.kind = kind;
    n.parent = parent;
    if (hasMesh(kind)) {
        n.mesh.vertices = Vec2Array{{0, 0}, {1, 0}, {0, 1}};
        n.mesh.uvs = Vec2Array{{0, 0}, {1, 0}, {0, 1}};
        n.mesh.indices = {0, 1, 2};
    }
    return n;
}

template <typename Fn>
LoadErrorKind expectLoadError(Fn&& fn) {
    try {
        fn();
    } catch (const PuppetLoadError& e) {
        return e.kind();
    }
    assert(false && "expected PuppetLoadError");
    return LoadErrorKind::MalformedStructure;
}

LoadErrorKind sealError(NodeTree& tree) {
    return expectLoadError([&] { tree.seal(); });
}

// Root
//   Body (zsort 1)
//     Arm (Part, zsort 0.5)
//   Head (Part, zsort -1)
NodeTree makeSampleTree() {
    NodeTree tree;
    tree.addNode(makeNode(1, "Root", NodeKind::Composite, kInvalidNode));
    auto body = makeNode(2, "Body", NodeKind::Composite, 0);
    body.zsort = 1.0f;
    body.localTransform.translation = Vec2{10.0f, 0.0f};
    tree.addNode(body);
    auto arm = makeNode(3, "Arm", NodeKind::Part, 1);
    arm.zsort = 0.5f;
    arm.localTransform.translation = Vec2{0.0f, 5.0f};
    arm.opacity = 0.5f;
    tree.addNode(arm);
    auto head = makeNode(4, "Head", NodeKind::Part, 0);
    head.zsort = -1.0f;
    tree.addNode(head);
    tree.seal();
    return tree;
}

void testPreOrderAndLookup() {
    auto tree = makeSampleTree();
    assert(tree.sealed());
    assert(tree.size() == 4);
    assert(tree.root() == 0);

    const auto& order = tree.preOrder();
    assert(order.size() == 4);
    assert(order[0] == 0 && order[1] == 1 && order[2] == 2 && order[3] == 3);
    assert(tree.preOrderIndex(3) == 3);

    assert(tree.findByUuid(3) == 2);
    assert(tree.findByUuid(99) == kInvalidNode);
    assert(tree.findByName("Head") == 3);
    assert(tree.findByName("Missing") == kInvalidNode);

    assert(tree.node(0).children.size() == 2);
    assert(tree.depth(2) == 2);
    auto chain = tree.ancestors(2);
    assert(chain.size() == 2 && chain[0] == 1 && chain[1] == 0);
}

void testEffectiveZSortAccumulates() {
    auto tree = makeSampleTree();
    assert(tree.effectiveZSort(0) == 0.0f);
    assert(tree.effectiveZSort(1) == 1.0f);
    assert(tree.effectiveZSort(2) == 1.5f);
    assert(tree.effectiveZSort(3) == -1.0f);
}

void testWorldTransformAndPropagation() {
    auto tree = makeSampleTree();
    auto world = tree.worldTransform(2);
    auto origin = marionette::core::math::applyAffine(world, Vec2{0.0f, 0.0f});
    assert(nearlyEqual(origin.x, 10.0f));
    assert(nearlyEqual(origin.y, 5.0f));

    std::vector<Mat3x3> locals;
    std::vector<float> opacity;
    for (const auto& n : tree.nodes()) {
        locals.push_back(n.localTransform.matrix());
        opacity.push_back(n.opacity);
    }
    std::vector<Mat3x3> worlds;
    std::vector<float> worldOpacity;
    tree.propagate(locals, opacity, worlds, worldOpacity);
    assert(worlds.size() == 4);
    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 3; ++c) assert(nearlyEqual(worlds[2][r][c], world[r][c]));
    }
    assert(worldOpacity[2] == 0.5f);
    assert(worldOpacity[3] == 1.0f);
}

void testRotatedParent() {
    NodeTree tree;
    auto root = makeNode(1, "Root", NodeKind::Composite, kInvalidNode);
    root.localTransform.rotation = 3.14159265f / 2.0f;
    tree.addNode(root);
    auto child = makeNode(2, "Child", NodeKind::Part, 0);
    child.localTransform.translation = Vec2{1.0f, 0.0f};
    tree.addNode(child);
    tree.seal();
    auto p = marionette::core::math::applyAffine(tree.worldTransform(1), Vec2{0.0f, 0.0f});
    assert(nearlyEqual(p.x, 0.0f));
    assert(nearlyEqual(p.y, 1.0f));
}

void testToString() {
    auto tree = makeSampleTree();
    const std::string expected = "- [Composite] Root\n"
                                 "  - [Composite] Body\n"
                                 "    - [Part] Arm\n"
                                 "  - [Part] Head\n";
    assert(tree.toString() == expected);
}

void testStructuralErrors() {
    {
        NodeTree tree;
        assert(sealError(tree) == LoadErrorKind::MalformedStructure);
    }
    {
        NodeTree tree;
        tree.addNode(makeNode(1, "A", NodeKind::Composite, kInvalidNode));
        tree.addNode(makeNode(2, "B", NodeKind::Composite, kInvalidNode));
        assert(sealError(tree) == LoadErrorKind::MalformedStructure);
    }
    {
        // 1 and 2 point at each other and hang off no root
        NodeTree tree;
        tree.addNode(makeNode(1, "Root", NodeKind::Composite, kInvalidNode));
        tree.addNode(makeNode(2, "A", NodeKind::Composite, 2));
        tree.addNode(makeNode(3, "B", NodeKind::Composite, 1));
        assert(sealError(tree) == LoadErrorKind::MalformedStructure);
    }
    {
        NodeTree tree;
        tree.addNode(makeNode(1, "Root", NodeKind::Composite, kInvalidNode));
        tree.addNode(makeNode(2, "Orphan", NodeKind::Composite, 7));
        assert(sealError(tree) == LoadErrorKind::DanglingReference);
    }
    {
        NodeTree tree;
        tree.addNode(makeNode(1, "Root", NodeKind::Composite, kInvalidNode));
        tree.addNode(makeNode(1, "Twin", NodeKind::Composite, 0));
        assert(sealError(tree) == LoadErrorKind::MalformedStructure);
    }
    {
        NodeTree tree;
        tree.addNode(makeNode(1, "Root", NodeKind::Composite, kInvalidNode));
        auto odd = makeNode(2, "Odd", NodeKind::Composite, 0);
        odd.kind = static_cast<NodeKind>(42);
        tree.addNode(odd);
        assert(sealError(tree) == LoadErrorKind::UnknownNodeVariant);
    }
    {
        NodeTree tree;
        tree.addNode(makeNode(1, "Root", NodeKind::Composite, kInvalidNode));
        auto part = makeNode(2, "Part", NodeKind::Part, 0);
        part.mesh.uvs.push_back(Vec2{1, 1});
        tree.addNode(part);
        assert(sealError(tree) == LoadErrorKind::VertexCountMismatch);
    }
    {
        NodeTree tree;
        tree.addNode(makeNode(1, "Root", NodeKind::Composite, kInvalidNode));
        auto part = makeNode(2, "Part", NodeKind::Part, 0);
        part.mesh.indices = {0, 1, 5};
        tree.addNode(part);
        assert(sealError(tree) == LoadErrorKind::MalformedStructure);
    }
    {
        NodeTree tree;
        tree.addNode(makeNode(1, "Root", NodeKind::Composite, kInvalidNode));
        auto part = makeNode(2, "Part", NodeKind::Part, 0);
        part.localTransform.rotation = NAN;
        tree.addNode(part);
        assert(sealError(tree) == LoadErrorKind::MalformedStructure);
    }
    {
        NodeTree tree;
        tree.addNode(makeNode(1, "Root", NodeKind::Composite, kInvalidNode));
        auto swing = makeNode(2, "Swing", NodeKind::Composite, 0);
        swing.physics = PhysicsParams{};
        swing.physics->length = 0.0f;
        tree.addNode(swing);
        assert(sealError(tree) == LoadErrorKind::MalformedStructure);
    }
}

void testMaskReferenceErrors() {
    {
        NodeTree tree;
        tree.addNode(makeNode(1, "Root", NodeKind::Composite, kInvalidNode));
        auto mask = makeNode(2, "Mask", NodeKind::Mask, 0);
        mask.mask.maskedParts = {77};
        tree.addNode(mask);
        assert(sealError(tree) == LoadErrorKind::DanglingReference);
    }
    {
        NodeTree tree;
        tree.addNode(makeNode(1, "Root", NodeKind::Composite, kInvalidNode));
        auto mask = makeNode(2, "Mask", NodeKind::Mask, 0);
        mask.mask.maskedParts = {1};
        tree.addNode(mask);
        assert(sealError(tree) == LoadErrorKind::MalformedStructure);
    }
    {
        NodeTree tree;
        tree.addNode(makeNode(1, "Root", NodeKind::Composite, kInvalidNode));
        tree.addNode(makeNode(2, "Part", NodeKind::Part, 0));
        auto m1 = makeNode(3, "M1", NodeKind::Mask, 0);
        m1.mask.maskedParts = {2};
        auto m2 = makeNode(4, "M2", NodeKind::Mask, 0);
        m2.mask.maskedParts = {2};
        tree.addNode(m1);
        tree.addNode(m2);
        assert(sealError(tree) == LoadErrorKind::MalformedStructure);
    }
}

void testSealedTreeIsImmutable() {
    auto tree = makeSampleTree();
    bool threw = false;
    try {
        tree.addNode(makeNode(9, "Late", NodeKind::Part, 0));
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
    assert(tree.size() == 4);

    threw = false;
    try {
        tree.seal();
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
}

} // namespace

int main() {
    testPreOrderAndLookup();
    testEffectiveZSortAccumulates();
    testWorldTransformAndPropagation();
    testRotatedParent();
    testToString();
    testStructuralErrors();
    testMaskReferenceErrors();
    testSealedTreeIsImmutable();
    return 0;
}
