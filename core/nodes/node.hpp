#pragma once

#include "common.hpp"
#include "mesh.hpp"
#include "phys.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace marionette::core::nodes {

struct MaskData {
    // uuids of the parts clipped by this mask, in authoring order.
    std::vector<uint32_t> maskedParts{};
    MaskingMode mode{MaskingMode::Mask};
    float threshold{0.5f};
};

// One scene graph entry. The kind selects which payload is meaningful:
// Part and Mask carry `mesh`, Mask additionally carries `mask`.
// Any kind may carry `physics`.
struct Node {
    uint32_t uuid{0};
    std::string name{"Unnamed Node"};
    NodeKind kind{NodeKind::Composite};
    NodeId parent{kInvalidNode};
    std::vector<NodeId> children{};
    Transform2D localTransform{};
    float opacity{1.0f};
    float zsort{0.0f};

    MeshData mesh{};
    MaskData mask{};
    // Present on physics-enabled nodes.
    std::optional<PhysicsParams> physics{};

    bool isRoot() const { return parent == kInvalidNode; }
};

// Arena-backed scene graph. Nodes are appended while the tree is open;
// seal() validates the structure and freezes it for the puppet's lifetime.
class NodeTree {
public:
    NodeTree() = default;

    // Appends a node; `node.parent` must index a node in this arena (or be kInvalidNode for the root).
    // Children lists are derived from parent links in arena order.
    NodeId addNode(Node node);
    // Throws PuppetLoadError when the graph is not a single rooted tree or a node is malformed.
    void seal();
    bool sealed() const { return sealed_; }

    std::size_t size() const { return nodes_.size(); }
    NodeId root() const { return root_; }
    const Node& node(NodeId id) const { return nodes_.at(id); }
    const std::vector<Node>& nodes() const { return nodes_; }

    const std::vector<NodeId>& preOrder() const { return preOrder_; }
    std::size_t preOrderIndex(NodeId id) const { return preOrderIndex_.at(id); }

    NodeId findByUuid(uint32_t uuid) const;
    NodeId findByName(const std::string& name) const;
    // Parent first, root last.
    std::vector<NodeId> ancestors(NodeId id) const;
    int depth(NodeId id) const;

    // zsort accumulated from root to node.
    float effectiveZSort(NodeId id) const { return effectiveZSort_.at(id); }

    // Root-to-node composition of the static local transforms.
    Mat3x3 worldTransform(NodeId id) const;

    // Pre-order propagation of per-node local matrices and opacities.
    // `worldMatrices`/`worldOpacity` are resized to size().
    void propagate(const std::vector<Mat3x3>& localMatrices,
                   const std::vector<float>& localOpacity,
                   std::vector<Mat3x3>& worldMatrices,
                   std::vector<float>& worldOpacity) const;

    std::string toString() const;

private:
    void requireOpen(const char* operation) const;
    void buildChildren();
    void validateNodes() const;
    void computePreOrder();

    std::vector<Node> nodes_{};
    std::vector<NodeId> preOrder_{};
    std::vector<std::size_t> preOrderIndex_{};
    std::vector<float> effectiveZSort_{};
    std::unordered_map<uint32_t, NodeId> uuidIndex_{};
    NodeId root_{kInvalidNode};
    bool sealed_{false};
};

} // namespace marionette::core::nodes
