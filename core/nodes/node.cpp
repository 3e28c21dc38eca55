#include "node.hpp"
#include "../errors.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace marionette::core::nodes {

namespace {

std::string describe(const Node& n) {
    return "'" + n.name + "' (uuid " + std::to_string(n.uuid) + ")";
}

} // namespace

void NodeTree::requireOpen(const char* operation) const {
    if (sealed_) {
        throw std::logic_error(std::string("NodeTree::") + operation + " on a sealed tree; structure is immutable after load");
    }
}

NodeId NodeTree::addNode(Node node) {
    requireOpen("addNode");
    node.children.clear();
    nodes_.push_back(std::move(node));
    return static_cast<NodeId>(nodes_.size() - 1);
}

void NodeTree::validateNodes() const {
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        const auto& n = nodes_[i];
        if (!isKnownNodeKind(n.kind)) {
            throw PuppetLoadError(LoadErrorKind::UnknownNodeVariant,
                                  "node " + describe(n) + " has discriminant " + std::to_string(static_cast<int>(n.kind)));
        }
        if (n.parent != kInvalidNode && n.parent >= nodes_.size()) {
            throw PuppetLoadError(LoadErrorKind::DanglingReference, "parent of node " + describe(n) + " does not exist");
        }
        if (n.parent == i) {
            throw PuppetLoadError(LoadErrorKind::MalformedStructure, "node " + describe(n) + " is its own parent");
        }
        const auto& t = n.localTransform;
        if (!math::isFinite(t.translation) || !std::isfinite(t.rotation) || !math::isFinite(t.scale) ||
            !std::isfinite(n.opacity) || !std::isfinite(n.zsort)) {
            throw PuppetLoadError(LoadErrorKind::MalformedStructure, "node " + describe(n) + " has a non-finite transform");
        }
        if (hasMesh(n.kind)) {
            if (n.mesh.uvs.size() != n.mesh.vertices.size()) {
                throw PuppetLoadError(LoadErrorKind::VertexCountMismatch,
                                      "node " + describe(n) + " has " + std::to_string(n.mesh.uvs.size()) + " uvs for " +
                                          std::to_string(n.mesh.vertices.size()) + " vertices");
            }
            auto err = n.mesh.validationError();
            if (!err.empty()) {
                throw PuppetLoadError(LoadErrorKind::MalformedStructure, "node " + describe(n) + ": " + err);
            }
        }
        if (n.physics) {
            auto err = n.physics->validationError();
            if (!err.empty()) {
                throw PuppetLoadError(LoadErrorKind::MalformedStructure, "node " + describe(n) + ": " + err);
            }
        }
    }
}

void NodeTree::buildChildren() {
    for (auto& n : nodes_) n.children.clear();
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        auto p = nodes_[i].parent;
        if (p != kInvalidNode) nodes_[p].children.push_back(static_cast<NodeId>(i));
    }
}

void NodeTree::computePreOrder() {
    preOrder_.clear();
    preOrder_.reserve(nodes_.size());
    preOrderIndex_.assign(nodes_.size(), 0);
    effectiveZSort_.assign(nodes_.size(), 0.0f);

    std::vector<bool> visited(nodes_.size(), false);
    std::vector<NodeId> stack{root_};
    while (!stack.empty()) {
        NodeId id = stack.back();
        stack.pop_back();
        if (visited[id]) continue;
        visited[id] = true;
        preOrderIndex_[id] = preOrder_.size();
        preOrder_.push_back(id);

        const auto& n = nodes_[id];
        effectiveZSort_[id] = n.zsort + (n.parent == kInvalidNode ? 0.0f : effectiveZSort_[n.parent]);
        for (auto it = n.children.rbegin(); it != n.children.rend(); ++it) {
            stack.push_back(*it);
        }
    }

    if (preOrder_.size() != nodes_.size()) {
        for (std::size_t i = 0; i < nodes_.size(); ++i) {
            if (!visited[i]) {
                throw PuppetLoadError(LoadErrorKind::MalformedStructure,
                                      "node " + describe(nodes_[i]) + " is unreachable from the root (cycle in parent links)");
            }
        }
    }
}

void NodeTree::seal() {
    requireOpen("seal");
    if (nodes_.empty()) {
        throw PuppetLoadError(LoadErrorKind::MalformedStructure, "missing root: puppet has no nodes");
    }
    validateNodes();

    uuidIndex_.clear();
    root_ = kInvalidNode;
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        const auto& n = nodes_[i];
        if (!uuidIndex_.emplace(n.uuid, static_cast<NodeId>(i)).second) {
            throw PuppetLoadError(LoadErrorKind::MalformedStructure, "duplicate node uuid " + std::to_string(n.uuid));
        }
        if (n.parent == kInvalidNode) {
            if (root_ != kInvalidNode) {
                throw PuppetLoadError(LoadErrorKind::MalformedStructure,
                                      "multiple roots: " + describe(nodes_[root_]) + " and " + describe(n));
            }
            root_ = static_cast<NodeId>(i);
        }
    }
    if (root_ == kInvalidNode) {
        throw PuppetLoadError(LoadErrorKind::MalformedStructure, "missing root: every node has a parent (cycle in parent links)");
    }

    buildChildren();
    computePreOrder();

    std::vector<NodeId> maskOwner(nodes_.size(), kInvalidNode);
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        const auto& n = nodes_[i];
        if (n.kind != NodeKind::Mask) continue;
        for (auto targetUuid : n.mask.maskedParts) {
            auto it = uuidIndex_.find(targetUuid);
            if (it == uuidIndex_.end()) {
                throw PuppetLoadError(LoadErrorKind::DanglingReference,
                                      "mask " + describe(n) + " references missing node uuid " + std::to_string(targetUuid));
            }
            const auto& target = nodes_[it->second];
            if (target.kind != NodeKind::Part) {
                throw PuppetLoadError(LoadErrorKind::MalformedStructure,
                                      "mask " + describe(n) + " targets " + describe(target) + " which is not a Part");
            }
            if (maskOwner[it->second] != kInvalidNode) {
                throw PuppetLoadError(LoadErrorKind::MalformedStructure,
                                      "part " + describe(target) + " is masked by more than one mask");
            }
            maskOwner[it->second] = static_cast<NodeId>(i);
        }
    }

    sealed_ = true;
}

NodeId NodeTree::findByUuid(uint32_t uuid) const {
    auto it = uuidIndex_.find(uuid);
    return it == uuidIndex_.end() ? kInvalidNode : it->second;
}

NodeId NodeTree::findByName(const std::string& name) const {
    for (auto id : preOrder_) {
        if (nodes_[id].name == name) return id;
    }
    return kInvalidNode;
}

std::vector<NodeId> NodeTree::ancestors(NodeId id) const {
    std::vector<NodeId> out;
    for (NodeId p = nodes_.at(id).parent; p != kInvalidNode; p = nodes_[p].parent) {
        out.push_back(p);
    }
    return out;
}

int NodeTree::depth(NodeId id) const {
    return static_cast<int>(ancestors(id).size());
}

Mat3x3 NodeTree::worldTransform(NodeId id) const {
    auto chain = ancestors(id);
    Mat3x3 world = Mat3x3::identity();
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        world = math::multiply(world, nodes_[*it].localTransform.matrix());
    }
    return math::multiply(world, nodes_[id].localTransform.matrix());
}

void NodeTree::propagate(const std::vector<Mat3x3>& localMatrices,
                         const std::vector<float>& localOpacity,
                         std::vector<Mat3x3>& worldMatrices,
                         std::vector<float>& worldOpacity) const {
    worldMatrices.resize(nodes_.size());
    worldOpacity.resize(nodes_.size());
    for (auto id : preOrder_) {
        const auto parent = nodes_[id].parent;
        if (parent == kInvalidNode) {
            worldMatrices[id] = localMatrices[id];
            worldOpacity[id] = localOpacity[id];
        } else {
            worldMatrices[id] = math::multiply(worldMatrices[parent], localMatrices[id]);
            worldOpacity[id] = worldOpacity[parent] * localOpacity[id];
        }
    }
}

std::string NodeTree::toString() const {
    if (nodes_.empty() || root_ == kInvalidNode) return "(empty)";
    std::ostringstream oss;
    for (auto id : preOrder_) {
        const auto& n = nodes_[id];
        oss << std::string(static_cast<std::size_t>(depth(id)) * 2, ' ')
            << "- [" << nodeKindName(n.kind) << "] " << n.name << "\n";
    }
    return oss.str();
}

} // namespace marionette::core::nodes
