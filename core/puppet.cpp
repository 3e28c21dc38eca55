#include "puppet.hpp"
#include "debug_log.hpp"

#include <cmath>
#include <cstdio>
#include <unordered_set>
#include <utility>

namespace marionette::core {

using nodes::NodeId;
using nodes::NodeKind;

Puppet::Puppet(PuppetData data) : meta_(std::move(data.meta)), config_(data.config) {
    try {
        if (!config_.valid()) {
            throw PuppetLoadError(LoadErrorKind::MalformedStructure, "runtime configuration is out of range");
        }
        for (auto& n : data.nodes) {
            tree_.addNode(std::move(n));
        }
        tree_.seal();

        params_ = param::ParameterSystem(std::move(data.parameters));
        validateParameters();
    } catch (const PuppetLoadError& e) {
        std::fprintf(stderr, "[marionette][Puppet] rejected puppet '%s': %s\n", meta_.name.c_str(), e.what());
        throw;
    }

    bindings_ = param::BindingEngine(tree_);
    drawOrder_ = render::DrawOrderResolver(tree_);

    stacks_.resize(tree_.size());
    localVertices_.resize(tree_.size());
    worldVertices_.resize(tree_.size());
    for (std::size_t i = 0; i < tree_.size(); ++i) {
        const auto& n = tree_.node(static_cast<NodeId>(i));
        if (nodes::hasMesh(n.kind)) stacks_[i] = nodes::DeformationStack(&n.mesh, n.uuid);
    }

    // Physics anchors are seeded from the bound rest pose so default bindings do not swing the first frame.
    computeRestPose();
    physics_ = nodes::PhysicsSolver(tree_, config_, worldMatrices_);

    MRNT_DBG_LOG("[marionette][Puppet] loaded '%s' nodes=%zu params=%zu drawables=%zu\n", meta_.name.c_str(), tree_.size(),
                 params_.size(), drawOrder_.order().size());
}

void Puppet::validateParameters() {
    std::unordered_set<uint32_t> uuids;
    for (const auto& p : params_.parameters()) {
        if (!p) {
            throw PuppetLoadError(LoadErrorKind::MalformedStructure, "null parameter");
        }
        if (!uuids.insert(p->uuid).second) {
            throw PuppetLoadError(LoadErrorKind::MalformedStructure, "duplicate parameter uuid " + std::to_string(p->uuid));
        }
        auto err = p->validationError();
        if (!err.empty()) {
            throw PuppetLoadError(LoadErrorKind::MalformedStructure, "parameter '" + p->name + "': " + err);
        }
        for (const auto& b : p->bindings) {
            if (!b) {
                throw PuppetLoadError(LoadErrorKind::MalformedStructure, "parameter '" + p->name + "' has a null binding");
            }
            b->finalize(tree_);
        }
        p->reset();
    }
}

void Puppet::computeRestPose() {
    bindings_.evaluate(params_, offsets_);
    localMatrices_.resize(tree_.size());
    localOpacity_.resize(tree_.size());
    for (std::size_t i = 0; i < tree_.size(); ++i) {
        const auto& n = tree_.node(static_cast<NodeId>(i));
        const auto& off = offsets_[i];
        localMatrices_[i] = n.localTransform.calcOffset(math::Transform2D{off.translation, off.rotation, off.scale}).matrix();
        localOpacity_[i] = math::clamp01(n.opacity + off.opacity);
    }
    tree_.propagate(localMatrices_, localOpacity_, worldMatrices_, worldOpacity_);
}

bool Puppet::setParameter(const std::string& name, float value) { return params_.setValue(name, value); }

bool Puppet::setParameter(const std::string& name, float x, float y) { return params_.setValue(name, x, y); }

bool Puppet::setParameter(uint32_t uuid, float value) { return params_.setValue(uuid, value); }

bool Puppet::setParameter(uint32_t uuid, float x, float y) { return params_.setValue(uuid, x, y); }

FrameResult Puppet::update(float dt) {
    const float frameDt = nodes::PhysicsSolver::clampFrameDelta(dt, config_.maxFrameDelta);

    bindings_.evaluate(params_, offsets_);

    // This frame renders the state of the previous tick; the tick below feeds the next frame.
    const std::vector<float> physicsAngles = physics_.output();
    physics_.tick(frameDt, worldMatrices_);

    for (std::size_t i = 0; i < tree_.size(); ++i) {
        const auto id = static_cast<NodeId>(i);
        const auto& n = tree_.node(id);
        const auto& off = offsets_[i];
        const float physicsAngle = n.physics ? physicsAngles[i] : 0.0f;

        math::Transform2D local = n.localTransform.calcOffset(math::Transform2D{off.translation, off.rotation, off.scale});
        if (n.kind == NodeKind::Composite) local.rotation += physicsAngle;
        localMatrices_[i] = local.matrix();
        localOpacity_[i] = math::clamp01(n.opacity + off.opacity);

        if (!nodes::hasMesh(n.kind)) continue;
        auto& stack = stacks_[i];
        stack.preUpdate();
        if (off.hasDeform) stack.push(off.deform);
        if (physicsAngle != 0.0f) stack.pushRotation(physicsAngle);
        stack.update(localVertices_[i]);
    }

    tree_.propagate(localMatrices_, localOpacity_, worldMatrices_, worldOpacity_);

    FrameResult result;
    result.frame = ++frames_;
    result.dt = frameDt;
    result.physicsDivergences = physics_.divergenceCount();
    for (const auto& plan : drawOrder_.groups()) {
        render::DrawGroup group;
        group.kind = plan.kind;
        group.mode = plan.mode;
        if (plan.kind == render::DrawGroupKind::Masked) group.mask = makePacket(plan.mask);
        group.parts.reserve(plan.parts.size());
        for (auto id : plan.parts) group.parts.push_back(makePacket(id));
        result.groups.push_back(std::move(group));
    }
    return result;
}

render::PartDrawPacket Puppet::makePacket(NodeId id) const {
    const auto& n = tree_.node(id);
    render::PartDrawPacket packet;
    packet.node = id;
    packet.uuid = n.uuid;
    packet.name = n.name;
    packet.isMask = n.kind == NodeKind::Mask;
    packet.opacity = worldOpacity_[id];
    packet.maskThreshold = packet.isMask ? n.mask.threshold : 0.0f;
    packet.modelMatrix = worldMatrices_[id];
    packet.origin = math::applyAffine(worldMatrices_[id], n.mesh.origin);
    nodes::DeformationStack::toWorld(worldMatrices_[id], localVertices_[id], packet.vertices);
    packet.uvs = n.mesh.uvs;
    packet.indices = n.mesh.indices;
    packet.vertexCount = static_cast<uint32_t>(packet.vertices.size());
    packet.indexCount = static_cast<uint32_t>(packet.indices.size());
    return packet;
}

PuppetStats Puppet::stats() const {
    PuppetStats s;
    s.frames = frames_;
    s.nodeCount = tree_.size();
    for (const auto& n : tree_.nodes()) {
        if (n.kind == NodeKind::Part) ++s.partCount;
        if (n.kind == NodeKind::Mask) ++s.maskCount;
    }
    s.parameterCount = params_.size();
    for (const auto& p : params_.parameters()) s.bindingCount += p->bindings.size();
    s.physicsNodeCount = physics_.states().size();
    s.physicsDivergences = physics_.divergenceCount();
    return s;
}

} // namespace marionette::core
