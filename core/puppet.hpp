#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "nodes/deformation_stack.hpp"
#include "nodes/node.hpp"
#include "nodes/physics_solver.hpp"
#include "param/binding.hpp"
#include "param/binding_engine.hpp"
#include "param/parameter.hpp"
#include "param/parameter_system.hpp"
#include "render/draw_order.hpp"
#include "render/part_draw_packet.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace marionette::core {

using ::marionette::core::param::Parameter;
using ::marionette::core::render::FrameResult;

struct PuppetMeta {
    std::string name{};
    std::string version{};
    std::string rigger{};
    std::string artist{};
    std::string copyright{};
};

// Everything a loader hands to the core in one shot. Node parents index `nodes`.
struct PuppetData {
    PuppetMeta meta{};
    std::vector<nodes::Node> nodes{};
    std::vector<std::shared_ptr<Parameter>> parameters{};
    RuntimeConfig config{};
};

struct PuppetStats {
    uint64_t frames{0};
    std::size_t nodeCount{0};
    std::size_t partCount{0};
    std::size_t maskCount{0};
    std::size_t parameterCount{0};
    std::size_t bindingCount{0};
    std::size_t physicsNodeCount{0};
    std::size_t physicsDivergences{0};
};

// A loaded puppet. The structure is fixed at construction; parameter values and
// physics state are the only things that change afterwards.
class Puppet {
public:
    // Validates `data` and throws PuppetLoadError when any part of it is rejected.
    explicit Puppet(PuppetData data);
    Puppet(const Puppet&) = delete;
    Puppet& operator=(const Puppet&) = delete;
    Puppet(Puppet&&) = delete;
    Puppet& operator=(Puppet&&) = delete;

    // Out-of-range values are clamped. Returns false for an unknown parameter or a non-finite value.
    bool setParameter(const std::string& name, float value);
    bool setParameter(const std::string& name, float x, float y);
    bool setParameter(uint32_t uuid, float value);
    bool setParameter(uint32_t uuid, float x, float y);
    void resetParameters() { params_.reset(); }

    // Runs one frame: bindings, physics tick, deformation, propagation and draw ordering.
    FrameResult update(float dt);

    const PuppetMeta& meta() const { return meta_; }
    const RuntimeConfig& config() const { return config_; }
    const nodes::NodeTree& nodes() const { return tree_; }
    const param::ParameterSystem& parameters() const { return params_; }
    std::shared_ptr<Parameter> findParameter(const std::string& name) const { return params_.find(name); }
    std::shared_ptr<Parameter> findParameter(uint32_t uuid) const { return params_.findByUuid(uuid); }
    nodes::NodeId findNode(const std::string& name) const { return tree_.findByName(name); }
    nodes::NodeId findNodeById(uint32_t uuid) const { return tree_.findByUuid(uuid); }
    const render::DrawOrderResolver& drawOrder() const { return drawOrder_; }
    const nodes::PhysicsSolver& physics() const { return physics_; }
    nodes::PhysicsSolver& physics() { return physics_; }

    // World transforms and opacities of the most recent frame (the rest pose under default parameter values before the first update).
    const std::vector<nodes::Mat3x3>& worldMatrices() const { return worldMatrices_; }
    const std::vector<float>& worldOpacity() const { return worldOpacity_; }

    PuppetStats stats() const;

private:
    void validateParameters();
    void computeRestPose();
    render::PartDrawPacket makePacket(nodes::NodeId id) const;

    PuppetMeta meta_{};
    RuntimeConfig config_{};
    nodes::NodeTree tree_{};
    param::ParameterSystem params_{};
    param::BindingEngine bindings_{};
    render::DrawOrderResolver drawOrder_{};
    nodes::PhysicsSolver physics_{};

    std::vector<param::NodeOffsets> offsets_{};
    std::vector<nodes::DeformationStack> stacks_{};
    std::vector<nodes::Vec2Array> localVertices_{};
    std::vector<nodes::Vec2Array> worldVertices_{};
    std::vector<nodes::Mat3x3> localMatrices_{};
    std::vector<float> localOpacity_{};
    std::vector<nodes::Mat3x3> worldMatrices_{};
    std::vector<float> worldOpacity_{};
    uint64_t frames_{0};
};

} // namespace marionette::core
