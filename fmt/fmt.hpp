#pragma once

#include "../core/errors.hpp"
#include "../core/puppet.hpp"
#include "serialize.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace marionette::core::fmt {

namespace detail {

inline void readTransform(const serde::Fghj& data, nodes::Transform2D& out) {
    if (auto trans = data.get_child_optional("trans")) {
        float t[3]{out.translation.x, out.translation.y, 0.0f};
        serde::readFloats(*trans, t, 3);
        out.translation = nodes::Vec2{t[0], t[1]};
    }
    if (auto rot = data.get_child_optional("rot")) {
        // Only the z component rotates in the plane.
        float r[3]{0.0f, 0.0f, out.rotation};
        serde::readFloats(*rot, r, 3);
        out.rotation = r[2];
    }
    if (auto scale = data.get_child_optional("scale")) {
        float s[2]{out.scale.x, out.scale.y};
        serde::readFloats(*scale, s, 2);
        out.scale = nodes::Vec2{s[0], s[1]};
    }
}

inline PuppetLoadError malformed(const std::string& what, const std::string& detail) {
    return PuppetLoadError(LoadErrorKind::MalformedStructure, what + ": " + detail);
}

// Decodes the fields of one JSON node object, children excluded.
inline nodes::Node readNode(const serde::Fghj& data) {
    nodes::Node n;
    n.uuid = data.get<uint32_t>("uuid", 0);
    n.name = data.get<std::string>("name", n.name);

    const auto type = data.get<std::string>("type", "Node");
    auto kind = nodes::parseNodeKind(type);
    if (!kind) {
        throw PuppetLoadError(LoadErrorKind::UnknownNodeVariant,
                              "node '" + n.name + "' (uuid " + std::to_string(n.uuid) + ") has unknown type " + type);
    }
    n.kind = *kind;
    n.opacity = data.get<float>("opacity", n.opacity);
    n.zsort = data.get<float>("zsort", n.zsort);
    if (auto t = data.get_child_optional("transform")) readTransform(*t, n.localTransform);

    if (nodes::hasMesh(n.kind)) {
        if (auto mesh = data.get_child_optional("mesh")) {
            if (auto err = n.mesh.deserializeFromFghj(*mesh)) throw malformed("mesh of '" + n.name + "'", *err);
        }
    }

    if (n.kind == nodes::NodeKind::Mask) {
        if (auto parts = data.get_child_optional("masked_parts")) n.mask.maskedParts = serde::readList<uint32_t>(*parts);
        if (auto mode = data.get_optional<std::string>("mask_mode")) {
            auto parsed = nodes::parseMaskingMode(*mode);
            if (!parsed) throw malformed("mask '" + n.name + "'", "unknown mask_mode " + *mode);
            n.mask.mode = *parsed;
        }
        n.mask.threshold = data.get<float>("mask_threshold", n.mask.threshold);
    }

    if (auto phys = data.get_child_optional("physics")) {
        nodes::PhysicsParams params;
        if (auto err = params.deserializeFromFghj(*phys)) throw malformed("physics of '" + n.name + "'", *err);
        n.physics = params;
    }
    return n;
}

// Flattens the nested "nodes" object into pre-order, children in document order.
// Parts may also name their masks ("masks": [{"source": uuid, "mode": ...}]); those
// are folded into the source mask's masked part list.
inline std::vector<nodes::Node> readNodeTree(const serde::Fghj& rootData) {
    struct Pending {
        const serde::Fghj* data;
        nodes::NodeId parent;
    };
    struct MaskRef {
        uint32_t part;
        uint32_t source;
        std::string mode;
    };

    std::vector<nodes::Node> out;
    std::vector<MaskRef> maskRefs;
    std::vector<Pending> stack{Pending{&rootData, nodes::kInvalidNode}};
    while (!stack.empty()) {
        auto cur = stack.back();
        stack.pop_back();

        auto n = readNode(*cur.data);
        n.parent = cur.parent;
        const auto id = static_cast<nodes::NodeId>(out.size());
        if (n.kind == nodes::NodeKind::Part) {
            if (auto masks = cur.data->get_child_optional("masks")) {
                for (const auto& m : *masks) {
                    maskRefs.push_back(MaskRef{n.uuid, m.second.get<uint32_t>("source"), m.second.get<std::string>("mode", "")});
                }
            }
        }
        out.push_back(std::move(n));

        if (auto children = cur.data->get_child_optional("children")) {
            std::vector<const serde::Fghj*> kids;
            for (const auto& c : *children) kids.push_back(&c.second);
            for (auto it = kids.rbegin(); it != kids.rend(); ++it) stack.push_back(Pending{*it, id});
        }
    }

    if (!maskRefs.empty()) {
        std::unordered_map<uint32_t, std::size_t> byUuid;
        for (std::size_t i = 0; i < out.size(); ++i) byUuid.emplace(out[i].uuid, i);
        for (const auto& ref : maskRefs) {
            auto it = byUuid.find(ref.source);
            if (it == byUuid.end()) {
                throw PuppetLoadError(LoadErrorKind::DanglingReference,
                                      "part " + std::to_string(ref.part) + " is masked by missing node " + std::to_string(ref.source));
            }
            auto& mask = out[it->second];
            if (mask.kind != nodes::NodeKind::Mask) {
                throw malformed("part " + std::to_string(ref.part), "mask source '" + mask.name + "' is not a Mask");
            }
            if (!ref.mode.empty()) {
                auto parsed = nodes::parseMaskingMode(ref.mode);
                if (!parsed) throw malformed("part " + std::to_string(ref.part), "unknown mask mode " + ref.mode);
                mask.mask.mode = *parsed;
            }
            mask.mask.maskedParts.push_back(ref.part);
        }
    }
    return out;
}

inline std::shared_ptr<param::Parameter> readParameter(const serde::Fghj& data) {
    auto p = std::make_shared<param::Parameter>();
    if (auto err = p->deserializeFromFghj(data)) throw malformed("parameter", *err);
    if (auto bindings = data.get_child_optional("bindings")) {
        for (const auto& entry : *bindings) {
            const auto& b = entry.second;
            const auto name = b.get<std::string>("param_name", "");
            const auto nodeUuid = b.get<uint32_t>("node", 0);
            auto binding = param::makeBinding(p.get(), nodeUuid, name);
            if (!binding) throw malformed("binding of parameter '" + p->name + "'", "unknown param_name " + name);
            if (auto err = binding->deserializeFromFghj(b)) {
                throw malformed("binding " + name + " of parameter '" + p->name + "'", *err);
            }
            p->addBinding(binding);
        }
    }
    return p;
}

inline PuppetMeta readMeta(const serde::Fghj& data) {
    PuppetMeta meta;
    meta.name = data.get<std::string>("name", "");
    meta.version = data.get<std::string>("version", "");
    meta.rigger = data.get<std::string>("rigger", "");
    meta.artist = data.get<std::string>("artist", "");
    meta.copyright = data.get<std::string>("copyright", "");
    return meta;
}

} // namespace detail

// Maps a parsed puppet document onto PuppetData. Unknown fields are ignored.
// Structural problems surface as PuppetLoadError, either here or from the Puppet constructor.
inline PuppetData inReadPuppetData(const serde::Fghj& doc, const RuntimeConfig& config = RuntimeConfig::defaults()) {
    PuppetData data;
    data.config = config;
    try {
        if (auto meta = doc.get_child_optional("meta")) data.meta = detail::readMeta(*meta);
        auto root = doc.get_child_optional("nodes");
        if (!root) throw PuppetLoadError(LoadErrorKind::MalformedStructure, "missing root: document has no nodes");
        data.nodes = detail::readNodeTree(*root);
        if (auto params = doc.get_child_optional("param")) {
            for (const auto& p : *params) data.parameters.push_back(detail::readParameter(p.second));
        }
        if (doc.get_child_optional("physics")) {
            if (auto err = data.config.deserializeFromFghj(doc)) throw detail::malformed("physics settings", *err);
        }
    } catch (const PuppetLoadError&) {
        throw;
    } catch (const boost::property_tree::ptree_error& e) {
        // a required field is missing or has the wrong type
        throw detail::malformed("puppet document", e.what());
    }
    return data;
}

inline std::shared_ptr<Puppet> inLoadPuppetJsonFromMemory(const std::string& json,
                                                          const RuntimeConfig& config = RuntimeConfig::defaults()) {
    return std::make_shared<Puppet>(inReadPuppetData(inParseJson(json), config));
}

inline std::shared_ptr<Puppet> inLoadPuppetJson(const std::string& file, const RuntimeConfig& config = RuntimeConfig::defaults()) {
    return inLoadPuppetJsonFromMemory(inReadFile(file), config);
}

} // namespace marionette::core::fmt
