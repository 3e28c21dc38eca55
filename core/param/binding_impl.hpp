#pragma once

#include "binding.hpp"
#include "parameter.hpp"
#include "../errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace marionette::core::param {

template <typename T>
class ParameterBindingImpl : public ParameterBinding {
public:
    ParameterBindingImpl(Parameter* param, uint32_t nodeUuid, BindingProperty property, int component = -1)
        : parameter(param), component_(component) {
        target.uuid = nodeUuid;
        target.property = property;
        clear();
    }

    const BindTarget& getTarget() const override { return target; }
    uint32_t getNodeUUID() const override { return target.uuid; }
    int component() const { return component_; }

    InterpolateMode interpolateMode() const override { return interpolateMode_; }
    void setInterpolateMode(InterpolateMode mode) override { interpolateMode_ = mode; }

    void finalize(const NodeTree& tree) override {
        target.node = tree.findByUuid(target.uuid);
        if (target.node == nodes::kInvalidNode) {
            throw PuppetLoadError(LoadErrorKind::DanglingReference, describe() + " targets missing node " + std::to_string(target.uuid));
        }
        const auto xCount = parameter ? parameter->axisPointCount(0) : values.size();
        const auto yCount = parameter ? parameter->axisPointCount(1) : 1;
        if (values.size() != xCount) {
            throw PuppetLoadError(LoadErrorKind::MalformedStructure,
                                  describe() + " has " + std::to_string(values.size()) + " columns for " +
                                      std::to_string(xCount) + " breakpoints");
        }
        for (const auto& row : values) {
            if (row.size() != yCount) {
                throw PuppetLoadError(LoadErrorKind::MalformedStructure,
                                      describe() + " has a row of " + std::to_string(row.size()) + " values for " +
                                          std::to_string(yCount) + " breakpoints");
            }
        }
        checkTarget(tree.node(target.node));
        for (std::size_t x = 0; x < values.size(); ++x) {
            for (std::size_t y = 0; y < values[x].size(); ++y) {
                if (isSetFlags[x][y]) checkValue(values[x][y]);
            }
        }
        reInterpolate();
    }

    void apply(const Vec2u& leftKeypoint, const Vec2& offset, std::vector<NodeOffsets>& out) const override {
        if (target.node >= out.size() || values.empty() || values.front().empty()) return;
        applyToTarget(interpolate(leftKeypoint, offset), out[target.node]);
    }

    void clear() override {
        auto xCount = parameter ? parameter->axisPointCount(0) : 1;
        auto yCount = parameter ? parameter->axisPointCount(1) : 1;
        values.assign(xCount, std::vector<T>(yCount, T{}));
        isSetFlags.assign(xCount, std::vector<bool>(yCount, false));
        for (auto& row : values) {
            for (auto& v : row) clearValue(v);
        }
    }

    bool isSet(const Vec2u& index) const override {
        if (index.x >= isSetFlags.size() || index.y >= isSetFlags[index.x].size()) return false;
        return isSetFlags[index.x][index.y];
    }

    uint32_t getSetCount() const override {
        uint32_t count = 0;
        for (const auto& row : isSetFlags) {
            for (auto b : row) {
                if (b) ++count;
            }
        }
        return count;
    }

    const T& valueAt(const Vec2u& index) const { return values.at(index.x).at(index.y); }

    // Stores a keypoint value and refills the unset cells around it.
    void setValue(const Vec2u& point, const T& v) {
        if (point.x >= values.size() || point.y >= values[point.x].size()) return;
        values[point.x][point.y] = v;
        isSetFlags[point.x][point.y] = true;
        reInterpolate();
    }

    void unset(const Vec2u& point) {
        if (point.x >= values.size() || point.y >= values[point.x].size()) return;
        clearValue(values[point.x][point.y]);
        isSetFlags[point.x][point.y] = false;
        reInterpolate();
    }

    // Fills every unset cell from the set ones: linear fill between set neighbours along
    // each axis first, then outward extension of the outermost set values. Cells reached
    // from both axes in the same pass take the average of the two candidates.
    void reInterpolate() override {
        const auto xCount = parameter ? parameter->axisPointCount(0) : values.size();
        const auto yCount = parameter ? parameter->axisPointCount(1) : (values.empty() ? 0 : values.front().size());
        if (values.size() != xCount || (!values.empty() && values.front().size() != yCount)) {
            clear();
        }
        if (getSetCount() == 0) {
            clear();
            return;
        }

        auto valid = isSetFlags;
        std::vector<std::vector<T>> proposed(xCount, std::vector<T>(yCount, T{}));
        std::vector<std::vector<int>> hits(xCount, std::vector<int>(yCount, 0));

        auto axisPoint = [&](std::size_t axis, std::size_t idx) -> float {
            return parameter ? parameter->axisPointValue(axis, idx) : static_cast<float>(idx);
        };
        // Cell `i` along a line of `axis`; lines of axis 0 run over x at a fixed y.
        auto cell = [](std::size_t axis, std::size_t line, std::size_t i) -> Vec2u {
            return axis == 0 ? Vec2u{i, line} : Vec2u{line, i};
        };
        auto propose = [&](const Vec2u& c, const T& v) {
            if (valid[c.x][c.y]) return;
            auto& slot = proposed[c.x][c.y];
            slot = hits[c.x][c.y] == 0 ? v : lerpValue(slot, v, 0.5f);
            ++hits[c.x][c.y];
        };

        auto interpolateLines = [&](std::size_t axis) {
            const auto lineCount = axis == 0 ? yCount : xCount;
            const auto len = axis == 0 ? xCount : yCount;
            for (std::size_t line = 0; line < lineCount; ++line) {
                std::size_t l = len;
                for (std::size_t i = 0; i < len; ++i) {
                    const auto ci = cell(axis, line, i);
                    if (!valid[ci.x][ci.y]) continue;
                    if (l != len && i > l + 1) {
                        const auto cl = cell(axis, line, l);
                        const float lo = axisPoint(axis, l);
                        const float hi = axisPoint(axis, i);
                        for (std::size_t m = l + 1; m < i; ++m) {
                            const float t = (hi == lo) ? 0.0f : (axisPoint(axis, m) - lo) / (hi - lo);
                            propose(cell(axis, line, m), lerpValue(values[cl.x][cl.y], values[ci.x][ci.y], t));
                        }
                    }
                    l = i;
                }
            }
        };

        auto extendLines = [&](std::size_t axis) {
            const auto lineCount = axis == 0 ? yCount : xCount;
            const auto len = axis == 0 ? xCount : yCount;
            for (std::size_t line = 0; line < lineCount; ++line) {
                std::size_t first = len;
                std::size_t last = len;
                for (std::size_t i = 0; i < len; ++i) {
                    const auto ci = cell(axis, line, i);
                    if (!valid[ci.x][ci.y]) continue;
                    if (first == len) first = i;
                    last = i;
                }
                if (first == len) continue;
                const auto cf = cell(axis, line, first);
                const auto cl = cell(axis, line, last);
                for (std::size_t i = 0; i < first; ++i) propose(cell(axis, line, i), values[cf.x][cf.y]);
                for (std::size_t i = last + 1; i < len; ++i) propose(cell(axis, line, i), values[cl.x][cl.y]);
            }
        };

        auto commit = [&]() {
            bool changed = false;
            for (std::size_t x = 0; x < xCount; ++x) {
                for (std::size_t y = 0; y < yCount; ++y) {
                    if (hits[x][y] == 0) continue;
                    if (!valid[x][y]) {
                        values[x][y] = proposed[x][y];
                        valid[x][y] = true;
                        changed = true;
                    }
                    hits[x][y] = 0;
                }
            }
            return changed;
        };

        while (true) {
            interpolateLines(0);
            interpolateLines(1);
            if (commit()) continue;
            extendLines(0);
            extendLines(1);
            if (commit()) continue;
            break;
        }
    }

    serde::SerdeException deserializeFromFghj(const serde::Fghj& data) override;

protected:
    Parameter* parameter{};
    BindTarget target{};
    int component_{-1};
    std::vector<std::vector<T>> values{};
    std::vector<std::vector<bool>> isSetFlags{};
    InterpolateMode interpolateMode_{InterpolateMode::Linear};

    virtual void applyToTarget(const T& value, NodeOffsets& out) const = 0;
    virtual void clearValue(T& v) const { v = T{}; }
    virtual void readValue(const serde::Fghj& node, T& out) const = 0;
    // Throws PuppetLoadError when the target node cannot take this binding.
    virtual void checkTarget(const nodes::Node& /*node*/) {}
    virtual void checkValue(const T& /*value*/) const {}

    std::string describe() const {
        return std::string("binding ") + bindingPropertyName(target.property) + " of parameter '" +
               (parameter ? parameter->name : std::string("<null>")) + "'";
    }

    T interpolate(const Vec2u& leftKeypoint, const Vec2& offset) const {
        const auto lx = std::min<std::size_t>(leftKeypoint.x, values.size() - 1);
        const auto ly = std::min<std::size_t>(leftKeypoint.y, values[lx].size() - 1);
        const bool is2D = parameter && parameter->isVec2 && values.front().size() > 1;

        auto sample = [&](std::size_t x, std::size_t y) -> const T& {
            x = std::min<std::size_t>(x, values.size() - 1);
            y = std::min<std::size_t>(y, values[x].size() - 1);
            return values[x][y];
        };

        const float tx = std::clamp(offset.x, 0.0f, 1.0f);
        const float ty = is2D ? std::clamp(offset.y, 0.0f, 1.0f) : 0.0f;

        if (interpolateMode_ == InterpolateMode::Nearest) {
            return sample(lx + (tx >= 0.5f ? 1 : 0), ly + (ty >= 0.5f ? 1 : 0));
        }
        if (interpolateMode_ == InterpolateMode::Step) {
            // The right edge of the last interval is a breakpoint of its own.
            return sample(lx + (tx >= 1.0f ? 1 : 0), ly + (ty >= 1.0f ? 1 : 0));
        }

        if (interpolateMode_ == InterpolateMode::Cubic) {
            const auto xlen = static_cast<std::ptrdiff_t>(values.size() - 1);
            const auto ylen = static_cast<std::ptrdiff_t>(values.front().size() - 1);
            const auto xkp = static_cast<std::ptrdiff_t>(lx);
            const auto ykp = static_cast<std::ptrdiff_t>(ly);
            auto xAt = [&](std::ptrdiff_t d) { return static_cast<std::size_t>(std::clamp<std::ptrdiff_t>(xkp + d, 0, xlen)); };
            auto yAt = [&](std::ptrdiff_t d) { return static_cast<std::size_t>(std::clamp<std::ptrdiff_t>(ykp + d, 0, ylen)); };
            auto row = [&](std::size_t y) {
                return cubicValue(sample(xAt(-1), y), sample(xAt(0), y), sample(xAt(1), y), sample(xAt(2), y), tx);
            };
            if (!is2D) return row(0);
            return cubicValue(row(yAt(-1)), row(yAt(0)), row(yAt(1)), row(yAt(2)), ty);
        }

        if (!is2D) {
            return lerpValue(sample(lx, 0), sample(lx + 1, 0), tx);
        }
        const auto p0 = lerpValue(sample(lx, ly), sample(lx, ly + 1), ty);
        const auto p1 = lerpValue(sample(lx + 1, ly), sample(lx + 1, ly + 1), ty);
        return lerpValue(p0, p1, tx);
    }
};

// Rotation and opacity offsets.
class ValueParameterBinding : public ParameterBindingImpl<float> {
public:
    ValueParameterBinding(Parameter* parameter, uint32_t nodeUuid, BindingProperty property)
        : ParameterBindingImpl<float>(parameter, nodeUuid, property) {}

protected:
    void applyToTarget(const float& value, NodeOffsets& out) const override {
        if (target.property == BindingProperty::Rotation) {
            out.rotation += value;
        } else {
            out.opacity += value;
        }
    }

    void readValue(const serde::Fghj& node, float& out) const override { out = node.get_value<float>(); }

    void checkValue(const float& value) const override {
        if (!std::isfinite(value)) {
            throw PuppetLoadError(LoadErrorKind::MalformedStructure, describe() + " stores a non-finite value");
        }
    }
};

// Translation and scale offsets. A binding created for a single component
// ("transform.t.x") stores scalars and leaves the other component at 0.
class VectorParameterBinding : public ParameterBindingImpl<Vec2> {
public:
    VectorParameterBinding(Parameter* parameter, uint32_t nodeUuid, BindingProperty property, int component)
        : ParameterBindingImpl<Vec2>(parameter, nodeUuid, property, component) {}

protected:
    void applyToTarget(const Vec2& value, NodeOffsets& out) const override {
        if (target.property == BindingProperty::Translation) {
            out.translation = out.translation + value;
        } else {
            out.scale = out.scale + value;
        }
    }

    void readValue(const serde::Fghj& node, Vec2& out) const override {
        if (component_ == 0) {
            out = Vec2{node.get_value<float>(), 0.0f};
        } else if (component_ == 1) {
            out = Vec2{0.0f, node.get_value<float>()};
        } else {
            float xy[2]{0.0f, 0.0f};
            serde::readFloats(node, xy, 2);
            out = Vec2{xy[0], xy[1]};
        }
    }

    void checkValue(const Vec2& value) const override {
        if (!math::isFinite(value)) {
            throw PuppetLoadError(LoadErrorKind::MalformedStructure, describe() + " stores a non-finite value");
        }
    }
};

// Per-vertex displacement of a Part or Mask mesh.
class DeformationParameterBinding : public ParameterBindingImpl<DeformSlot> {
public:
    DeformationParameterBinding(Parameter* parameter, uint32_t nodeUuid)
        : ParameterBindingImpl<DeformSlot>(parameter, nodeUuid, BindingProperty::VertexDeform) {}

    void update(const Vec2u& point, const Vec2Array& offsets) {
        setValue(point, DeformSlot{offsets});
    }

    std::size_t vertexCount() const { return vertexCount_; }

protected:
    std::size_t vertexCount_{0};

    void applyToTarget(const DeformSlot& value, NodeOffsets& out) const override {
        if (value.vertexOffsets.size() != out.deform.size()) return;
        out.deform += value.vertexOffsets;
        out.hasDeform = true;
    }

    void clearValue(DeformSlot& v) const override {
        v.vertexOffsets.resize(vertexCount_);
        v.vertexOffsets.fill(Vec2{0.0f, 0.0f});
    }

    void checkTarget(const nodes::Node& node) override {
        if (!nodes::hasMesh(node.kind)) {
            throw PuppetLoadError(LoadErrorKind::MalformedStructure,
                                  describe() + " targets " + nodes::nodeKindName(node.kind) + " '" + node.name +
                                      "', which has no mesh");
        }
        vertexCount_ = node.mesh.vertexCount();
    }

    void checkValue(const DeformSlot& value) const override {
        if (value.vertexOffsets.size() != vertexCount_) {
            throw PuppetLoadError(LoadErrorKind::VertexCountMismatch,
                                  describe() + " stores " + std::to_string(value.vertexOffsets.size()) +
                                      " offsets for a mesh of " + std::to_string(vertexCount_) + " vertices");
        }
        for (std::size_t i = 0; i < value.vertexOffsets.size(); ++i) {
            if (!std::isfinite(value.vertexOffsets.xAt(i)) || !std::isfinite(value.vertexOffsets.yAt(i))) {
                throw PuppetLoadError(LoadErrorKind::MalformedStructure, describe() + " stores a non-finite offset");
            }
        }
    }

    // Accepts a list of [x, y] pairs, a list of {"x", "y"} objects, or {"x": [...], "y": [...]}.
    void readValue(const serde::Fghj& node, DeformSlot& out) const override {
        out.vertexOffsets.clear();
        const auto xsIt = node.find("x");
        const auto ysIt = node.find("y");
        if (xsIt != node.not_found() && ysIt != node.not_found() && !xsIt->second.empty()) {
            const auto xs = serde::readFloatList(xsIt->second);
            const auto ys = serde::readFloatList(ysIt->second);
            if (xs.size() != ys.size()) {
                throw std::runtime_error("deform offsets have " + std::to_string(xs.size()) + " x and " +
                                         std::to_string(ys.size()) + " y components");
            }
            out.vertexOffsets.resize(xs.size());
            for (std::size_t i = 0; i < xs.size(); ++i) out.vertexOffsets.set(i, Vec2{xs[i], ys[i]});
            return;
        }
        for (const auto& elem : node) {
            const auto& v = elem.second;
            if (auto ox = v.get_optional<float>("x")) {
                out.vertexOffsets.push_back(Vec2{*ox, v.get<float>("y", 0.0f)});
                continue;
            }
            float xy[2]{0.0f, 0.0f};
            serde::readFloats(v, xy, 2);
            out.vertexOffsets.push_back(Vec2{xy[0], xy[1]});
        }
    }
};

template <typename T>
serde::SerdeException ParameterBindingImpl<T>::deserializeFromFghj(const serde::Fghj& data) {
    try {
        target.uuid = data.get<uint32_t>("node", target.uuid);
        interpolateMode_ = InterpolateMode::Linear;
        if (auto modeStr = data.get_optional<std::string>("interpolate_mode")) {
            auto mode = parseInterpolateMode(*modeStr);
            if (mode) {
                interpolateMode_ = *mode;
            } else if (auto modeInt = data.get_optional<int>("interpolate_mode")) {
                if (*modeInt < 0 || *modeInt > static_cast<int>(InterpolateMode::Step)) {
                    return std::string("unknown interpolate_mode ") + *modeStr;
                }
                interpolateMode_ = static_cast<InterpolateMode>(*modeInt);
            } else {
                return std::string("unknown interpolate_mode ") + *modeStr;
            }
        }

        static const serde::Fghj empty{};
        const auto valuesIt = data.find("values");
        const auto isSetIt = data.find("isSet");
        const auto& valuesTree = valuesIt != data.not_found() ? valuesIt->second : empty;
        const bool hasIsSet = isSetIt != data.not_found();

        const auto xCount = parameter ? parameter->axisPointCount(0) : valuesTree.size();
        const auto yCount = parameter ? parameter->axisPointCount(1) : 1;
        if (valuesTree.size() != xCount) {
            return "expected " + std::to_string(xCount) + " value columns, got " + std::to_string(valuesTree.size());
        }

        values.assign(xCount, std::vector<T>(yCount, T{}));
        isSetFlags.assign(xCount, std::vector<bool>(yCount, !hasIsSet));

        std::size_t xi = 0;
        for (const auto& row : valuesTree) {
            if (row.second.size() != yCount) {
                return "expected " + std::to_string(yCount) + " values in column " + std::to_string(xi) + ", got " +
                       std::to_string(row.second.size());
            }
            std::size_t yi = 0;
            for (const auto& valNode : row.second) {
                readValue(valNode.second, values[xi][yi]);
                ++yi;
            }
            ++xi;
        }

        if (hasIsSet) {
            xi = 0;
            for (const auto& row : isSetIt->second) {
                if (xi >= isSetFlags.size()) return std::string("isSet has more columns than values");
                std::size_t yi = 0;
                for (const auto& flag : row.second) {
                    if (yi >= isSetFlags[xi].size()) return std::string("isSet has more rows than values");
                    isSetFlags[xi][yi] = flag.second.get_value<bool>();
                    ++yi;
                }
                ++xi;
            }
        }
    } catch (const std::exception& ex) {
        return std::string(ex.what());
    }
    return std::nullopt;
}

} // namespace marionette::core::param
