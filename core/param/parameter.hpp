#pragma once

#include "values.hpp"
#include "../serde.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace marionette::core::param {

struct Vec2u {
    std::size_t x{};
    std::size_t y{};
};

class ParameterBinding;

class Parameter {
public:
    uint32_t uuid{0};
    std::string name{};
    bool isVec2{false};
    Vec2 min{0, 0};
    Vec2 max{1, 1};
    Vec2 defaults{0, 0};
    Vec2 value{0, 0};
    // Normalized breakpoints per axis, ascending. A 1D parameter keeps a single {0} on axis 1.
    std::array<std::vector<float>, 2> axisPoints{{{0, 1}, {0}}};
    std::vector<std::shared_ptr<ParameterBinding>> bindings{};

    Parameter() = default;
    Parameter(const std::string& n, bool vec2);
    Parameter(const Parameter&) = delete;
    Parameter& operator=(const Parameter&) = delete;

    std::size_t axisPointCount(std::size_t axis) const;
    float axisPointValue(std::size_t axis, std::size_t idx) const;

    // Each axis is clamped into [min, max]. Non-finite input leaves the value untouched and returns false.
    bool setValue(float x);
    bool setValue(float x, float y);
    void reset() { value = clampToRange(defaults); }
    Vec2 clampToRange(const Vec2& v) const;

    // Clamped value mapped into [0, 1] per axis; a zero-width range maps to 0.
    Vec2 normalizedValue() const;
    // Locates the breakpoint interval containing `offset` and the fractional position inside it.
    void findOffset(const Vec2& offset, Vec2u& leftKeypoint, Vec2& subOffset) const;

    void addBinding(const std::shared_ptr<ParameterBinding>& binding);

    // Empty when range and breakpoints are usable.
    std::string validationError() const;

    // Reads uuid, name, is_vec2, min, max, defaults and axis_points. Bindings are read by the puppet reader.
    serde::SerdeException deserializeFromFghj(const serde::Fghj& data);
};

} // namespace marionette::core::param
