#pragma once

#include "types.hpp"

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <vector>

namespace marionette::core::math {

// Structure-of-arrays storage for 2D points: one lane per component.
struct Vec2Array {
    std::vector<float> x{};
    std::vector<float> y{};

    Vec2Array() = default;
    explicit Vec2Array(std::size_t n) : x(n, 0.0f), y(n, 0.0f) {}
    Vec2Array(std::initializer_list<Vec2> init) {
        x.reserve(init.size());
        y.reserve(init.size());
        for (const auto& v : init) push_back(v);
    }

    std::size_t size() const { return x.size(); }
    bool empty() const { return x.empty(); }

    void resize(std::size_t n) {
        x.resize(n, 0.0f);
        y.resize(n, 0.0f);
    }

    void clear() {
        x.clear();
        y.clear();
    }

    void push_back(const Vec2& v) {
        x.push_back(v.x);
        y.push_back(v.y);
    }

    void fill(const Vec2& v) {
        std::fill(x.begin(), x.end(), v.x);
        std::fill(y.begin(), y.end(), v.y);
    }

    Vec2 at(std::size_t i) const { return Vec2{x.at(i), y.at(i)}; }
    Vec2 operator[](std::size_t i) const { return Vec2{x[i], y[i]}; }
    void set(std::size_t i, const Vec2& v) {
        x[i] = v.x;
        y[i] = v.y;
    }

    float& xAt(std::size_t i) { return x[i]; }
    float& yAt(std::size_t i) { return y[i]; }
    float xAt(std::size_t i) const { return x[i]; }
    float yAt(std::size_t i) const { return y[i]; }

    Vec2Array& operator+=(const Vec2Array& rhs) {
        const auto n = std::min(size(), rhs.size());
        for (std::size_t i = 0; i < n; ++i) {
            x[i] += rhs.x[i];
            y[i] += rhs.y[i];
        }
        return *this;
    }

    Vec2Array& operator-=(const Vec2Array& rhs) {
        const auto n = std::min(size(), rhs.size());
        for (std::size_t i = 0; i < n; ++i) {
            x[i] -= rhs.x[i];
            y[i] -= rhs.y[i];
        }
        return *this;
    }

    Vec2Array& operator*=(float s) {
        for (std::size_t i = 0; i < size(); ++i) {
            x[i] *= s;
            y[i] *= s;
        }
        return *this;
    }

    std::vector<Vec2> toArray() const {
        std::vector<Vec2> out;
        out.reserve(size());
        for (std::size_t i = 0; i < size(); ++i) out.push_back(Vec2{x[i], y[i]});
        return out;
    }

    static Vec2Array fromArray(const std::vector<Vec2>& src) {
        Vec2Array out;
        out.x.reserve(src.size());
        out.y.reserve(src.size());
        for (const auto& v : src) out.push_back(v);
        return out;
    }
};

} // namespace marionette::core::math
