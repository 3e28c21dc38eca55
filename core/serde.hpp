#pragma once

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <optional>
#include <string>
#include <vector>

namespace marionette::core::serde {

using Fghj = boost::property_tree::ptree;
using SerdeException = std::optional<std::string>;

// Reads up to n numbers from a JSON array node. Missing entries keep their previous value.
inline void readFloats(const Fghj& node, float* dst, std::size_t n) {
    std::size_t i = 0;
    for (const auto& elem : node) {
        if (i >= n) break;
        dst[i++] = elem.second.get_value<float>();
    }
}

inline std::vector<float> readFloatList(const Fghj& node) {
    std::vector<float> out;
    out.reserve(node.size());
    for (const auto& elem : node) {
        out.push_back(elem.second.get_value<float>());
    }
    return out;
}

template <typename T>
std::vector<T> readList(const Fghj& node) {
    std::vector<T> out;
    out.reserve(node.size());
    for (const auto& elem : node) {
        out.push_back(elem.second.get_value<T>());
    }
    return out;
}

} // namespace marionette::core::serde
