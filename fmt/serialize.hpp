#pragma once

#include "../core/serde.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace marionette::core::fmt {

// Parses a JSON document. Throws std::runtime_error with the parser's position on malformed input.
inline serde::Fghj inParseJson(const std::string& data) {
    std::stringstream ss(data);
    serde::Fghj pt;
    try {
        boost::property_tree::read_json(ss, pt);
    } catch (const boost::property_tree::json_parser_error& e) {
        throw std::runtime_error("Invalid puppet JSON: " + std::string(e.what()));
    }
    return pt;
}

inline std::string inReadFile(const std::string& file) {
    std::ifstream ifs(file, std::ios::binary);
    if (!ifs) {
        throw std::runtime_error("Failed to open puppet file: " + file);
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return buffer.str();
}

} // namespace marionette::core::fmt
