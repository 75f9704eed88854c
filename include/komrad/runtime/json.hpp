// json.hpp - JSON text <-> runtime values, used by the Json system agent
#pragma once
#include "komrad/value.hpp"
#include <stdexcept>
#include <string>
#include <string_view>

namespace komrad {

struct json_error : std::runtime_error {
    explicit json_error(const std::string& message) : std::runtime_error(message) {}
    json_error(const std::string& message, std::size_t offset_)
        : std::runtime_error(message + " at offset " + std::to_string(offset_)), offset(offset_) {}
    std::size_t offset = 0;
};

// Maps keep insertion order; words encode as strings. Agents and blocks cannot be encoded.
std::string to_json(const value& v);
// Integers without fraction or exponent decode to Int, other numbers to Float, null to unit.
value from_json(std::string_view text);

} // namespace komrad
