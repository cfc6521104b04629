/**
 * @file AttributeMaps.cpp
 * @brief Implementation of attribute map helpers
 */

#include "persondir/AttributeMaps.hpp"

#include <sstream>

namespace persondir {

AttributeMap new_attribute_map(int expected_size) {
    AttributeMap map;
    map.reserve(expected_size > 0 ? static_cast<std::size_t>(expected_size) : 1);
    return map;
}

AttributeMap copy_mutable(const AttributeMap& source) {
    AttributeMap copy = new_attribute_map(static_cast<int>(source.size()));

    for (const auto& [key, values] : source) {
        if (values.has_value()) {
            copy[key] = AttributeValues(values->begin(), values->end());
        } else {
            copy[key] = std::nullopt;
        }
    }

    return copy;
}

Value attributes_to_json(const AttributeMap& attributes) {
    Value out = Value::object();
    for (const auto& [key, values] : attributes) {
        if (values.has_value()) {
            out[key] = Value(*values);
        } else {
            out[key] = nullptr;
        }
    }
    return out;
}

std::string to_string(const AttributeMap& attributes) {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [key, values] : attributes) {
        if (!first) oss << ", ";
        first = false;
        oss << key << "=";
        if (values.has_value()) {
            oss << Value(*values).dump();
        } else {
            oss << "null";
        }
    }
    oss << "}";
    return oss.str();
}

} // namespace persondir
