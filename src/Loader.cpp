/**
 * @file Loader.cpp
 * @brief File loading implementation
 *
 * Implements file loading for:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 * - Person files (JSON arrays of records)
 */

#include "persondir/Loader.hpp"
#include "persondir/AttributeMaps.hpp"
#include "persondir/Errors.hpp"
#include "persondir/Util.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <type_traits>

namespace fs = std::filesystem;

namespace persondir {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

/**
 * @brief Check if file exists.
 */
bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/**
 * @brief Read entire file into string.
 */
std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

// Dates and times have no JSON counterpart; keep their TOML text form
template <typename T>
Value to_text(const T& value) {
    std::ostringstream ss;
    ss << value;
    return Value(ss.str());
}

Value toml_to_value(const toml::node& node) {
    if (const auto* table = node.as_table()) {
        Value obj = Value::object();
        for (const auto& [key, child] : *table) {
            obj[std::string(key.str())] = toml_to_value(child);
        }
        return obj;
    }
    if (const auto* array = node.as_array()) {
        Value arr = Value::array();
        for (const auto& child : *array) {
            arr.push_back(toml_to_value(child));
        }
        return arr;
    }

    return node.visit([](const auto& leaf) -> Value {
        using Leaf = std::decay_t<decltype(leaf)>;
        if constexpr (toml::is_string<Leaf> || toml::is_integer<Leaf> ||
                      toml::is_floating_point<Leaf> || toml::is_boolean<Leaf>) {
            return Value(leaf.get());
        } else if constexpr (toml::is_date<Leaf> || toml::is_time<Leaf> || toml::is_date_time<Leaf>) {
            return to_text(leaf.get());
        } else {
            return Value(nullptr);
        }
    });
}

} // anonymous namespace

// ============================================================================
// JSON File Loading
// ============================================================================

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string content = read_file(path);

    try {
        return Value::parse(content);
    } catch (const Value::parse_error& e) {
        throw ConfigParseError(path, 0, 0, e.what());
    }
}

// ============================================================================
// TOML File Loading
// ============================================================================

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        throw ConfigParseError(
            path,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }

    return toml_to_value(table);
}

// ============================================================================
// Auto-detect File Loading
// ============================================================================

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

Value load_config_file(const std::string& path) {
    if (path.empty()) {
        return Value::object();
    }

    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);

    if (ext == ".json") {
        return load_json_file(path);
    } else if (ext == ".toml") {
        return load_toml_file(path);
    } else {
        throw ConfigError(
            "Unsupported config file type: " + ext + " (expected .json or .toml)"
        );
    }
}

// ============================================================================
// Person Documents
// ============================================================================

AttributeMap attributes_from_json(const Value& doc, const std::string& where) {
    if (!doc.is_object()) {
        throw DataFormatError(where, "expected object, got " + type_name(doc));
    }

    AttributeMap attributes = new_attribute_map(static_cast<int>(doc.size()));
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const Value& values = it.value();
        if (values.is_null()) {
            attributes[it.key()] = std::nullopt;
        } else if (values.is_array()) {
            attributes[it.key()] = values.get<AttributeValues>();
        } else {
            throw DataFormatError(where + "." + it.key(),
                                  "expected array or null, got " + type_name(values));
        }
    }
    return attributes;
}

PersonSet people_from_json(const Value& doc, const std::string& where) {
    if (!doc.is_array()) {
        throw DataFormatError(where, "expected array of people, got " + type_name(doc));
    }

    PersonSet people;
    people.reserve(doc.size());

    for (std::size_t i = 0; i < doc.size(); ++i) {
        const Value& record = doc[i];
        const std::string at = where + "[" + std::to_string(i) + "]";

        if (!record.is_object()) {
            throw DataFormatError(at, "expected object, got " + type_name(record));
        }

        std::optional<std::string> name;
        auto name_it = record.find("name");
        if (name_it != record.end() && !name_it->is_null()) {
            if (!name_it->is_string()) {
                throw DataFormatError(at + ".name", "expected string or null, got " + type_name(*name_it));
            }
            name = name_it->get<std::string>();
        }

        AttributeMap attributes;
        auto attrs_it = record.find("attributes");
        if (attrs_it != record.end()) {
            attributes = attributes_from_json(*attrs_it, at + ".attributes");
        }

        people.push_back(std::make_shared<const PersonAttributes>(std::move(name), std::move(attributes)));
    }

    return people;
}

Value people_to_json(const PersonSet& people) {
    Value out = Value::array();
    for (const auto& person : people) {
        if (!person) continue;
        Value record = Value::object();
        record["name"] = person->name().has_value() ? Value(*person->name()) : Value(nullptr);
        record["attributes"] = attributes_to_json(person->attributes());
        out.push_back(std::move(record));
    }
    return out;
}

PersonSet load_people_file(const std::string& path) {
    return people_from_json(load_json_file(path), path);
}

} // namespace persondir
