/**
 * @file Loader.hpp
 * @brief File loading utilities
 *
 * Implements loading of:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 * - Person files: JSON arrays of person records
 *
 * Person file layout:
 * ```json
 * [
 *   {"name": "bob", "attributes": {"dept": ["eng"], "phone": null}},
 *   {"attributes": {"uid": ["carol"]}}
 * ]
 * ```
 * `name` may be omitted or null. Each attribute holds an array of values
 * or null.
 */

#ifndef PERSONDIR_LOADER_HPP
#define PERSONDIR_LOADER_HPP

#include "persondir/Person.hpp"
#include "persondir/Value.hpp"

#include <string>

namespace persondir {

// ============================================================================
// JSON / TOML File Loading
// ============================================================================

/**
 * @brief Load a JSON file.
 *
 * @param path Path to the JSON file
 * @return Parsed Value object
 * @throws FileNotFoundError if file doesn't exist
 * @throws ConfigParseError if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a TOML file.
 *
 * TOML tables map to nested objects; dates and times become strings.
 *
 * @param path Path to the TOML file
 * @return Parsed Value object
 * @throws FileNotFoundError if file doesn't exist
 * @throws ConfigParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a file, detecting the format by extension.
 *
 * - Empty path: returns an empty object (no file loaded)
 * - `.json`: JSON
 * - `.toml`: TOML
 *
 * @param path Path to file (empty string = no file)
 * @return Parsed Value object, or empty object if path is empty
 * @throws FileNotFoundError if path is non-empty and file doesn't exist
 * @throws ConfigParseError if file has syntax errors
 * @throws ConfigError if extension is not .json or .toml
 */
Value load_config_file(const std::string& path);

/**
 * @brief Get file extension (lowercase).
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

// ============================================================================
// Person Documents
// ============================================================================

/**
 * @brief Decode an attribute map from a JSON object
 *
 * @param doc JSON object of attribute name to array-or-null
 * @param where Location used in error messages
 * @throws DataFormatError if @p doc is not of that shape
 */
AttributeMap attributes_from_json(const Value& doc, const std::string& where);

/**
 * @brief Decode a person set from a JSON array of records
 *
 * @param doc JSON array
 * @param where Location used in error messages (usually the file path)
 * @throws DataFormatError if @p doc is not of that shape
 */
PersonSet people_from_json(const Value& doc, const std::string& where);

/**
 * @brief Encode a person set as a JSON array of records
 *
 * Unnamed records are written with `"name": null`.
 */
Value people_to_json(const PersonSet& people);

/**
 * @brief Load a person file
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ConfigParseError if the JSON is invalid
 * @throws DataFormatError if the records have the wrong shape
 */
PersonSet load_people_file(const std::string& path);

} // namespace persondir

#endif // PERSONDIR_LOADER_HPP
