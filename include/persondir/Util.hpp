#ifndef PERSONDIR_UTIL_HPP
#define PERSONDIR_UTIL_HPP

#include "persondir/Value.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace persondir {

// Merge b into a (recursively). Values in b take precedence.
void deep_merge(Value& a, const Value& b);

// Set a nested value by dot-notation, creating intermediate objects
void set_by_dot(Value& obj, const std::string& path, const Value& value);

// Get a nested value by dot-notation. Returns nullptr if missing.
const Value* find_by_dot(const Value& obj, const std::string& path);

// Check existence of a nested key by dot-notation.
bool exists_by_dot(const Value& obj, const std::string& path);

// Helpers
std::string to_lower(std::string s);
std::vector<std::string> split(const std::string& s, char delim);

// Parse an --overrides string: "k1:json, k2:json, ..."
std::map<std::string, Value> parse_overrides(const std::string& s);

// Environment iteration: returns pairs (NAME, VALUE)
std::vector<std::pair<std::string, std::string>> enumerate_environment();

// Try parsing string as JSON, otherwise return it as a string.
Value parse_json_or_string(const std::string& raw);

} // namespace persondir

#endif // PERSONDIR_UTIL_HPP
