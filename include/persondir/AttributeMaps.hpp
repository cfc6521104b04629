/**
 * @file AttributeMaps.hpp
 * @brief Attribute map helpers used by the mergers
 */

#ifndef PERSONDIR_ATTRIBUTE_MAPS_HPP
#define PERSONDIR_ATTRIBUTE_MAPS_HPP

#include "persondir/Value.hpp"

#include <string>

namespace persondir {

/**
 * @brief Allocate an empty attribute map
 *
 * The map keeps insertion order. Capacity is reserved for
 * @p expected_size entries, or for one entry if @p expected_size <= 0.
 */
AttributeMap new_attribute_map(int expected_size);

/**
 * @brief Copy an attribute map so the copy can be edited in place
 *
 * Keys keep their order. Every present value list is copied into a new
 * container, so appending to or erasing from a list in the copy never
 * touches @p source. Absent value lists stay absent.
 *
 * Example:
 * ```cpp
 * AttributeMap src;
 * src["mail"] = AttributeValues{"a@x.org"};
 * auto copy = copy_mutable(src);
 * copy["mail"]->push_back("b@x.org");
 * // src["mail"] still holds one value
 * ```
 */
AttributeMap copy_mutable(const AttributeMap& source);

/**
 * @brief Convert an attribute map to a JSON object
 *
 * Absent value lists become null, present ones become arrays.
 */
Value attributes_to_json(const AttributeMap& attributes);

/// Compact one-line rendering, e.g. `{dept=["eng"], phone=null}`
std::string to_string(const AttributeMap& attributes);

} // namespace persondir

#endif // PERSONDIR_ATTRIBUTE_MAPS_HPP
