/**
 * @file Strategies.hpp
 * @brief Built-in per-identity merge strategies
 *
 * Each function returns a MergeStrategy suitable for
 * AdditiveAttributeMerger. Given the existing attributes (to_modify) and
 * the incoming ones (to_consider):
 *
 * | strategy     | key only in to_consider | key in both                     |
 * |--------------|-------------------------|---------------------------------|
 * | replacing    | added                   | incoming list replaces existing |
 * | noncolliding | added                   | existing list kept              |
 * | multivalued  | added                   | incoming values appended        |
 *
 * Keys only in to_modify are always kept.
 */

#ifndef PERSONDIR_STRATEGIES_HPP
#define PERSONDIR_STRATEGIES_HPP

#include "persondir/Merger.hpp"

#include <memory>
#include <string>

namespace persondir {

/**
 * @brief Incoming value lists replace existing ones key by key
 *
 * An absent incoming list also replaces the existing one.
 */
MergeStrategy replacing_strategy();

/**
 * @brief Only keys missing from the existing map are added
 */
MergeStrategy noncolliding_strategy();

/**
 * @brief Incoming values are appended to existing lists
 *
 * - Existing list absent or key missing: a copy of the incoming list is stored
 * - Incoming list absent: existing list kept
 * - Both present: incoming values appended in order
 *
 * @param distinct_values If true, an incoming value already present in the
 *                        target list is skipped
 *
 * Example:
 * ```cpp
 * auto merge = multivalued_strategy();
 * // {mail=["a"]} + {mail=["b"], cn=["Bob"]}
 * // -> {mail=["a","b"], cn=["Bob"]}
 * ```
 */
MergeStrategy multivalued_strategy(bool distinct_values = false);

/**
 * @brief Look up a strategy by name
 *
 * Accepts "replacing", "noncolliding" and "multivalued", case-insensitive.
 *
 * @param name Strategy name
 * @param distinct_values Passed to multivalued_strategy()
 * @throws InvalidArgument for an unknown name
 */
MergeStrategy strategy_from_name(const std::string& name, bool distinct_values = false);

/**
 * @brief Build an AdditiveAttributeMerger around a named strategy
 * @throws InvalidArgument for an unknown name
 */
std::shared_ptr<AttributeMerger> make_additive_merger(const std::string& name, bool distinct_values = false);

} // namespace persondir

#endif // PERSONDIR_STRATEGIES_HPP
