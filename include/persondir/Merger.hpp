/**
 * @file Merger.hpp
 * @brief Merging of person record sets and attribute name sets
 *
 * An AttributeMerger combines the answers of two attribute sources:
 * - Record sets: records sharing an identity name are combined into one
 * - Query attribute names: names a source can be queried by
 * - User attribute names: names a source can return
 *
 * AdditiveAttributeMerger fixes identity matching, copy safety and set
 * bookkeeping, and delegates the combination of two attribute maps for
 * the same identity to an injected MergeStrategy.
 */

#ifndef PERSONDIR_MERGER_HPP
#define PERSONDIR_MERGER_HPP

#include "persondir/Person.hpp"
#include "persondir/Value.hpp"

#include <functional>
#include <set>
#include <string>

namespace persondir {

/**
 * @brief Combines two attribute maps describing the same identity
 *
 * The first argument is an independent copy owned by the strategy: it may
 * be edited in place and returned, or ignored in favour of a new map. The
 * second argument must not be modified.
 */
using MergeStrategy = std::function<AttributeMap(AttributeMap to_modify, const AttributeMap& to_consider)>;

/**
 * @brief Interface for merging the results of two attribute sources
 */
class AttributeMerger {
public:
    virtual ~AttributeMerger() = default;

    /**
     * @brief Merge the attribute names a source can be queried by
     * @return @p to_modify after the merge
     */
    virtual std::set<std::string>& merge_available_query_attributes(
        std::set<std::string>& to_modify, const std::set<std::string>& to_consider) = 0;

    /**
     * @brief Merge the attribute names a source can return
     * @return @p to_modify after the merge
     */
    virtual std::set<std::string>& merge_possible_user_attribute_names(
        std::set<std::string>& to_modify, const std::set<std::string>& to_consider) = 0;

    /**
     * @brief Merge the records of @p to_consider into @p to_modify
     * @return @p to_modify after the merge
     * @throws InvalidArgument if either set holds a null record handle
     */
    virtual PersonSet& merge_results(PersonSet& to_modify, const PersonSet& to_consider) = 0;

    /**
     * @brief Merge two attribute maps for one identity
     */
    virtual AttributeMap merge_attributes(AttributeMap to_modify, const AttributeMap& to_consider) = 0;
};

/**
 * @brief Additive merger with a pluggable per-identity strategy
 *
 * merge_results():
 * - A record whose name is not in @p to_modify is appended as is (the
 *   same handle, not a copy).
 * - A record whose name is already in @p to_modify is combined with the
 *   existing one: the strategy receives a mutable copy of the existing
 *   attributes and the incoming attributes; the existing record is removed
 *   and a new record carrying the merged attributes is appended.
 * - Records without a name never match anything and are always appended.
 *
 * The two name-set mergers perform a plain union. Subclasses may override
 * them; merge_results() is final.
 *
 * Example:
 * ```cpp
 * AdditiveAttributeMerger merger(multivalued_strategy());
 * PersonSet a{make_person("bob", {{"dept", AttributeValues{"eng"}}})};
 * PersonSet b{make_person("bob", {{"title", AttributeValues{"dev"}}})};
 * merger.merge_results(a, b);
 * // a: {bob{dept=["eng"], title=["dev"]}}
 * ```
 */
class AdditiveAttributeMerger : public AttributeMerger {
public:
    /**
     * @param strategy Per-identity attribute combination
     * @throws InvalidArgument if @p strategy is empty
     */
    explicit AdditiveAttributeMerger(MergeStrategy strategy);

    std::set<std::string>& merge_available_query_attributes(
        std::set<std::string>& to_modify, const std::set<std::string>& to_consider) override;

    std::set<std::string>& merge_possible_user_attribute_names(
        std::set<std::string>& to_modify, const std::set<std::string>& to_consider) override;

    PersonSet& merge_results(PersonSet& to_modify, const PersonSet& to_consider) final;

    AttributeMap merge_attributes(AttributeMap to_modify, const AttributeMap& to_consider) override;

private:
    MergeStrategy strategy_;
};

} // namespace persondir

#endif // PERSONDIR_MERGER_HPP
