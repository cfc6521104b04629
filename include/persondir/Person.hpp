/**
 * @file Person.hpp
 * @brief Person attribute records and record sets
 *
 * A PersonAttributes record pairs an optional identity name with an
 * attribute map. Records are immutable once constructed and are shared
 * between sets through PersonPtr handles; a merge never edits a record,
 * it builds a replacement.
 */

#ifndef PERSONDIR_PERSON_HPP
#define PERSONDIR_PERSON_HPP

#include "persondir/Value.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace persondir {

/**
 * @brief One identity's resolved attributes
 */
class PersonAttributes {
public:
    /**
     * @brief Construct a record
     * @param name Identity name, or std::nullopt when the source did not report one
     * @param attributes Attribute map (taken by value)
     */
    PersonAttributes(std::optional<std::string> name, AttributeMap attributes);

    const std::optional<std::string>& name() const noexcept { return name_; }
    const AttributeMap& attributes() const noexcept { return attributes_; }

    /**
     * @brief Values of one attribute
     * @return Pointer to the value list, or nullptr if the attribute is
     *         missing or its value list is absent
     */
    const AttributeValues* attribute_values(const std::string& attribute) const;

    /**
     * @brief First value of one attribute
     * @return The first value, or std::nullopt if there is none
     */
    std::optional<Value> attribute_value(const std::string& attribute) const;

    bool operator==(const PersonAttributes& other) const;
    bool operator!=(const PersonAttributes& other) const { return !(*this == other); }

private:
    std::optional<std::string> name_;
    AttributeMap attributes_;
};

/// Shared handle to an immutable record
using PersonPtr = std::shared_ptr<const PersonAttributes>;

/**
 * @brief Insertion-ordered collection of records
 *
 * Holds at most one record per identity name once a merge completes.
 */
using PersonSet = std::vector<PersonPtr>;

/// Build a named record
PersonPtr make_person(std::string name, AttributeMap attributes);

/// Build a record without an identity name
PersonPtr make_unnamed_person(AttributeMap attributes);

/**
 * @brief Find a record by identity name
 * @return The first record with that name, or nullptr
 */
PersonPtr find_person(const PersonSet& people, const std::string& name);

/**
 * @brief Render a record for diagnostics
 *
 * Example: `bob{dept=["eng"], phone=null}`; an unset name renders as `<unnamed>`.
 */
std::string to_string(const PersonAttributes& person);

} // namespace persondir

#endif // PERSONDIR_PERSON_HPP
