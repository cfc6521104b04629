/**
 * @file StubPersonAttributeDao.hpp
 * @brief In-memory attribute source
 */

#ifndef PERSONDIR_STUB_PERSON_ATTRIBUTE_DAO_HPP
#define PERSONDIR_STUB_PERSON_ATTRIBUTE_DAO_HPP

#include "persondir/PersonAttributeDao.hpp"

namespace persondir {

/**
 * @brief Answers queries from a fixed set of records
 *
 * A record matches a seed when every seed entry `(key, values)` matches:
 * either the record's attribute `key` holds one of `values`, or `key` is
 * the username attribute and the record's name is one of `values`. An
 * empty seed, or an entry with an absent or empty value list, matches
 * nothing.
 */
class StubPersonAttributeDao : public DefaultAttributePersonAttributeDao {
public:
    /**
     * @throws InvalidArgument if @p backing_people contains a null record
     */
    explicit StubPersonAttributeDao(PersonSet backing_people);

    PersonSet get_people_with_multivalued_attributes(const AttributeMap& seed) override;

    std::set<std::string> get_available_query_attributes() override;

    std::set<std::string> get_possible_user_attribute_names() override;

    const PersonSet& backing_people() const noexcept { return backing_people_; }

private:
    bool matches(const PersonAttributes& person, const AttributeMap& seed) const;

    PersonSet backing_people_;
};

} // namespace persondir

#endif // PERSONDIR_STUB_PERSON_ATTRIBUTE_DAO_HPP
