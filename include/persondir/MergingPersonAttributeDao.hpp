/**
 * @file MergingPersonAttributeDao.hpp
 * @brief Attribute source aggregating several child sources
 */

#ifndef PERSONDIR_MERGING_PERSON_ATTRIBUTE_DAO_HPP
#define PERSONDIR_MERGING_PERSON_ATTRIBUTE_DAO_HPP

#include "persondir/Merger.hpp"
#include "persondir/PersonAttributeDao.hpp"

#include <memory>
#include <vector>

namespace persondir {

/**
 * @brief Sends every query to each child source and merges the answers
 *
 * Children are queried in order. The first child's answer seeds the
 * result; each following answer is merged into it with the configured
 * AttributeMerger, so earlier children act as the "existing" side of
 * every merge.
 *
 * Configuration:
 *
 * | Property           | Required | Default                               |
 * |--------------------|----------|---------------------------------------|
 * | merger             | No       | AdditiveAttributeMerger (multivalued) |
 * | recover_exceptions | No       | false                                 |
 */
class MergingPersonAttributeDao : public DefaultAttributePersonAttributeDao {
public:
    /**
     * @throws InvalidArgument if @p children contains a null source
     */
    explicit MergingPersonAttributeDao(std::vector<std::shared_ptr<PersonAttributeDao>> children);

    /**
     * @throws InvalidArgument if a child or @p merger is null
     */
    MergingPersonAttributeDao(std::vector<std::shared_ptr<PersonAttributeDao>> children,
                              std::shared_ptr<AttributeMerger> merger);

    PersonSet get_people_with_multivalued_attributes(const AttributeMap& seed) override;

    std::set<std::string> get_available_query_attributes() override;

    std::set<std::string> get_possible_user_attribute_names() override;

    /**
     * @brief When true, a failing child is logged and skipped instead of
     *        failing the whole query
     */
    void set_recover_exceptions(bool recover) noexcept { recover_exceptions_ = recover; }
    bool recover_exceptions() const noexcept { return recover_exceptions_; }

    const std::shared_ptr<AttributeMerger>& merger() const noexcept { return merger_; }

private:
    std::vector<std::shared_ptr<PersonAttributeDao>> children_;
    std::shared_ptr<AttributeMerger> merger_;
    bool recover_exceptions_ = false;
};

} // namespace persondir

#endif // PERSONDIR_MERGING_PERSON_ATTRIBUTE_DAO_HPP
