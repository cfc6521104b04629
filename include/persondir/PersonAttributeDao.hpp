/**
 * @file PersonAttributeDao.hpp
 * @brief Attribute sources and single-identity lookup
 *
 * A PersonAttributeDao answers attribute queries for people. Queries are
 * attribute maps ("seeds"): the source returns every record matching the
 * seed. DefaultAttributePersonAttributeDao adds get_person(), which looks
 * up one identity by name through a one-entry seed.
 */

#ifndef PERSONDIR_PERSON_ATTRIBUTE_DAO_HPP
#define PERSONDIR_PERSON_ATTRIBUTE_DAO_HPP

#include "persondir/Person.hpp"
#include "persondir/Value.hpp"

#include <memory>
#include <set>
#include <string>

namespace persondir {

/**
 * @brief Supplies the attribute name that holds a person's username
 */
class UsernameAttributeProvider {
public:
    virtual ~UsernameAttributeProvider() = default;

    virtual std::string username_attribute() const = 0;
};

/**
 * @brief Fixed username attribute, "username" unless configured otherwise
 */
class SimpleUsernameAttributeProvider : public UsernameAttributeProvider {
public:
    static constexpr const char* kDefaultUsernameAttribute = "username";

    SimpleUsernameAttributeProvider() : SimpleUsernameAttributeProvider(kDefaultUsernameAttribute) {}
    explicit SimpleUsernameAttributeProvider(std::string username_attribute);

    std::string username_attribute() const override { return username_attribute_; }

private:
    std::string username_attribute_;
};

/**
 * @brief A source of person attributes
 */
class PersonAttributeDao {
public:
    virtual ~PersonAttributeDao() = default;

    /**
     * @brief Look up a single person by identity name
     * @return The matching record, or nullptr if there is none
     */
    virtual PersonPtr get_person(const std::string& uid) = 0;

    /**
     * @brief All records matching a multi-valued seed query
     */
    virtual PersonSet get_people_with_multivalued_attributes(const AttributeMap& seed) = 0;

    /// Attribute names this source can be queried by
    virtual std::set<std::string> get_available_query_attributes() = 0;

    /// Attribute names this source can return
    virtual std::set<std::string> get_possible_user_attribute_names() = 0;
};

/**
 * @brief Implements get_person() on top of get_people_with_multivalued_attributes()
 *
 * The seed maps the provider's username attribute to the single value
 * @p uid. At most one record may come back:
 * - none: nullptr
 * - one: that record; if it carries no name, a copy named @p uid
 * - more: IncorrectResultSize
 *
 * Configuration:
 *
 * | Property                  | Required | Default                          |
 * |---------------------------|----------|----------------------------------|
 * | username_attribute_provider | No     | SimpleUsernameAttributeProvider  |
 */
class DefaultAttributePersonAttributeDao : public PersonAttributeDao {
public:
    DefaultAttributePersonAttributeDao();

    /**
     * @throws IncorrectResultSize if more than one record matches
     */
    PersonPtr get_person(const std::string& uid) override;

    /**
     * @throws InvalidArgument if @p uid is null
     * @throws IncorrectResultSize if more than one record matches
     */
    PersonPtr get_person(const char* uid);

    const std::shared_ptr<UsernameAttributeProvider>& username_attribute_provider() const noexcept {
        return username_attribute_provider_;
    }

    /**
     * @throws InvalidArgument if @p provider is null
     */
    void set_username_attribute_provider(std::shared_ptr<UsernameAttributeProvider> provider);

protected:
    /**
     * @brief Build the one-entry seed `{username_attribute: [uid]}`
     */
    AttributeMap to_seed_map(const std::string& uid) const;

private:
    std::shared_ptr<UsernameAttributeProvider> username_attribute_provider_;
};

} // namespace persondir

#endif // PERSONDIR_PERSON_ATTRIBUTE_DAO_HPP
