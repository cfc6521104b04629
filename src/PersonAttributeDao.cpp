/**
 * @file PersonAttributeDao.cpp
 * @brief Single-identity lookup on top of seed queries
 */

#include "persondir/PersonAttributeDao.hpp"
#include "persondir/AttributeMaps.hpp"
#include "persondir/Errors.hpp"
#include "persondir/Log.hpp"

#include <utility>

namespace persondir {

SimpleUsernameAttributeProvider::SimpleUsernameAttributeProvider(std::string username_attribute)
    : username_attribute_(std::move(username_attribute))
{}

DefaultAttributePersonAttributeDao::DefaultAttributePersonAttributeDao()
    : username_attribute_provider_(std::make_shared<SimpleUsernameAttributeProvider>())
{}

PersonPtr DefaultAttributePersonAttributeDao::get_person(const char* uid) {
    if (uid == nullptr) {
        throw InvalidArgument("uid may not be null");
    }
    return get_person(std::string(uid));
}

PersonPtr DefaultAttributePersonAttributeDao::get_person(const std::string& uid) {
    const AttributeMap seed = to_seed_map(uid);

    PersonSet people = get_people_with_multivalued_attributes(seed);

    if (people.empty()) {
        return nullptr;
    }
    if (people.size() > 1) {
        throw IncorrectResultSize(1, people.size());
    }

    PersonPtr person = people.front();
    if (!person) {
        return nullptr;
    }

    // The source did not report a name; the lookup key is the name
    if (!person->name().has_value()) {
        person = make_person(uid, person->attributes());
    }

    return person;
}

void DefaultAttributePersonAttributeDao::set_username_attribute_provider(
    std::shared_ptr<UsernameAttributeProvider> provider) {
    if (!provider) {
        throw InvalidArgument("username_attribute_provider may not be null");
    }
    username_attribute_provider_ = std::move(provider);
}

AttributeMap DefaultAttributePersonAttributeDao::to_seed_map(const std::string& uid) const {
    AttributeMap seed = new_attribute_map(1);
    seed[username_attribute_provider_->username_attribute()] = AttributeValues{Value(uid)};

    if (logger()->should_log(spdlog::level::debug)) {
        logger()->debug("Created seed map='{}' for uid='{}'", to_string(seed), uid);
    }
    return seed;
}

} // namespace persondir
