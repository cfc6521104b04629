/**
 * @file StubPersonAttributeDao.cpp
 * @brief In-memory attribute source
 */

#include "persondir/StubPersonAttributeDao.hpp"
#include "persondir/Errors.hpp"
#include "persondir/Log.hpp"

#include <algorithm>
#include <utility>

namespace persondir {

StubPersonAttributeDao::StubPersonAttributeDao(PersonSet backing_people)
    : backing_people_(std::move(backing_people))
{
    for (const auto& person : backing_people_) {
        if (!person) {
            throw InvalidArgument("backing people cannot contain null records");
        }
    }
}

PersonSet StubPersonAttributeDao::get_people_with_multivalued_attributes(const AttributeMap& seed) {
    PersonSet found;
    if (seed.empty()) {
        return found;
    }

    for (const auto& person : backing_people_) {
        if (matches(*person, seed)) {
            found.push_back(person);
        }
    }

    logger()->debug("Stub source matched {} of {} records", found.size(), backing_people_.size());
    return found;
}

bool StubPersonAttributeDao::matches(const PersonAttributes& person, const AttributeMap& seed) const {
    const std::string username_attribute = username_attribute_provider()->username_attribute();

    for (const auto& [key, wanted] : seed) {
        if (!wanted.has_value() || wanted->empty()) {
            return false;
        }

        bool entry_matches = false;

        if (key == username_attribute && person.name().has_value()) {
            const Value name(*person.name());
            entry_matches = std::find(wanted->begin(), wanted->end(), name) != wanted->end();
        }

        if (!entry_matches) {
            if (const AttributeValues* held = person.attribute_values(key)) {
                entry_matches = std::any_of(wanted->begin(), wanted->end(), [held](const Value& v) {
                    return std::find(held->begin(), held->end(), v) != held->end();
                });
            }
        }

        if (!entry_matches) {
            return false;
        }
    }

    return true;
}

std::set<std::string> StubPersonAttributeDao::get_available_query_attributes() {
    std::set<std::string> names = get_possible_user_attribute_names();
    names.insert(username_attribute_provider()->username_attribute());
    return names;
}

std::set<std::string> StubPersonAttributeDao::get_possible_user_attribute_names() {
    std::set<std::string> names;
    for (const auto& person : backing_people_) {
        for (const auto& entry : person->attributes()) {
            names.insert(entry.first);
        }
    }
    return names;
}

} // namespace persondir
