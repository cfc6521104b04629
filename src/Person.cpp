/**
 * @file Person.cpp
 * @brief Implementation of person attribute records
 */

#include "persondir/Person.hpp"
#include "persondir/AttributeMaps.hpp"

#include <utility>

namespace persondir {

PersonAttributes::PersonAttributes(std::optional<std::string> name, AttributeMap attributes)
    : name_(std::move(name))
    , attributes_(std::move(attributes))
{}

const AttributeValues* PersonAttributes::attribute_values(const std::string& attribute) const {
    auto it = attributes_.find(attribute);
    if (it == attributes_.end() || !it->second.has_value()) {
        return nullptr;
    }
    return &*it->second;
}

std::optional<Value> PersonAttributes::attribute_value(const std::string& attribute) const {
    const AttributeValues* values = attribute_values(attribute);
    if (values == nullptr || values->empty()) {
        return std::nullopt;
    }
    return values->front();
}

bool PersonAttributes::operator==(const PersonAttributes& other) const {
    return name_ == other.name_ && attributes_ == other.attributes_;
}

PersonPtr make_person(std::string name, AttributeMap attributes) {
    return std::make_shared<const PersonAttributes>(std::move(name), std::move(attributes));
}

PersonPtr make_unnamed_person(AttributeMap attributes) {
    return std::make_shared<const PersonAttributes>(std::nullopt, std::move(attributes));
}

PersonPtr find_person(const PersonSet& people, const std::string& name) {
    for (const auto& person : people) {
        if (person && person->name() == name) {
            return person;
        }
    }
    return nullptr;
}

std::string to_string(const PersonAttributes& person) {
    const std::string name = person.name().value_or("<unnamed>");
    return name + to_string(person.attributes());
}

} // namespace persondir
