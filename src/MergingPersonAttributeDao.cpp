/**
 * @file MergingPersonAttributeDao.cpp
 * @brief Aggregation of child attribute sources
 */

#include "persondir/MergingPersonAttributeDao.hpp"
#include "persondir/Errors.hpp"
#include "persondir/Log.hpp"
#include "persondir/Strategies.hpp"

#include <exception>
#include <utility>

namespace persondir {

namespace {

/**
 * @brief Query each child in order and fold the answers together
 *
 * The first successful answer becomes the result; later ones are merged
 * into it.
 */
template <typename Result, typename Query, typename Merge>
Result aggregate(const std::vector<std::shared_ptr<PersonAttributeDao>>& children,
                 bool recover_exceptions, const char* operation, Query query, Merge merge) {
    Result result{};
    bool seeded = false;

    for (std::size_t i = 0; i < children.size(); ++i) {
        Result answer{};
        try {
            answer = query(*children[i]);
        } catch (const std::exception& e) {
            if (!recover_exceptions) {
                throw;
            }
            logger()->warn("Source #{} failed in {}, skipping it: {}", i, operation, e.what());
            continue;
        }

        if (!seeded) {
            result = std::move(answer);
            seeded = true;
        } else {
            merge(result, answer);
        }
    }

    return result;
}

} // anonymous namespace

MergingPersonAttributeDao::MergingPersonAttributeDao(std::vector<std::shared_ptr<PersonAttributeDao>> children)
    : MergingPersonAttributeDao(std::move(children), make_additive_merger("multivalued"))
{}

MergingPersonAttributeDao::MergingPersonAttributeDao(std::vector<std::shared_ptr<PersonAttributeDao>> children,
                                                     std::shared_ptr<AttributeMerger> merger)
    : children_(std::move(children))
    , merger_(std::move(merger))
{
    if (!merger_) {
        throw InvalidArgument("merger may not be null");
    }
    for (const auto& child : children_) {
        if (!child) {
            throw InvalidArgument("child sources cannot contain null entries");
        }
    }
}

PersonSet MergingPersonAttributeDao::get_people_with_multivalued_attributes(const AttributeMap& seed) {
    return aggregate<PersonSet>(
        children_, recover_exceptions_, "get_people_with_multivalued_attributes",
        [&seed](PersonAttributeDao& child) { return child.get_people_with_multivalued_attributes(seed); },
        [this](PersonSet& to_modify, const PersonSet& to_consider) {
            merger_->merge_results(to_modify, to_consider);
        });
}

std::set<std::string> MergingPersonAttributeDao::get_available_query_attributes() {
    return aggregate<std::set<std::string>>(
        children_, recover_exceptions_, "get_available_query_attributes",
        [](PersonAttributeDao& child) { return child.get_available_query_attributes(); },
        [this](std::set<std::string>& to_modify, const std::set<std::string>& to_consider) {
            merger_->merge_available_query_attributes(to_modify, to_consider);
        });
}

std::set<std::string> MergingPersonAttributeDao::get_possible_user_attribute_names() {
    return aggregate<std::set<std::string>>(
        children_, recover_exceptions_, "get_possible_user_attribute_names",
        [](PersonAttributeDao& child) { return child.get_possible_user_attribute_names(); },
        [this](std::set<std::string>& to_modify, const std::set<std::string>& to_consider) {
            merger_->merge_possible_user_attribute_names(to_modify, to_consider);
        });
}

} // namespace persondir
