/**
 * @file Merger.cpp
 * @brief Implementation of the additive merger
 */

#include "persondir/Merger.hpp"
#include "persondir/AttributeMaps.hpp"
#include "persondir/Errors.hpp"
#include "persondir/Log.hpp"

#include <algorithm>
#include <unordered_map>
#include <utility>

namespace persondir {

namespace {

/**
 * @brief Reject null record handles before anything is modified
 */
void require_records(const PersonSet& people, const char* what) {
    for (const auto& person : people) {
        if (!person) {
            throw InvalidArgument(std::string(what) + " cannot contain null records");
        }
    }
}

/**
 * @brief Drops the slots emptied by replaced records in one pass
 *
 * Runs on scope exit, so a throwing strategy still leaves the set free
 * of null handles.
 */
class EmptySlotCompactor {
public:
    explicit EmptySlotCompactor(PersonSet& people) : people_(people) {}
    ~EmptySlotCompactor() {
        if (has_empty_slots_) {
            people_.erase(std::remove(people_.begin(), people_.end(), nullptr), people_.end());
        }
    }

    EmptySlotCompactor(const EmptySlotCompactor&) = delete;
    EmptySlotCompactor& operator=(const EmptySlotCompactor&) = delete;

    void empty_slot(std::size_t slot) noexcept {
        people_[slot] = nullptr;
        has_empty_slots_ = true;
    }

private:
    PersonSet& people_;
    bool has_empty_slots_ = false;
};

} // anonymous namespace

AdditiveAttributeMerger::AdditiveAttributeMerger(MergeStrategy strategy)
    : strategy_(std::move(strategy))
{
    if (!strategy_) {
        throw InvalidArgument("merge strategy cannot be empty");
    }
}

std::set<std::string>& AdditiveAttributeMerger::merge_available_query_attributes(
    std::set<std::string>& to_modify, const std::set<std::string>& to_consider) {
    to_modify.insert(to_consider.begin(), to_consider.end());
    return to_modify;
}

std::set<std::string>& AdditiveAttributeMerger::merge_possible_user_attribute_names(
    std::set<std::string>& to_modify, const std::set<std::string>& to_consider) {
    to_modify.insert(to_consider.begin(), to_consider.end());
    return to_modify;
}

PersonSet& AdditiveAttributeMerger::merge_results(PersonSet& to_modify, const PersonSet& to_consider) {
    require_records(to_modify, "to_modify");
    require_records(to_consider, "to_consider");

    if (&to_modify == &to_consider) {
        const PersonSet incoming(to_consider);
        return merge_results(to_modify, incoming);
    }

    // Slot of each named record in to_modify, last one wins on duplicate names
    std::unordered_map<std::string, std::size_t> slot_by_name;
    slot_by_name.reserve(to_modify.size() + to_consider.size());
    for (std::size_t i = 0; i < to_modify.size(); ++i) {
        if (to_modify[i]->name().has_value()) {
            slot_by_name[*to_modify[i]->name()] = i;
        }
    }

    {
        // Replaced records leave an empty slot until the compactor runs
        EmptySlotCompactor compactor(to_modify);

        for (const auto& candidate : to_consider) {
            // Unnamed records never match
            if (!candidate->name().has_value()) {
                to_modify.push_back(candidate);
                continue;
            }

            const std::string& name = *candidate->name();
            auto it = slot_by_name.find(name);

            if (it == slot_by_name.end()) {
                slot_by_name.emplace(name, to_modify.size());
                to_modify.push_back(candidate);
                continue;
            }

            const std::size_t old_slot = it->second;
            const PersonAttributes& existing = *to_modify[old_slot];
            AttributeMap merged = strategy_(copy_mutable(existing.attributes()), candidate->attributes());
            PersonPtr merged_person = make_person(name, std::move(merged));

            if (logger()->should_log(spdlog::level::debug)) {
                logger()->debug("Merged attributes for '{}': {}", name, to_string(merged_person->attributes()));
            }

            // Records are immutable: the replacement goes to the end
            to_modify.push_back(std::move(merged_person));
            compactor.empty_slot(old_slot);
            it->second = to_modify.size() - 1;
        }
    }

    return to_modify;
}

AttributeMap AdditiveAttributeMerger::merge_attributes(AttributeMap to_modify, const AttributeMap& to_consider) {
    return strategy_(std::move(to_modify), to_consider);
}

} // namespace persondir
