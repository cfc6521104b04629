/**
 * @file Strategies.cpp
 * @brief Implementation of the built-in merge strategies
 */

#include "persondir/Strategies.hpp"
#include "persondir/Errors.hpp"
#include "persondir/Util.hpp"

#include <algorithm>

namespace persondir {

MergeStrategy replacing_strategy() {
    return [](AttributeMap to_modify, const AttributeMap& to_consider) {
        for (const auto& [key, values] : to_consider) {
            to_modify[key] = values;
        }
        return to_modify;
    };
}

MergeStrategy noncolliding_strategy() {
    return [](AttributeMap to_modify, const AttributeMap& to_consider) {
        for (const auto& [key, values] : to_consider) {
            if (to_modify.find(key) == to_modify.end()) {
                to_modify[key] = values;
            }
        }
        return to_modify;
    };
}

MergeStrategy multivalued_strategy(bool distinct_values) {
    return [distinct_values](AttributeMap to_modify, const AttributeMap& to_consider) {
        for (const auto& [key, values] : to_consider) {
            auto it = to_modify.find(key);

            if (it == to_modify.end()) {
                to_modify[key] = values;
                continue;
            }
            if (!values.has_value()) {
                continue;
            }
            if (!it->second.has_value()) {
                it->second = values;
                continue;
            }

            AttributeValues& target = *it->second;
            for (const auto& value : *values) {
                if (distinct_values &&
                    std::find(target.begin(), target.end(), value) != target.end()) {
                    continue;
                }
                target.push_back(value);
            }
        }
        return to_modify;
    };
}

MergeStrategy strategy_from_name(const std::string& name, bool distinct_values) {
    const std::string lower = to_lower(name);
    if (lower == "replacing") {
        return replacing_strategy();
    }
    if (lower == "noncolliding") {
        return noncolliding_strategy();
    }
    if (lower == "multivalued") {
        return multivalued_strategy(distinct_values);
    }
    throw InvalidArgument("Unknown merge strategy: '" + name +
                          "' (expected replacing, noncolliding or multivalued)");
}

std::shared_ptr<AttributeMerger> make_additive_merger(const std::string& name, bool distinct_values) {
    return std::make_shared<AdditiveAttributeMerger>(strategy_from_name(name, distinct_values));
}

} // namespace persondir
