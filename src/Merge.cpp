/**
 * @file Merge.cpp
 * @brief Implementation of deep merge
 */

#include "subtree/Merge.hpp"

namespace subtree {

Mapping deep_merge(const Mapping& target, const Mapping& from) {
    Mapping result = target;

    for (const auto& [key, incoming] : from) {
        auto it = result.find(key);

        if (it == result.end()) {
            result.emplace(key, incoming);
        } else if (it->second.is_mapping()) {
            // Mapping wins over anything but another Mapping
            if (incoming.is_mapping()) {
                it->second = deep_merge(it->second.as_mapping(), incoming.as_mapping());
            }
        } else {
            it->second = incoming;
        }
    }

    return result;
}

Mapping deep_merge(const Mapping& target, const std::vector<Mapping>& sources) {
    Mapping result = target;
    for (const auto& source : sources) {
        result = deep_merge(result, source);
    }
    return result;
}

Mapping deep_merge(const std::vector<Mapping>& mappings) {
    if (mappings.empty()) {
        return Mapping{};
    }

    Mapping result = mappings[0];
    for (size_t i = 1; i < mappings.size(); ++i) {
        result = deep_merge(result, mappings[i]);
    }

    return result;
}

} // namespace subtree
