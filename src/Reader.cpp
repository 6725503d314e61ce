/**
 * @file Reader.cpp
 * @brief Implementation of path lookup
 */

#include "subtree/Reader.hpp"

namespace subtree {

namespace {

const Value* search(const Value& node, const Path& path, size_t depth);

const Value* search_pairs(const PairList& pairs, const Path& path, size_t depth) {
    const auto& seg = path[depth];
    if (!seg.is_key()) {
        return nullptr;
    }

    auto it = find_key(pairs, seg.key());
    if (it == pairs.end()) {
        return nullptr;
    }
    return search(it->second, path, depth + 1);
}

const Value* search(const Value& node, const Path& path, size_t depth) {
    if (depth == path.size()) {
        return &node;
    }

    const auto& seg = path[depth];

    return std::visit([&](const auto& current) -> const Value* {
        using T = std::decay_t<decltype(current)>;

        if constexpr (std::is_same_v<T, Scalar>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, Mapping>) {
            if (!seg.is_key()) return nullptr;
            auto it = current.find(seg.key());
            if (it == current.end()) return nullptr;
            return search(it->second, path, depth + 1);
        } else if constexpr (std::is_same_v<T, PairList>) {
            return search_pairs(current, path, depth);
        } else if constexpr (std::is_same_v<T, Tagged>) {
            return search_pairs(current.pairs(), path, depth);
        } else if constexpr (std::is_same_v<T, Array>) {
            if (!seg.is_filter()) return nullptr;
            // The first matching element is final: no backtracking into
            // later matches if the rest of the path fails there.
            for (const auto& element : current) {
                if (seg.filter().matches(element)) {
                    return search(element, path, depth + 1);
                }
            }
            return nullptr;
        } else {
            static_assert(detail::always_false<T>::value, "unhandled Value alternative");
        }
    }, node.data());
}

} // namespace

std::optional<Value> locate(const Path& path, const Value& tree) {
    const Value* found = search(tree, path, 0);
    if (found == nullptr) {
        return std::nullopt;
    }
    return *found;
}

Value locate_or_fail(const Path& path, const Value& tree) {
    const Value* found = search(tree, path, 0);
    if (found == nullptr) {
        throw KeyNotFound(path);
    }
    return *found;
}

Value locate_with_default(const Path& path, const Value& tree,
                          const Value& default_val) {
    const Value* found = search(tree, path, 0);
    return found != nullptr ? *found : default_val;
}

bool contains(const Path& path, const Value& tree) {
    return search(tree, path, 0) != nullptr;
}

} // namespace subtree
