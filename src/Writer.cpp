/**
 * @file Writer.cpp
 * @brief Implementation of copy-on-write mutation
 */

#include "subtree/Writer.hpp"
#include <algorithm>

namespace subtree {

namespace {

/**
 * @brief One write or erase along one path
 *
 * Each rewrite_* step returns a fresh container of the same kind as its
 * input. Children are rebuilt before their parent is copied, so a throw
 * anywhere leaves nothing half-built.
 */
class Rewriter {
public:
    /**
     * @param path Full path, reported unchanged in every error
     * @param replacement Value to store, or nullptr to erase
     */
    Rewriter(const Path& path, const Value* replacement)
        : path_(path)
        , replacement_(replacement)
    {}

    Value apply(const Value& tree) const {
        if (path_.empty() && removing()) {
            // An empty path selects no pair or element of a list-shaped root.
            if (tree.is_pair_list() || tree.is_tagged() || tree.is_array()) {
                throw not_found();
            }
            throw incompatible(tree.kind());
        }
        return rewrite(tree, 0);
    }

private:
    const Path& path_;
    const Value* replacement_;

    bool removing() const noexcept { return replacement_ == nullptr; }

    bool is_last(size_t depth) const noexcept { return depth + 1 == path_.size(); }

    KeyNotFound not_found() const { return KeyNotFound(path_); }

    IncompatiblePath incompatible(Kind kind) const {
        return IncompatiblePath(path_, kind_name(kind));
    }

    Value rewrite(const Value& node, size_t depth) const {
        // Reached only when storing: removal acts one level up.
        if (depth == path_.size()) {
            return *replacement_;
        }

        return std::visit([&](const auto& current) -> Value {
            using T = std::decay_t<decltype(current)>;

            if constexpr (std::is_same_v<T, Scalar>) {
                throw incompatible(Kind::scalar);
            } else if constexpr (std::is_same_v<T, Mapping>) {
                return rewrite_mapping(current, depth);
            } else if constexpr (std::is_same_v<T, PairList>) {
                return rewrite_pairs(current, depth);
            } else if constexpr (std::is_same_v<T, Tagged>) {
                return rewrap(current, [&](const PairList& pairs) {
                    return rewrite_pairs(pairs, depth);
                });
            } else if constexpr (std::is_same_v<T, Array>) {
                return rewrite_array(current, depth);
            } else {
                static_assert(detail::always_false<T>::value, "unhandled Value alternative");
            }
        }, node.data());
    }

    Mapping rewrite_mapping(const Mapping& mapping, size_t depth) const {
        // A filter has no elements to select here and is taken as a key.
        const Key key = path_[depth].as_key();
        auto it = mapping.find(key);
        if (it == mapping.end() && removing()) {
            throw not_found();
        }

        if (is_last(depth)) {
            Mapping result = mapping;
            if (removing()) {
                result.erase(key);
            } else {
                result.insert_or_assign(key, *replacement_);
            }
            return result;
        }

        // A missing intermediate starts as an empty Mapping, which in turn
        // creates whatever is missing below it.
        Value child = it != mapping.end()
            ? rewrite(it->second, depth + 1)
            : rewrite(Value(Mapping{}), depth + 1);

        Mapping result = mapping;
        result.insert_or_assign(key, std::move(child));
        return result;
    }

    PairList rewrite_pairs(const PairList& pairs, size_t depth) const {
        // A filter has no elements to select here and is taken as a key.
        const Key key = path_[depth].as_key();
        auto it = find_key(pairs, key);

        if (it == pairs.end()) {
            if (removing()) {
                throw not_found();
            }
            Value child = rewrite(Value(PairList{}), depth + 1);
            PairList result = pairs;
            result.emplace_back(key, std::move(child));
            return result;
        }

        const auto index = static_cast<size_t>(it - pairs.begin());

        if (is_last(depth)) {
            PairList result = pairs;
            if (removing()) {
                result.erase(result.begin() + index);
            } else {
                result[index].second = *replacement_;
            }
            return result;
        }

        Value child = rewrite(it->second, depth + 1);
        PairList result = pairs;
        result[index].second = std::move(child);
        return result;
    }

    Array rewrite_array(const Array& array, size_t depth) const {
        const auto& seg = path_[depth];
        if (!seg.is_filter()) {
            if (removing()) throw not_found();
            throw incompatible(Kind::array);
        }

        auto it = std::find_if(array.begin(), array.end(), [&seg](const Value& element) {
            return seg.filter().matches(element);
        });
        if (it == array.end()) {
            if (removing()) throw not_found();
            throw incompatible(Kind::array);
        }

        const auto index = static_cast<size_t>(it - array.begin());

        if (is_last(depth)) {
            Array result = array;
            if (removing()) {
                result.erase(result.begin() + index);
            } else {
                result[index] = *replacement_;
            }
            return result;
        }

        Value child = rewrite(*it, depth + 1);
        Array result = array;
        result[index] = std::move(child);
        return result;
    }
};

} // namespace

Value write(const Path& path, const Value& value, const Value& tree) {
    return Rewriter(path, &value).apply(tree);
}

Value erase(const Path& path, const Value& tree) {
    return Rewriter(path, nullptr).apply(tree);
}

} // namespace subtree
