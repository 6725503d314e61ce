/**
 * @file Value.cpp
 * @brief Value comparison, lookup and rendering
 */

#include "subtree/Value.hpp"

#include <algorithm>
#include <ostream>
#include <sstream>

namespace subtree {

bool operator==(const Tagged& lhs, const Tagged& rhs) {
    return lhs.pairs() == rhs.pairs();
}

bool operator!=(const Tagged& lhs, const Tagged& rhs) {
    return !(lhs == rhs);
}

bool operator==(const Value& lhs, const Value& rhs) {
    return lhs.data_ == rhs.data_;
}

PairList::const_iterator find_key(const PairList& pairs, const Key& key) {
    return std::find_if(pairs.begin(), pairs.end(),
                        [&key](const Pair& pair) { return pair.first == key; });
}

std::string kind_name(Kind kind) {
    switch (kind) {
        case Kind::scalar: return "scalar";
        case Kind::mapping: return "mapping";
        case Kind::pair_list: return "pair-list";
        case Kind::tagged: return "tagged-object";
        case Kind::array: return "array";
    }
    return "unknown";
}

namespace {

void write_pairs(std::ostream& os, const PairList& pairs);

void write_value(std::ostream& os, const Value& val) {
    std::visit([&os](const auto& node) {
        using T = std::decay_t<decltype(node)>;

        if constexpr (std::is_same_v<T, Scalar>) {
            os << node.dump();
        } else if constexpr (std::is_same_v<T, Mapping>) {
            os << '{';
            bool first = true;
            for (const auto& [key, child] : node) {
                if (!first) os << ", ";
                first = false;
                os << key.dump() << ": ";
                write_value(os, child);
            }
            os << '}';
        } else if constexpr (std::is_same_v<T, PairList>) {
            write_pairs(os, node);
        } else if constexpr (std::is_same_v<T, Tagged>) {
            os << '{';
            write_pairs(os, node.pairs());
            os << '}';
        } else if constexpr (std::is_same_v<T, Array>) {
            os << '[';
            for (size_t i = 0; i < node.size(); ++i) {
                if (i > 0) os << ", ";
                write_value(os, node[i]);
            }
            os << ']';
        } else {
            static_assert(detail::always_false<T>::value, "unhandled Value alternative");
        }
    }, val.data());
}

void write_pairs(std::ostream& os, const PairList& pairs) {
    os << '[';
    for (size_t i = 0; i < pairs.size(); ++i) {
        if (i > 0) os << ", ";
        os << '(' << pairs[i].first.dump() << ", ";
        write_value(os, pairs[i].second);
        os << ')';
    }
    os << ']';
}

} // namespace

std::string dump(const Value& val) {
    std::ostringstream oss;
    write_value(oss, val);
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Value& val) {
    write_value(os, val);
    return os;
}

} // namespace subtree
