/**
 * @file Path.cpp
 * @brief Implementation of path segments, filters and formatting
 */

#include "subtree/Path.hpp"
#include <ostream>
#include <sstream>

namespace subtree {

bool Filter::matches(const Value& element) const {
    const Value* found = nullptr;

    if (element.is_mapping()) {
        const auto& mapping = element.as_mapping();
        auto it = mapping.find(field_);
        if (it != mapping.end()) found = &it->second;
    } else if (element.is_tagged()) {
        const auto& pairs = element.as_tagged().pairs();
        auto it = find_key(pairs, field_);
        if (it != pairs.end()) found = &it->second;
    }

    return found != nullptr && found->is_scalar() && found->as_scalar() == value_;
}

Key Filter::as_key() const {
    return Key::array({field_, value_});
}

bool operator==(const Filter& lhs, const Filter& rhs) {
    return lhs.field() == rhs.field() && lhs.value() == rhs.value();
}

bool operator!=(const Filter& lhs, const Filter& rhs) {
    return !(lhs == rhs);
}

Key Segment::as_key() const {
    return is_key() ? key() : filter().as_key();
}

Path operator+(Path lhs, const Path& rhs) {
    for (const auto& segment : rhs) {
        lhs.push_back(segment);
    }
    return lhs;
}

namespace {
    /**
     * @brief Render a key, leaving strings unquoted
     */
    std::string key_text(const Key& key) {
        if (key.is_string()) return key.get<std::string>();
        return key.dump();
    }
}

std::ostream& operator<<(std::ostream& os, const Segment& segment) {
    return os << format_path(Path(segment));
}

std::string format_path(const Path& path) {
    if (path.empty()) {
        return "";
    }

    std::ostringstream oss;
    for (size_t i = 0; i < path.size(); ++i) {
        const auto& seg = path[i];
        if (seg.is_filter()) {
            oss << '[' << key_text(seg.filter().field())
                << '=' << seg.filter().value().dump() << ']';
        } else {
            if (i > 0) oss << '.';
            oss << key_text(seg.key());
        }
    }
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Path& path) {
    return os << '\'' << format_path(path) << '\'';
}

} // namespace subtree
