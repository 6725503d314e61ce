/**
 * @file Path.hpp
 * @brief Paths addressing nodes inside a Value tree
 *
 * A path is an ordered sequence of segments. Each segment is either:
 * - a plain key, addressing a Mapping, PairList or Tagged object
 * - a field filter (field, value), addressing the Array element whose
 *   field equals value
 *
 * Examples:
 * ```cpp
 * Path p1 = {"database", "host"};
 * Path p2 = {"hosts", field("id", "a"), "port"};
 * Path p3 = "name";     // one-segment shorthand
 * Path root;            // empty path: the whole tree
 * ```
 */

#ifndef SUBTREE_PATH_HPP
#define SUBTREE_PATH_HPP

#include "Value.hpp"
#include <initializer_list>
#include <iosfwd>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace subtree {

/**
 * @brief Selects the Array element whose @c field equals @c value
 */
class Filter {
public:
    Filter(Key field, Key value) : field_(std::move(field)), value_(std::move(value)) {}

    const Key& field() const noexcept { return field_; }
    const Key& value() const noexcept { return value_; }

    /**
     * @brief Test an Array element against this filter
     *
     * Only Mapping and Tagged elements can match; the field of a Tagged
     * element is its first pair with that key. Any other element kind is
     * a non-match.
     */
    bool matches(const Value& element) const;

    /**
     * @brief The filter as a single key: the JSON array [field, value]
     *
     * Used where a filter meets a PairList, which has no elements to
     * filter and stores it as a key verbatim.
     */
    Key as_key() const;

private:
    Key field_;
    Key value_;
};

bool operator==(const Filter& lhs, const Filter& rhs);
bool operator!=(const Filter& lhs, const Filter& rhs);

/**
 * @brief One step of a path
 */
class Segment {
public:
    template <typename K,
              typename = std::enable_if_t<std::conjunction_v<
                  std::negation<std::is_same<std::decay_t<K>, Segment>>,
                  std::negation<std::is_same<std::decay_t<K>, Filter>>,
                  std::is_constructible<Key, K>>>>
    Segment(K&& key) : data_(std::in_place_type<Key>, std::forward<K>(key)) {}

    Segment(Filter filter) : data_(std::in_place_type<Filter>, std::move(filter)) {}

    bool is_key() const noexcept { return std::holds_alternative<Key>(data_); }
    bool is_filter() const noexcept { return std::holds_alternative<Filter>(data_); }

    /// @throws std::bad_variant_access if this is a filter
    const Key& key() const { return std::get<Key>(data_); }

    /// @throws std::bad_variant_access if this is a plain key
    const Filter& filter() const { return std::get<Filter>(data_); }

    /**
     * @brief The key this segment denotes in a key-addressed container
     * @return key() for a plain key, filter().as_key() for a filter
     */
    Key as_key() const;

    friend bool operator==(const Segment& lhs, const Segment& rhs) { return lhs.data_ == rhs.data_; }
    friend bool operator!=(const Segment& lhs, const Segment& rhs) { return !(lhs == rhs); }

private:
    std::variant<Key, Filter> data_;
};

std::ostream& operator<<(std::ostream& os, const Segment& segment);

/**
 * @brief Build a field-filter segment
 *
 * ```cpp
 * Path p = {"hosts", field("id", "a"), "port"};
 * ```
 */
inline Segment field(Key field_key, Key field_value) {
    return Segment(Filter(std::move(field_key), std::move(field_value)));
}

/**
 * @brief Ordered sequence of segments
 *
 * Converts implicitly from a braced list of segments, from a single
 * segment, or from a single bare key.
 */
class Path {
public:
    using const_iterator = std::vector<Segment>::const_iterator;

    Path() = default;
    Path(std::initializer_list<Segment> segments) : segments_(segments) {}
    explicit Path(std::vector<Segment> segments) : segments_(std::move(segments)) {}
    Path(Segment segment) : segments_{std::move(segment)} {}

    template <typename K,
              typename = std::enable_if_t<std::conjunction_v<
                  std::negation<std::is_same<std::decay_t<K>, Path>>,
                  std::negation<std::is_same<std::decay_t<K>, Segment>>,
                  std::negation<std::is_same<std::decay_t<K>, Filter>>,
                  std::is_constructible<Key, K>>>>
    Path(K&& key) : segments_{Segment(Key(std::forward<K>(key)))} {}

    bool empty() const noexcept { return segments_.empty(); }
    size_t size() const noexcept { return segments_.size(); }
    const Segment& operator[](size_t i) const { return segments_[i]; }
    const Segment& back() const { return segments_.back(); }

    const_iterator begin() const noexcept { return segments_.begin(); }
    const_iterator end() const noexcept { return segments_.end(); }

    void push_back(Segment segment) { segments_.push_back(std::move(segment)); }

    const std::vector<Segment>& segments() const noexcept { return segments_; }

    friend bool operator==(const Path& lhs, const Path& rhs) { return lhs.segments_ == rhs.segments_; }
    friend bool operator!=(const Path& lhs, const Path& rhs) { return !(lhs == rhs); }

private:
    std::vector<Segment> segments_;
};

/**
 * @brief Concatenate two paths
 *
 * ```cpp
 * Path p = Path{"a", "b"} + Path{"c"};  // a.b.c
 * ```
 */
Path operator+(Path lhs, const Path& rhs);

/**
 * @brief Render a path for messages
 *
 * Plain keys are joined with dots (strings bare, other keys as JSON);
 * filters render as [field=value] attached to the previous segment.
 *
 * Examples:
 * - {"a", "b", "c"} -> a.b.c
 * - {"list", field("key", "3"), "value"} -> list[key="3"].value
 * - {} -> ""
 */
std::string format_path(const Path& path);

std::ostream& operator<<(std::ostream& os, const Path& path);

} // namespace subtree

#endif // SUBTREE_PATH_HPP
