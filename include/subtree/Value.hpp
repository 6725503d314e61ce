/**
 * @file Value.hpp
 * @brief Value type for heterogeneous data trees
 *
 * A Value is exactly one of five alternatives:
 * - Scalar (nlohmann::json leaf: null, bool, number, string)
 * - Mapping ({Key: Value, ...}, keys unique)
 * - PairList ([(Key, Value), ...], ordered, keys may repeat)
 * - Tagged (a PairList marked as an object)
 * - Array ([Value, ...], addressed by field filters)
 */

#ifndef SUBTREE_VALUE_HPP
#define SUBTREE_VALUE_HPP

#include <nlohmann/json.hpp>
#include <initializer_list>
#include <iosfwd>
#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace subtree {

class Value;

/**
 * @brief Leaf value and key type
 *
 * Structured JSON held as a Scalar is an opaque leaf and is never
 * traversed.
 */
using Scalar = nlohmann::json;
using Key = nlohmann::json;

using Mapping = std::map<Key, Value>;
using Pair = std::pair<Key, Value>;
using PairList = std::vector<Pair>;
using Array = std::vector<Value>;

/**
 * @brief A PairList that denotes an object rather than a generic list
 *
 * The wrapper is transparent to addressing: a path addresses into
 * pairs() exactly as into a bare PairList.
 */
class Tagged {
public:
    Tagged() = default;
    Tagged(std::initializer_list<Pair> pairs);
    explicit Tagged(PairList pairs);

    const PairList& pairs() const noexcept { return pairs_; }

private:
    PairList pairs_;
};

bool operator==(const Tagged& lhs, const Tagged& rhs);
bool operator!=(const Tagged& lhs, const Tagged& rhs);

/**
 * @brief Kind discriminator, in the order of the Value alternatives
 */
enum class Kind {
    scalar,
    mapping,
    pair_list,
    tagged,
    array
};

namespace detail {

template <typename T>
struct is_alternative
    : std::disjunction<std::is_same<T, Value>,
                       std::is_same<T, Mapping>,
                       std::is_same<T, PairList>,
                       std::is_same<T, Tagged>,
                       std::is_same<T, Array>> {};

template <typename T>
struct always_false : std::false_type {};

} // namespace detail

/**
 * @brief Immutable-by-convention tree node
 *
 * Construct implicitly from any alternative, or from anything an
 * nlohmann::json can be built from (which yields a Scalar):
 * ```cpp
 * Value tree = Mapping{
 *     {"name", "db"},
 *     {"options", PairList{{"retries", 3}}},
 *     {"hosts", Array{Tagged{{"id", "a"}, {"port", 5432}}}}
 * };
 * ```
 */
class Value {
public:
    using Storage = std::variant<Scalar, Mapping, PairList, Tagged, Array>;

    Value() = default;
    Value(Mapping mapping) : data_(std::in_place_type<Mapping>, std::move(mapping)) {}
    Value(PairList pairs) : data_(std::in_place_type<PairList>, std::move(pairs)) {}
    Value(Tagged tagged) : data_(std::in_place_type<Tagged>, std::move(tagged)) {}
    Value(Array array) : data_(std::in_place_type<Array>, std::move(array)) {}

    template <typename T,
              typename = std::enable_if_t<std::conjunction_v<
                  std::negation<detail::is_alternative<std::decay_t<T>>>,
                  std::is_constructible<Scalar, T>>>>
    Value(T&& scalar) : data_(std::in_place_type<Scalar>, std::forward<T>(scalar)) {}

    Kind kind() const noexcept { return static_cast<Kind>(data_.index()); }

    bool is_scalar() const noexcept { return std::holds_alternative<Scalar>(data_); }
    bool is_mapping() const noexcept { return std::holds_alternative<Mapping>(data_); }
    bool is_pair_list() const noexcept { return std::holds_alternative<PairList>(data_); }
    bool is_tagged() const noexcept { return std::holds_alternative<Tagged>(data_); }
    bool is_array() const noexcept { return std::holds_alternative<Array>(data_); }

    /**
     * @brief Typed access
     * @throws std::bad_variant_access if the Value holds another kind
     */
    const Scalar& as_scalar() const { return std::get<Scalar>(data_); }
    const Mapping& as_mapping() const { return std::get<Mapping>(data_); }
    const PairList& as_pair_list() const { return std::get<PairList>(data_); }
    const Tagged& as_tagged() const { return std::get<Tagged>(data_); }
    const Array& as_array() const { return std::get<Array>(data_); }

    const Storage& data() const noexcept { return data_; }

    friend bool operator==(const Value& lhs, const Value& rhs);
    friend bool operator!=(const Value& lhs, const Value& rhs) { return !(lhs == rhs); }

private:
    Storage data_;
};

inline Tagged::Tagged(std::initializer_list<Pair> pairs) : pairs_(pairs) {}

inline Tagged::Tagged(PairList pairs) : pairs_(std::move(pairs)) {}

/**
 * @brief Find the first pair whose key equals @p key
 * @return Iterator to the pair, or pairs.end()
 */
PairList::const_iterator find_key(const PairList& pairs, const Key& key);

/**
 * @brief Rebuild a tagged object around a transformed pair-list
 *
 * The single place where the wrapper is peeled off and re-applied, so a
 * rewritten object can never come back unwrapped.
 */
template <typename Fn>
Tagged rewrap(const Tagged& object, Fn&& fn) {
    return Tagged(std::forward<Fn>(fn)(object.pairs()));
}

/**
 * @brief Human-readable kind name
 * @return "scalar", "mapping", "pair-list", "tagged-object" or "array"
 */
std::string kind_name(Kind kind);

inline std::string type_name(const Value& val) {
    return kind_name(val.kind());
}

/**
 * @brief Check if value is any container kind
 */
inline bool is_container(const Value& val) {
    return !val.is_scalar();
}

/**
 * @brief Render a value for messages and test output
 *
 * Mapping `{k: v}`, PairList `[(k, v)]`, Tagged `{[(k, v)]}`,
 * Array `[v]`; scalars and keys as compact JSON.
 */
std::string dump(const Value& val);

std::ostream& operator<<(std::ostream& os, const Value& val);

} // namespace subtree

#endif // SUBTREE_VALUE_HPP
