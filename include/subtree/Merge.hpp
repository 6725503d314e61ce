/**
 * @file Merge.hpp
 * @brief Deep merge of Mappings
 *
 * Per key of the incoming Mapping:
 * - Key absent from the accumulator: inserted
 * - Both values Mappings: merged recursively
 * - Accumulator holds a Mapping, incoming does not: accumulator kept
 * - Accumulator holds anything else: overwritten by the incoming value
 *
 * Once a key holds a Mapping it can only be merged into, never collapsed
 * to a non-Mapping by a later source.
 */

#ifndef SUBTREE_MERGE_HPP
#define SUBTREE_MERGE_HPP

#include "subtree/Value.hpp"
#include <vector>

namespace subtree {

/**
 * @brief Merge one Mapping into another
 *
 * @param target Accumulator (lower precedence for non-Mapping values)
 * @param from Incoming Mapping
 * @return Merged result
 *
 * Examples:
 * ```cpp
 * // Nested Mappings are merged
 * Mapping a = {{"db", Mapping{{"host", "a"}}}};
 * Mapping b = {{"db", Mapping{{"port", 2}}}};
 * deep_merge(a, b);   // {"db": {"host": "a", "port": 2}}
 *
 * // A Mapping is never replaced by a scalar
 * Mapping c = {{"db", "string"}};
 * deep_merge(a, c);   // {"db": {"host": "a"}}
 *
 * // A scalar is replaced by anything
 * deep_merge(c, a);   // {"db": {"host": "a"}}
 * ```
 */
Mapping deep_merge(const Mapping& target, const Mapping& from);

/**
 * @brief Merge a sequence of Mappings into a target, in order
 */
Mapping deep_merge(const Mapping& target, const std::vector<Mapping>& sources);

/**
 * @brief Fold a sequence of Mappings left to right
 *
 * @param mappings Mappings in merge order; the first one is the initial
 *        accumulator
 * @return Merged result, or an empty Mapping if @p mappings is empty
 *
 * Example:
 * ```cpp
 * Mapping defaults = {{"a", 1}, {"b", 2}};
 * Mapping file = {{"b", 3}, {"c", 4}};
 * Mapping env = {{"c", 5}};
 *
 * auto result = deep_merge({defaults, file, env});
 * // Result: {"a": 1, "b": 3, "c": 5}
 * ```
 */
Mapping deep_merge(const std::vector<Mapping>& mappings);

} // namespace subtree

#endif // SUBTREE_MERGE_HPP
