/**
 * @file Writer.hpp
 * @brief Copy-on-write path mutation
 *
 * write() and erase() rebuild every container from the root down to the
 * addressed node, keeping each container's kind and the order of
 * untouched siblings. The input tree is never modified; on failure no
 * value is produced.
 *
 * Missing structure is created per container kind:
 * - Mapping: a missing key is inserted; missing intermediates become
 *   empty Mappings, so a whole missing subtree is created
 * - PairList: one new pair is appended per unmatched write, its value
 *   built from an empty PairList
 * - Array: never extended; an unmatched filter is IncompatiblePath
 */

#ifndef SUBTREE_WRITER_HPP
#define SUBTREE_WRITER_HPP

#include "Value.hpp"
#include "Path.hpp"
#include "Errors.hpp"

namespace subtree {

/**
 * @brief Store a value at a path
 *
 * @param path Path to store at; empty replaces the whole tree
 * @param value Value to store
 * @param tree Source tree (not modified)
 * @return New tree with @p value at @p path
 * @throws IncompatiblePath if the path runs through a scalar, or
 *         addresses an Array by key or by an unmatched filter
 *
 * A filter reaching a Mapping or PairList is stored as the key
 * [field, value].
 *
 * Examples:
 * ```cpp
 * Value t = write({"a", "b", "c"}, 7, Mapping{});
 * // {"a": {"b": {"c": 7}}}
 *
 * write({"a", "b", "c", "d"}, 1, t);  // Throws IncompatiblePath (c is 7)
 * ```
 */
Value write(const Path& path, const Value& value, const Value& tree);

/**
 * @brief Remove the node at a path
 *
 * Removes the matched Mapping key, the first matching PairList pair, or
 * the first matching Array element.
 *
 * @param path Path of the node to remove
 * @param tree Source tree (not modified)
 * @return New tree without the node
 * @throws KeyNotFound if a key or element along the path is missing, or
 *         the path is empty and the root is a PairList, Tagged or Array
 * @throws IncompatiblePath if the path runs through a scalar, or is
 *         empty and the root is a Mapping or scalar
 */
Value erase(const Path& path, const Value& tree);

} // namespace subtree

#endif // SUBTREE_WRITER_HPP
