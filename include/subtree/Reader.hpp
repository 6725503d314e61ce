/**
 * @file Reader.hpp
 * @brief Path lookup through mixed container kinds
 *
 * Descent consumes one segment per level:
 * - Empty remaining path: the current node is the result
 * - Tagged: unwrapped, same remaining path
 * - Mapping or PairList + key: first entry with that key
 * - Array + filter: first Mapping/Tagged element whose field matches
 * - Any other combination: not found
 */

#ifndef SUBTREE_READER_HPP
#define SUBTREE_READER_HPP

#include "Value.hpp"
#include "Path.hpp"
#include "Errors.hpp"
#include <optional>

namespace subtree {

/**
 * @brief Look up a path, reporting absence as std::nullopt
 *
 * @param path Path to resolve
 * @param tree Source tree
 * @return Copy of the node at path, or std::nullopt if any segment
 *         does not resolve
 *
 * Examples:
 * ```cpp
 * Value tree = Mapping{{"hosts", Array{Mapping{{"id", "a"}, {"port", 1}}}}};
 * locate({"hosts", field("id", "a"), "port"}, tree);  // 1
 * locate({"hosts", "port"}, tree);                     // std::nullopt
 * ```
 */
std::optional<Value> locate(const Path& path, const Value& tree);

/**
 * @brief Look up a path (strict)
 *
 * @throws KeyNotFound carrying @p path if any segment does not resolve
 */
Value locate_or_fail(const Path& path, const Value& tree);

/**
 * @brief Look up a path (with default)
 *
 * @return The node at path, or @p default_val wherever locate_or_fail()
 *         would have thrown
 */
Value locate_with_default(const Path& path, const Value& tree,
                          const Value& default_val);

/**
 * @brief Check whether a path resolves
 */
bool contains(const Path& path, const Value& tree);

} // namespace subtree

#endif // SUBTREE_READER_HPP
