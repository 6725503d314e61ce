/**
 * @file Errors.hpp
 * @brief Exception types for path operations
 *
 * - PathError: Base class, carries the full path as given by the caller
 * - KeyNotFound: Addressed key or element does not exist
 * - IncompatiblePath: Path continues through a node that cannot take it
 *
 * Both leaf types always carry the full path as passed in, never the
 * sub-path at the point of failure.
 */

#ifndef SUBTREE_ERRORS_HPP
#define SUBTREE_ERRORS_HPP

#include "Path.hpp"
#include <stdexcept>
#include <string>

namespace subtree {

/**
 * @brief Base class for all subtree exceptions
 */
class PathError : public std::runtime_error {
public:
    PathError(const std::string& message, Path path)
        : std::runtime_error(message)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the full path that was being accessed
     */
    const Path& path() const noexcept {
        return path_;
    }

private:
    Path path_;
};

/**
 * @brief Key or element not found along a path
 *
 * Raised by locate_or_fail() and erase().
 */
class KeyNotFound : public PathError {
public:
    /**
     * @brief Construct with the full path being accessed
     */
    explicit KeyNotFound(Path path)
        : PathError("Key not found at path '" + format_path(path) + "'", path)
    {}
};

/**
 * @brief Path cannot be followed through the node it reached
 *
 * Raised by write() and erase() when a segment meets a scalar, a key
 * meets an Array, or a write would have to create an Array element. Also
 * raised by erase() with an empty path on a Mapping or scalar root.
 */
class IncompatiblePath : public PathError {
public:
    /**
     * @brief Construct with path and the kind of node encountered
     * @param path Full path being accessed
     * @param found Kind name of the offending node (e.g., "scalar")
     */
    IncompatiblePath(Path path, std::string found)
        : PathError("Cannot follow path '" + format_path(path) +
                    "' through " + found, path)
        , found_(std::move(found))
    {}

    /**
     * @brief Get the kind of node the path could not pass through
     */
    const std::string& found() const noexcept {
        return found_;
    }

private:
    std::string found_;
};

} // namespace subtree

#endif // SUBTREE_ERRORS_HPP
