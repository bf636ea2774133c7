/**
 * @file DotPath.hpp
 * @brief Path segments and dotted-key utilities
 *
 * A path is the ordered sequence of field names leading from a root value
 * to the value being accessed. Aggregates consume one segment each;
 * primitives require the remaining path to be empty.
 */

#ifndef STRINGLY_DOTPATH_HPP
#define STRINGLY_DOTPATH_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace stringly {

/**
 * @brief Owned sequence of path segments
 */
using Path = std::vector<std::string>;

/**
 * @brief Non-owning view over the unconsumed part of a Path
 *
 * Each aggregate level takes front() and hands tail() to the selected
 * field. The viewed Path must outlive the view.
 */
class PathView {
public:
    using const_iterator = Path::const_iterator;

    PathView(const Path& path) noexcept
        : begin_(path.begin())
        , end_(path.end())
    {}

    PathView(const_iterator begin, const_iterator end) noexcept
        : begin_(begin)
        , end_(end)
    {}

    bool empty() const noexcept {
        return begin_ == end_;
    }

    std::size_t size() const noexcept {
        return static_cast<std::size_t>(end_ - begin_);
    }

    /// @pre !empty()
    const std::string& front() const noexcept {
        return *begin_;
    }

    /// @pre !empty()
    PathView tail() const noexcept {
        return PathView(begin_ + 1, end_);
    }

    const_iterator begin() const noexcept {
        return begin_;
    }

    const_iterator end() const noexcept {
        return end_;
    }

private:
    const_iterator begin_;
    const_iterator end_;
};

/**
 * @brief Split a dotted key into segments
 *
 * @param key Dot-separated key like "a.b.c"
 * @return Segments ["a", "b", "c"]
 *
 * Empty segments are preserved so that malformed keys fail on lookup
 * instead of silently addressing another field.
 *
 * Examples:
 * - "inner.y" → ["inner", "y"]
 * - "" → []
 * - "single" → ["single"]
 * - "a..b" → ["a", "", "b"]
 * - "a." → ["a", ""]
 */
Path split_dot_path(const std::string& key);

/**
 * @brief Join path segments with dots
 *
 * Examples:
 * - ["a", "b", "c"] → "a.b.c"
 * - [] → ""
 */
std::string join_dot_path(const Path& segments);

/**
 * @brief Join the segments visible through a view
 */
std::string join_dot_path(PathView segments);

} // namespace stringly

#endif // STRINGLY_DOTPATH_HPP
