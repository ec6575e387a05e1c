#pragma once

#include <cstddef>
#include <string_view>

namespace waypoint {

inline constexpr char kPathSep = '/';
inline constexpr char kParamPrefix = ':';

// Returns the next non-empty '/'-delimited segment of 'path' starting at byte offset 'pos',
// and advances 'pos' past it. Empty segments (leading, trailing or duplicate separators) are skipped,
// so "/a//b/" yields "a" then "b".
// Returns an empty string_view when there are no more segments.
std::string_view NextPathSegment(std::string_view path, std::size_t& pos) noexcept;

// Number of non-empty segments of 'path'.
std::size_t CountPathSegments(std::string_view path) noexcept;

}  // namespace waypoint
