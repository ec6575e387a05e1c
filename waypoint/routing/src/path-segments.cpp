#include "waypoint/path-segments.hpp"

#include <cstddef>
#include <string_view>

namespace waypoint {

std::string_view NextPathSegment(std::string_view path, std::size_t& pos) noexcept {
  while (pos < path.size() && path[pos] == kPathSep) {
    ++pos;
  }
  if (pos >= path.size()) {
    pos = path.size();
    return {};
  }
  std::size_t segmentEnd = path.find(kPathSep, pos);
  if (segmentEnd == std::string_view::npos) {
    segmentEnd = path.size();
  }
  const std::string_view segment = path.substr(pos, segmentEnd - pos);
  pos = segmentEnd;
  return segment;
}

std::size_t CountPathSegments(std::string_view path) noexcept {
  std::size_t nbSegments = 0;
  for (std::size_t pos = 0; !NextPathSegment(path, pos).empty();) {
    ++nbSegments;
  }
  return nbSegments;
}

}  // namespace waypoint
