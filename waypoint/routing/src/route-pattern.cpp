#include "waypoint/route-pattern.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "waypoint/path-segments.hpp"
#include "waypoint/router-error.hpp"

namespace waypoint {

std::string CompiledPattern::str() const {
  if (segments.empty()) {
    return std::string(1U, kPathSep);
  }
  std::string ret;
  for (const PatternSegment& segment : segments) {
    ret.push_back(kPathSep);
    if (segment.kind == PatternSegment::Kind::Param) {
      ret.push_back(kParamPrefix);
    }
    ret.append(segment.text);
  }
  return ret;
}

uint32_t CompiledPattern::nbParams() const noexcept {
  return static_cast<uint32_t>(std::ranges::count(segments, PatternSegment::Kind::Param, &PatternSegment::kind));
}

CompiledPattern CompilePattern(std::string_view pattern) {
  CompiledPattern compiled;
  compiled.segments.reserve(CountPathSegments(pattern));

  std::size_t pos = 0;
  for (std::string_view segment = NextPathSegment(pattern, pos); !segment.empty();
       segment = NextPathSegment(pattern, pos)) {
    if (segment.front() != kParamPrefix) {
      compiled.segments.emplace_back(PatternSegment::Kind::Static, std::string(segment));
      continue;
    }
    if (segment.size() == 1U) {
      throw RouterError(RouterErrc::InvalidPatternSegment, "Empty parameter name in pattern '{}'", pattern);
    }
    compiled.segments.emplace_back(PatternSegment::Kind::Param, std::string(segment.substr(1U)));
  }
  return compiled;
}

}  // namespace waypoint
