#include "waypoint/router-error.hpp"

#include <string_view>
#include <utility>

namespace waypoint {

std::string_view RouterErrcName(RouterErrc errc) noexcept {
  switch (errc) {
    case RouterErrc::InvalidPatternSegment:
      return "InvalidPatternSegment";
    case RouterErrc::ConflictingParameterName:
      return "ConflictingParameterName";
    case RouterErrc::DuplicateRoute:
      return "DuplicateRoute";
    case RouterErrc::PatternTooLong:
      return "PatternTooLong";
    default:
      std::unreachable();
  }
}

}  // namespace waypoint
