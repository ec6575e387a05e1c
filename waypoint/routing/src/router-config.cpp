#include "waypoint/router-config.hpp"

#include <cstdint>

#include "invalid_argument_exception.hpp"

namespace waypoint {

void RouterConfig::validate() const {
  if (matchPolicy != MatchPolicy::Direct && matchPolicy != MatchPolicy::Backtracking) {
    throw invalid_argument("Invalid match policy {}", static_cast<int>(matchPolicy));
  }
}

RouterConfig& RouterConfig::withMatchPolicy(MatchPolicy policy) {
  matchPolicy = policy;
  return *this;
}

RouterConfig& RouterConfig::withParamDecoding(bool enabled) {
  decodeParams = enabled;
  return *this;
}

RouterConfig& RouterConfig::withMaxSegments(uint32_t maxNbSegments) {
  maxSegments = maxNbSegments;
  return *this;
}

}  // namespace waypoint
