#pragma once

#include <cstdint>

namespace waypoint {

struct RouterConfig {
  enum class MatchPolicy : std::int8_t { Direct, Backtracking };

  // Check that the configuration is valid. Throws invalid_argument if not.
  void validate() const;

  // Strategy used when a static branch was followed but fails to match deeper in the tree.
  //   Direct      : commit to the first chosen branch at each level. Static segments always win over
  //                 parameters, and a failure deeper in the static branch is a not found result.
  //   Backtracking: same precedence, but the parameter branch of a level is retried if its static branch
  //                 fails deeper. It only changes results for deliberately overlapping patterns
  //                 (for instance "/a/b/c" and "/a/:x/d" with input "/a/b/d").
  // Default: Direct
  RouterConfig& withMatchPolicy(MatchPolicy policy);

  // If enabled, captured parameter values are percent-decoded ("a%20b" -> "a b").
  // Matching always compares raw bytes, only the returned values are decoded.
  // Invalid escapes are kept literally.
  // Default: disabled
  RouterConfig& withParamDecoding(bool enabled = true);

  // Maximum number of segments of a registered pattern. 0 means unlimited.
  // Longer patterns are rejected at registration time.
  RouterConfig& withMaxSegments(uint32_t maxNbSegments);

  bool operator==(const RouterConfig&) const noexcept = default;

  MatchPolicy matchPolicy{MatchPolicy::Direct};

  bool decodeParams{false};

  uint32_t maxSegments{0};
};

}  // namespace waypoint
