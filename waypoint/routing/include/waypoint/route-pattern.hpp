#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "waypoint/vector.hpp"

namespace waypoint {

struct PatternSegment {
  enum class Kind : std::uint8_t { Static, Param };

  bool operator==(const PatternSegment&) const noexcept = default;

  Kind kind{Kind::Static};
  std::string text;  // exact text for Static, parameter name (without ':') for Param
};

struct CompiledPattern {
  // Canonical form of the pattern, e.g. "/users/:id". The empty pattern is "/".
  [[nodiscard]] std::string str() const;

  [[nodiscard]] uint32_t nbParams() const noexcept;

  vector<PatternSegment> segments;
};

// Parses a '/'-delimited pattern into its segments, skipping empty ones.
// A segment is a parameter if and only if it starts with ':', its name being the remaining characters.
// Throws RouterError(InvalidPatternSegment) for a parameter segment with an empty name.
CompiledPattern CompilePattern(std::string_view pattern);

}  // namespace waypoint
