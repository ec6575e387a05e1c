#pragma once

#include <cstdint>
#include <format>
#include <string_view>
#include <utility>

#include "exception.hpp"

namespace waypoint {

enum class RouterErrc : std::uint8_t {
  InvalidPatternSegment,     // a parameter segment has an empty name (':' alone)
  ConflictingParameterName,  // two different parameter names at the same tree position
  DuplicateRoute,            // an endpoint is already attached to the pattern
  PatternTooLong             // more segments than RouterConfig::maxSegments
};

[[nodiscard]] std::string_view RouterErrcName(RouterErrc errc) noexcept;

// Error raised when a pattern cannot be registered. The router is left unchanged.
class RouterError : public exception {
 public:
  template <typename... Args>
  RouterError(RouterErrc errc, std::format_string<Args...> fmt, Args&&... args)
      : exception(fmt, std::forward<Args>(args)...), _errc(errc) {}

  [[nodiscard]] RouterErrc code() const noexcept { return _errc; }

 private:
  RouterErrc _errc;
};

}  // namespace waypoint
