#include "waypoint/path-params.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "exception.hpp"

namespace waypoint {

void PathParams::emplace_back(std::string_view key, std::string value) {
  _params.emplace_back(std::string(key), std::move(value));
}

std::optional<std::string> PathParams::insert(std::string_view key, std::string value) {
  const auto it = std::ranges::find(_params, key, &Param::key);
  if (it == _params.end()) {
    emplace_back(key, std::move(value));
    return std::nullopt;
  }
  return std::exchange(it->value, std::move(value));
}

std::optional<std::string> PathParams::remove(std::string_view key) {
  const auto it = std::ranges::find(_params, key, &Param::key);
  if (it == _params.end()) {
    return std::nullopt;
  }
  std::string value = std::move(it->value);
  _params.erase(it);
  return value;
}

std::optional<std::string_view> PathParams::find(std::string_view key) const noexcept {
  const auto it = std::ranges::find(_params, key, &Param::key);
  if (it == _params.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

std::string_view PathParams::at(std::string_view key) const {
  const auto value = find(key);
  if (!value) {
    throw exception("Path parameter '{}' does not exist", key);
  }
  return *value;
}

bool PathParams::operator==(const PathParams& other) const noexcept {
  return std::ranges::equal(_params, other._params);
}

}  // namespace waypoint
