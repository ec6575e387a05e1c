#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "waypoint/vector.hpp"

namespace waypoint {

// Parameter bindings produced by a route lookup, in traversal order (outer to inner).
// Keys and values are owned: they do not refer to the router nor to the routed path.
class PathParams {
 public:
  struct Param {
    bool operator==(const Param&) const noexcept = default;

    std::string key;
    std::string value;
  };

  using const_iterator = const Param*;
  using size_type = std::size_t;

  PathParams() noexcept = default;

  void emplace_back(std::string_view key, std::string value);

  // Binds 'value' to 'key', replacing the outermost binding of 'key' if any.
  // Returns the replaced value, or std::nullopt if 'key' was not bound (the binding is then appended).
  std::optional<std::string> insert(std::string_view key, std::string value);

  // Removes the outermost binding of 'key' and returns its value, or std::nullopt if absent.
  std::optional<std::string> remove(std::string_view key);

  // Returns the value bound to 'key', or std::nullopt if absent.
  // If the same name was bound several times, the outermost binding is returned.
  [[nodiscard]] std::optional<std::string_view> find(std::string_view key) const noexcept;

  // Returns the value bound to 'key'. Throws waypoint::exception if absent.
  [[nodiscard]] std::string_view at(std::string_view key) const;

  [[nodiscard]] bool contains(std::string_view key) const noexcept { return find(key).has_value(); }

  [[nodiscard]] const Param& operator[](size_type pos) const noexcept { return _params[pos]; }

  [[nodiscard]] const_iterator begin() const noexcept { return _params.data(); }
  [[nodiscard]] const_iterator end() const noexcept { return _params.data() + _params.size(); }

  [[nodiscard]] size_type size() const noexcept { return _params.size(); }

  [[nodiscard]] bool empty() const noexcept { return _params.empty(); }

  void clear() noexcept { _params.clear(); }

  bool operator==(const PathParams& other) const noexcept;

 private:
  vector<Param> _params;
};

}  // namespace waypoint
