#pragma once

#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "log.hpp"
#include "waypoint/path-params.hpp"
#include "waypoint/pattern-tree.hpp"
#include "waypoint/route-pattern.hpp"
#include "waypoint/router-config.hpp"
#include "waypoint/router-error.hpp"
#include "waypoint/url-decode.hpp"
#include "waypoint/vector.hpp"

namespace waypoint {

// Resolves '/'-delimited paths to the endpoint of the registered pattern they match.
//
// Pattern syntax: a segment starting with ':' is a parameter matching any single non-empty path segment
// and binding its text to the name following ':'. Other segments must match exactly (byte-for-byte).
// Empty segments are ignored, both in patterns and in paths ("/a//b/" is the same as "/a/b").
// Static segments take precedence over parameters at each level, see RouterConfig::MatchPolicy.
//
// Endpoints are opaque values of type E, stored and returned by the Router.
//
// Threading: route() is const and does not touch any internal buffer, so concurrent calls are safe as long
// as no mutating method (add, atOrDefault, merge, clear) runs at the same time. Callers needing to
// register routes at runtime must serialize writers against readers themselves.
template <class E>
class Router {
 public:
  using endpoint_type = E;
  using size_type = std::size_t;

  struct RoutingResult {
    [[nodiscard]] bool found() const noexcept { return pEndpoint != nullptr; }

    explicit operator bool() const noexcept { return found(); }

    // Endpoint of the matched pattern, nullptr if no pattern matches the path.
    // Points into the Router, it is invalidated by any of its mutating methods.
    const E* pEndpoint{nullptr};

    // Bindings of the matched pattern parameters, outer to inner. Always empty when not found.
    PathParams params;
  };

  // Creates an empty Router with the default configuration (direct matching, no parameter decoding).
  Router() = default;

  // Creates an empty Router with the provided configuration.
  // Throws invalid_argument if the configuration is invalid.
  explicit Router(RouterConfig config) : _config(std::move(config)) { _config.validate(); }

  Router(const Router&) = default;
  Router& operator=(const Router&) = default;

  // A moved-from Router has no routes and keeps its configuration.
  Router(Router&& other)
      : _config(other._config), _tree(std::move(other._tree)), _endpoints(std::move(other._endpoints)) {
    other._endpoints.clear();
  }

  Router& operator=(Router&& other) {
    if (this != &other) {
      _config = other._config;
      _tree = std::move(other._tree);
      _endpoints = std::move(other._endpoints);
      other._endpoints.clear();
    }
    return *this;
  }

  ~Router() = default;

  // Registers 'endpoint' for 'pattern'.
  // Throws RouterError if the pattern is invalid, conflicts with a registered parameter name or
  // is already registered. The Router is left unchanged in that case.
  void add(std::string_view pattern, E endpoint) {
    const CompiledPattern compiled = compileChecked(pattern, false);
    _endpoints.push_back(std::move(endpoint));
    PatternTree::NodeIndex node = PatternTree::kNoNode;
    try {
      node = _tree.insert(compiled);
    } catch (...) {
      _endpoints.pop_back();
      throw;
    }
    _tree.setEndpointSlot(node, static_cast<PatternTree::EndpointSlot>(_endpoints.size() - 1U));
    log::debug("Registered route {}", compiled.str());
  }

  // Resolves 'path' to its endpoint and parameter bindings.
  // A path matching no pattern gives a result with a null endpoint, this is not an error.
  [[nodiscard]] RoutingResult route(std::string_view path) const {
    RoutingResult result;

    vector<PatternTree::ParamCapture> captures;
    const PatternTree::EndpointSlot slot = _tree.match(path, _config.matchPolicy, captures);
    if (slot == PatternTree::kNoEndpoint) {
      return result;
    }

    result.pEndpoint = &_endpoints[slot];
    for (const PatternTree::ParamCapture& capture : captures) {
      result.params.emplace_back(capture.key, _config.decodeParams ? url::DecodeBestEffort(capture.value)
                                                                   : std::string(capture.value));
    }
    return result;
  }

  // Returns the endpoint registered for 'pattern', registering a default constructed one first if needed.
  // This is the way to modify the endpoint of an already registered pattern.
  // Throws RouterError for an invalid pattern or a parameter name conflict.
  E& atOrDefault(std::string_view pattern)
    requires std::default_initializable<E>
  {
    const CompiledPattern compiled = compileChecked(pattern, true);
    const PatternTree::NodeIndex node = _tree.insert(compiled);
    PatternTree::EndpointSlot slot = _tree.endpointSlot(node);
    if (slot == PatternTree::kNoEndpoint) {
      _endpoints.emplace_back();
      slot = static_cast<PatternTree::EndpointSlot>(_endpoints.size() - 1U);
      _tree.setEndpointSlot(node, slot);
      log::debug("Registered default route {}", compiled.str());
    }
    return _endpoints[slot];
  }

  // Mounts all routes of 'other' under 'prefix', which may contain parameters.
  // For instance, merging a router holding "/edit" under "/posts/:id" registers "/posts/:id/edit".
  // Throws RouterError if any mounted route is already registered or conflicts with a registered
  // parameter name. This Router is left unchanged in that case.
  void merge(std::string_view prefix, Router other) {
    CompiledPattern compiledPrefix;
    try {
      compiledPrefix = CompilePattern(prefix);
      _tree.checkGraftable(compiledPrefix, other._tree, _config.maxSegments);
    } catch (const RouterError& ex) {
      log::warn("Rejected merge under '{}': {}", prefix, ex.what());
      throw;
    }
    const auto slotOffset = static_cast<PatternTree::EndpointSlot>(_endpoints.size());

    // Built aside and swapped in once the endpoints are moved
    PatternTree tree(_tree);
    tree.graft(compiledPrefix, other._tree, slotOffset);

    _endpoints.reserve(_endpoints.size() + other._endpoints.size());
    try {
      for (E& endpoint : other._endpoints) {
        _endpoints.push_back(std::move(endpoint));
      }
    } catch (...) {
      _endpoints.erase(_endpoints.begin() + slotOffset, _endpoints.end());
      throw;
    }
    _tree.swap(tree);
    log::debug("Merged {} route(s) under {}", other._endpoints.size(), compiledPrefix.str());
  }

  // Calls 'func(std::string_view pattern, const E& endpoint)' for each registered route.
  template <class Func>
  void forEachRoute(Func func) const {
    _tree.forEachRoute(
        [this, &func](std::string_view pattern, PatternTree::EndpointSlot slot) { func(pattern, _endpoints[slot]); });
  }

  // Number of registered routes.
  [[nodiscard]] size_type size() const noexcept { return _endpoints.size(); }

  [[nodiscard]] bool empty() const noexcept { return _endpoints.empty(); }

  [[nodiscard]] const RouterConfig& config() const noexcept { return _config; }

  // Clear all registered routes. The configuration stays unchanged.
  void clear() noexcept {
    _tree.clear();
    _endpoints.clear();
  }

 private:
  // Compiles 'pattern' and checks that it can be inserted in the tree, without modifying it.
  CompiledPattern compileChecked(std::string_view pattern, bool allowExisting) const {
    try {
      CompiledPattern compiled = CompilePattern(pattern);
      if (_config.maxSegments != 0 && compiled.segments.size() > _config.maxSegments) {
        throw RouterError(RouterErrc::PatternTooLong, "Route '{}' has more than {} segments", pattern,
                          _config.maxSegments);
      }
      _tree.checkInsertable(compiled, allowExisting);
      return compiled;
    } catch (const RouterError& ex) {
      log::warn("Rejected route '{}': {}", pattern, ex.what());
      throw;
    }
  }

  RouterConfig _config;
  PatternTree _tree;
  vector<E> _endpoints;
};

}  // namespace waypoint
