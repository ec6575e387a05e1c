#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <string_view>
#include <utility>

#include "waypoint/flat-hash-map.hpp"
#include "waypoint/route-pattern.hpp"
#include "waypoint/router-config.hpp"
#include "waypoint/vector.hpp"

namespace waypoint {

// Segment-indexed tree storing registered patterns.
// Nodes live in a single arena and refer to each other by index, so the tree can be
// copied or moved as a plain value.
// Endpoints are not stored here: a node holds the slot of its endpoint in a container owned by the caller.
class PatternTree {
 public:
  using NodeIndex = uint32_t;
  using EndpointSlot = uint32_t;

  static constexpr NodeIndex kRootNode = 0;
  static constexpr NodeIndex kNoNode = std::numeric_limits<NodeIndex>::max();
  static constexpr EndpointSlot kNoEndpoint = std::numeric_limits<EndpointSlot>::max();

  // Transient parameter binding. 'key' points into the tree and 'value' into the matched path.
  struct ParamCapture {
    std::string_view key;
    std::string_view value;
  };

  using RouteVisitor = std::function<void(std::string_view pattern, EndpointSlot slot)>;

  // Creates a tree made of the root node only (the empty path "/").
  PatternTree();

  PatternTree(const PatternTree&) = default;
  PatternTree& operator=(const PatternTree&) = default;

  // A moved-from tree is left empty (root node only) and stays usable.
  PatternTree(PatternTree&& other);
  PatternTree& operator=(PatternTree&& other);

  ~PatternTree() = default;

  void swap(PatternTree& other) noexcept { std::swap(_nodes, other._nodes); }

  // Checks that 'pattern' can be inserted, without modifying the tree.
  // Throws RouterError(ConflictingParameterName) if a parameter segment of 'pattern' sits at a position
  // already bound to another parameter name.
  // Throws RouterError(DuplicateRoute) if 'allowExisting' is false and the terminal node already holds an endpoint.
  void checkInsertable(const CompiledPattern& pattern, bool allowExisting) const;

  // Creates the missing nodes of 'pattern' and returns its terminal node.
  // checkInsertable should have been called before with the same pattern.
  NodeIndex insert(const CompiledPattern& pattern);

  [[nodiscard]] EndpointSlot endpointSlot(NodeIndex node) const noexcept { return _nodes[node].endpoint; }

  void setEndpointSlot(NodeIndex node, EndpointSlot slot) noexcept { _nodes[node].endpoint = slot; }

  // Resolves 'path' to the endpoint slot of the matching pattern, or kNoEndpoint.
  // Bindings of the traversed parameter nodes are appended to 'captures', outer to inner.
  // The content of 'captures' is unspecified when no pattern matches.
  [[nodiscard]] EndpointSlot match(std::string_view path, RouterConfig::MatchPolicy policy,
                                   vector<ParamCapture>& captures) const;

  // Checks that all routes of 'other' can be mounted under 'prefix', without modifying the tree.
  // Throws the same errors as checkInsertable (without allowing existing endpoints),
  // and RouterError(PatternTooLong) if a mounted route would exceed 'maxSegments' (0 for unlimited).
  void checkGraftable(const CompiledPattern& prefix, const PatternTree& other, uint32_t maxSegments) const;

  // Mounts all routes of 'other' under 'prefix'. Endpoint slots of 'other' are shifted by 'slotOffset'.
  // checkGraftable should have been called before with the same arguments.
  void graft(const CompiledPattern& prefix, const PatternTree& other, EndpointSlot slotOffset);

  // Calls 'visitor' for each node holding an endpoint, with its canonical pattern.
  // Routes are visited depth first, static children in lexicographical order before the parameter child.
  void forEachRoute(const RouteVisitor& visitor) const;

  [[nodiscard]] std::size_t nbNodes() const noexcept { return _nodes.size(); }

  // Removes all routes, keeping only the root node.
  void clear() noexcept;

 private:
  using StaticChildren = flat_hash_map<std::string, NodeIndex>;

  struct Node {
    StaticChildren staticChildren;
    std::string paramName;  // name of the parameter child, if any
    NodeIndex paramChild{kNoNode};
    EndpointSlot endpoint{kNoEndpoint};
  };

  // Returns the static child of 'node' named 'text', or kNoNode.
  static NodeIndex FindStaticChild(const Node& node, std::string_view text);

  NodeIndex newNode();

  NodeIndex ensureStaticChild(NodeIndex node, std::string_view text);
  NodeIndex ensureParamChild(NodeIndex node, std::string_view name);

  // Walks 'pattern' without creating nodes and returns its terminal node, or kNoNode if it does not exist yet.
  // Throws RouterError(ConflictingParameterName) when a parameter name differs from the one in the tree.
  NodeIndex findExisting(const CompiledPattern& pattern) const;

  EndpointSlot matchDirect(std::string_view path, vector<ParamCapture>& captures) const;
  EndpointSlot matchBacktracking(std::string_view path, vector<ParamCapture>& captures) const;

  vector<Node> _nodes;
};

}  // namespace waypoint
