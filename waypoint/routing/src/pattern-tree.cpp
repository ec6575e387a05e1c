#include "waypoint/pattern-tree.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include "waypoint/path-segments.hpp"
#include "waypoint/route-pattern.hpp"
#include "waypoint/router-config.hpp"
#include "waypoint/router-error.hpp"
#include "waypoint/vector.hpp"

namespace waypoint {

PatternTree::PatternTree() { _nodes.emplace_back(); }

PatternTree::PatternTree(PatternTree&& other) : PatternTree() { swap(other); }

PatternTree& PatternTree::operator=(PatternTree&& other) {
  if (this != &other) {
    PatternTree empty;
    swap(other);
    other.swap(empty);
  }
  return *this;
}

PatternTree::NodeIndex PatternTree::FindStaticChild(const Node& node, std::string_view text) {
  // bytell_hash_map has no heterogeneous lookup
  const auto it = node.staticChildren.find(std::string(text));
  return it == node.staticChildren.end() ? kNoNode : it->second;
}

PatternTree::NodeIndex PatternTree::newNode() {
  const auto node = static_cast<NodeIndex>(_nodes.size());
  _nodes.emplace_back();
  return node;
}

PatternTree::NodeIndex PatternTree::ensureStaticChild(NodeIndex node, std::string_view text) {
  const NodeIndex existing = FindStaticChild(_nodes[node], text);
  if (existing != kNoNode) {
    return existing;
  }
  // newNode may reallocate the arena, parent is accessed again by index afterwards
  const NodeIndex child = newNode();
  _nodes[node].staticChildren.emplace(std::string(text), child);
  return child;
}

PatternTree::NodeIndex PatternTree::ensureParamChild(NodeIndex node, std::string_view name) {
  if (_nodes[node].paramChild != kNoNode) {
    return _nodes[node].paramChild;
  }
  const NodeIndex child = newNode();
  _nodes[node].paramName.assign(name);
  _nodes[node].paramChild = child;
  return child;
}

PatternTree::NodeIndex PatternTree::findExisting(const CompiledPattern& pattern) const {
  NodeIndex node = kRootNode;
  for (const PatternSegment& segment : pattern.segments) {
    const Node& current = _nodes[node];
    if (segment.kind == PatternSegment::Kind::Static) {
      node = FindStaticChild(current, segment.text);
      if (node == kNoNode) {
        return kNoNode;
      }
    } else {
      if (current.paramChild == kNoNode) {
        return kNoNode;
      }
      if (current.paramName != segment.text) {
        throw RouterError(RouterErrc::ConflictingParameterName,
                          "Parameter ':{}' of '{}' conflicts with registered ':{}'", segment.text, pattern.str(),
                          current.paramName);
      }
      node = current.paramChild;
    }
  }
  return node;
}

void PatternTree::checkInsertable(const CompiledPattern& pattern, bool allowExisting) const {
  const NodeIndex node = findExisting(pattern);
  if (!allowExisting && node != kNoNode && _nodes[node].endpoint != kNoEndpoint) {
    throw RouterError(RouterErrc::DuplicateRoute, "Route '{}' is already registered", pattern.str());
  }
}

PatternTree::NodeIndex PatternTree::insert(const CompiledPattern& pattern) {
  NodeIndex node = kRootNode;
  for (const PatternSegment& segment : pattern.segments) {
    if (segment.kind == PatternSegment::Kind::Static) {
      node = ensureStaticChild(node, segment.text);
    } else {
      node = ensureParamChild(node, segment.text);
    }
  }
  return node;
}

PatternTree::EndpointSlot PatternTree::match(std::string_view path, RouterConfig::MatchPolicy policy,
                                             vector<ParamCapture>& captures) const {
  if (policy == RouterConfig::MatchPolicy::Backtracking) {
    return matchBacktracking(path, captures);
  }
  return matchDirect(path, captures);
}

PatternTree::EndpointSlot PatternTree::matchDirect(std::string_view path, vector<ParamCapture>& captures) const {
  NodeIndex node = kRootNode;
  std::size_t pos = 0;
  for (std::string_view segment = NextPathSegment(path, pos); !segment.empty();
       segment = NextPathSegment(path, pos)) {
    const Node& current = _nodes[node];
    const NodeIndex staticChild = FindStaticChild(current, segment);
    if (staticChild != kNoNode) {
      node = staticChild;
      continue;
    }
    if (current.paramChild == kNoNode) {
      return kNoEndpoint;
    }
    captures.emplace_back(current.paramName, segment);
    node = current.paramChild;
  }
  return _nodes[node].endpoint;
}

PatternTree::EndpointSlot PatternTree::matchBacktracking(std::string_view path,
                                                         vector<ParamCapture>& captures) const {
  struct StackFrame {
    NodeIndex node;
    uint32_t nbCaptures;
    std::size_t pathPos;
    bool staticTried;
  };

  vector<StackFrame> stack;
  stack.emplace_back(kRootNode, 0U, std::size_t{0}, false);

  while (!stack.empty()) {
    StackFrame frame = stack.back();
    stack.pop_back();

    // Drop the bindings made by a branch which failed deeper
    captures.resize(frame.nbCaptures);

    std::size_t nextPos = frame.pathPos;
    const std::string_view segment = NextPathSegment(path, nextPos);
    const Node& current = _nodes[frame.node];

    // Terminal: all segments consumed
    if (segment.empty()) {
      if (current.endpoint != kNoEndpoint) {
        return current.endpoint;
      }
      continue;
    }

    if (!frame.staticTried) {
      frame.staticTried = true;
      const NodeIndex staticChild = FindStaticChild(current, segment);
      if (staticChild != kNoNode) {
        if (current.paramChild != kNoNode) {
          // Push current frame back for later retry of the parameter child
          stack.push_back(frame);
        }
        stack.emplace_back(staticChild, frame.nbCaptures, nextPos, false);
        continue;
      }
    }

    if (current.paramChild != kNoNode) {
      captures.emplace_back(current.paramName, segment);
      stack.emplace_back(current.paramChild, frame.nbCaptures + 1U, nextPos, false);
    }
    // else no child matches this segment, backtrack (frame already popped)
  }

  return kNoEndpoint;
}

void PatternTree::checkGraftable(const CompiledPattern& prefix, const PatternTree& other,
                                 uint32_t maxSegments) const {
  // Conflicts along the prefix itself
  const NodeIndex base = findExisting(prefix);

  struct PendingCheck {
    NodeIndex otherNode;
    NodeIndex node;  // kNoNode when the corresponding node does not exist yet in this tree
    std::size_t depth;
    std::string pattern;
  };

  vector<PendingCheck> pending;
  pending.emplace_back(kRootNode, base, prefix.segments.size(), prefix.str());

  while (!pending.empty()) {
    PendingCheck check = std::move(pending.back());
    pending.pop_back();

    const Node& otherNode = other._nodes[check.otherNode];
    if (otherNode.endpoint != kNoEndpoint) {
      if (maxSegments != 0 && check.depth > maxSegments) {
        throw RouterError(RouterErrc::PatternTooLong, "Route '{}' has more than {} segments", check.pattern,
                          maxSegments);
      }
      if (check.node != kNoNode && _nodes[check.node].endpoint != kNoEndpoint) {
        throw RouterError(RouterErrc::DuplicateRoute, "Route '{}' is already registered", check.pattern);
      }
    }

    const Node* pNode = check.node == kNoNode ? nullptr : &_nodes[check.node];
    if (check.pattern.size() == 1U) {
      // root pattern "/" - avoid a double separator in children patterns
      check.pattern.clear();
    }

    for (const auto& [text, otherChild] : otherNode.staticChildren) {
      const NodeIndex child = pNode == nullptr ? kNoNode : FindStaticChild(*pNode, text);
      pending.emplace_back(otherChild, child, check.depth + 1U, check.pattern + kPathSep + text);
    }

    if (otherNode.paramChild != kNoNode) {
      std::string childPattern = check.pattern + kPathSep + kParamPrefix + otherNode.paramName;
      NodeIndex child = kNoNode;
      if (pNode != nullptr && pNode->paramChild != kNoNode) {
        if (pNode->paramName != otherNode.paramName) {
          throw RouterError(RouterErrc::ConflictingParameterName,
                            "Parameter ':{}' of '{}' conflicts with registered ':{}'", otherNode.paramName,
                            childPattern, pNode->paramName);
        }
        child = pNode->paramChild;
      }
      pending.emplace_back(otherNode.paramChild, child, check.depth + 1U, std::move(childPattern));
    }
  }
}

void PatternTree::graft(const CompiledPattern& prefix, const PatternTree& other, EndpointSlot slotOffset) {
  struct PendingCopy {
    NodeIndex otherNode;
    NodeIndex node;
  };

  vector<PendingCopy> pending;
  pending.emplace_back(kRootNode, insert(prefix));

  while (!pending.empty()) {
    const PendingCopy copy = pending.back();
    pending.pop_back();

    const Node& otherNode = other._nodes[copy.otherNode];
    if (otherNode.endpoint != kNoEndpoint) {
      _nodes[copy.node].endpoint = otherNode.endpoint + slotOffset;
    }
    for (const auto& [text, otherChild] : otherNode.staticChildren) {
      pending.emplace_back(otherChild, ensureStaticChild(copy.node, text));
    }
    if (otherNode.paramChild != kNoNode) {
      pending.emplace_back(otherNode.paramChild, ensureParamChild(copy.node, otherNode.paramName));
    }
  }
}

void PatternTree::forEachRoute(const RouteVisitor& visitor) const {
  struct PendingVisit {
    NodeIndex node;
    std::string pattern;
  };

  vector<PendingVisit> pending;
  pending.emplace_back(kRootNode, std::string());

  vector<std::pair<std::string_view, NodeIndex>> staticChildren;

  while (!pending.empty()) {
    PendingVisit visit = std::move(pending.back());
    pending.pop_back();

    const Node& node = _nodes[visit.node];
    if (node.endpoint != kNoEndpoint) {
      visitor(visit.pattern.empty() ? std::string_view("/") : std::string_view(visit.pattern), node.endpoint);
    }

    // Children are pushed in reverse order of visit
    if (node.paramChild != kNoNode) {
      pending.emplace_back(node.paramChild, visit.pattern + kPathSep + kParamPrefix + node.paramName);
    }

    staticChildren.clear();
    for (const auto& [text, child] : node.staticChildren) {
      staticChildren.emplace_back(text, child);
    }
    std::ranges::sort(staticChildren, std::greater<>{});
    for (const auto& [text, child] : staticChildren) {
      pending.emplace_back(child, visit.pattern + kPathSep + std::string(text));
    }
  }
}

void PatternTree::clear() noexcept {
  _nodes.erase(_nodes.begin() + 1, _nodes.end());
  Node& root = _nodes.front();
  root.staticChildren.clear();
  root.paramName.clear();
  root.paramChild = kNoNode;
  root.endpoint = kNoEndpoint;
}

}  // namespace waypoint
