//===-- GraphResolver.cpp -------------------------------------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2014 - 2026 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "crtdeps/Graph/GraphResolver.h"

#include "crtdeps/Graph/ResolverError.h"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <functional>

using namespace crtdeps;
using namespace crtdeps::graph;

GraphResolver::GraphResolver(const ComponentRegistry& registry)
    : registry(registry), dependencies(registry.size()) {
  auto components = registry.getComponents();
  for (unsigned i = 0, e = components.size(); i != e; ++i) {
    for (const auto& dependency : components[i].directDependencies) {
      // The registry guarantees every dependency is declared.
      auto index = registry.getIndex(dependency);
      assert(index.hasValue() && "undeclared dependency in registry");
      dependencies[i].push_back(index.getValue());
    }
  }
}

const GraphResolver::AdjacencyList& GraphResolver::getDependents() const {
  if (!dependents) {
    // Walking the components in declaration order leaves every dependents
    // list in declaration order as well.
    std::unique_ptr<AdjacencyList> result(
        new AdjacencyList(dependencies.size()));
    for (ComponentIndex i = 0, e = dependencies.size(); i != e; ++i) {
      for (auto dependency : dependencies[i])
        (*result)[dependency].push_back(i);
    }
    dependents = std::move(result);
  }
  return *dependents;
}

llvm::Expected<GraphResolver::ComponentIndex>
GraphResolver::indexFor(StringRef id) const {
  auto index = registry.getIndex(id);
  if (!index)
    return llvm::make_error<UnknownComponentError>(id);
  return index.getValue();
}

std::vector<std::string>
GraphResolver::namesFor(ArrayRef<ComponentIndex> indices) const {
  auto components = registry.getComponents();
  std::vector<std::string> result;
  result.reserve(indices.size());
  for (auto index : indices)
    result.push_back(components[index].id);
  return result;
}

llvm::Error
GraphResolver::visitPostOrder(ComponentIndex start, const AdjacencyList& edges,
                              std::vector<ComponentIndex>& postOrder) const {
  enum class VisitState : uint8_t { Unvisited, InProgress, Finished };

  std::vector<VisitState> states(edges.size(), VisitState::Unvisited);
  std::vector<ComponentIndex> activePath;

  std::function<llvm::Error(ComponentIndex)> visit;
  visit = [&](ComponentIndex node) -> llvm::Error {
    switch (states[node]) {
    case VisitState::Finished:
      return llvm::Error::success();

    case VisitState::InProgress: {
      // The node is still on the active path, so the path from its first
      // occurrence back to it is a cycle.
      auto it = std::find(activePath.begin(), activePath.end(), node);
      assert(it != activePath.end());
      std::vector<ComponentIndex> cycle(it, activePath.end());
      cycle.push_back(node);

      // Always report the cycle along dependency edges.
      if (&edges != &dependencies)
        std::reverse(cycle.begin(), cycle.end());
      return llvm::make_error<CyclicDependencyError>(namesFor(cycle));
    }

    case VisitState::Unvisited:
      break;
    }

    states[node] = VisitState::InProgress;
    activePath.push_back(node);
    for (auto next : edges[node]) {
      if (auto error = visit(next))
        return error;
    }
    activePath.pop_back();
    states[node] = VisitState::Finished;
    postOrder.push_back(node);
    return llvm::Error::success();
  };

  return visit(start);
}

llvm::Expected<std::vector<std::string>>
GraphResolver::directDeps(StringRef id) const {
  auto index = indexFor(id);
  if (!index)
    return index.takeError();
  return namesFor(dependencies[*index]);
}

llvm::Expected<std::vector<std::string>>
GraphResolver::directDependents(StringRef id) const {
  auto index = indexFor(id);
  if (!index)
    return index.takeError();
  return namesFor(getDependents()[*index]);
}

llvm::Expected<std::vector<std::string>>
GraphResolver::allDeps(StringRef id) const {
  auto index = indexFor(id);
  if (!index)
    return index.takeError();

  std::vector<ComponentIndex> order;
  if (auto error = visitPostOrder(*index, dependencies, order))
    return std::move(error);

  assert(!order.empty() && order.back() == *index);
  return namesFor(order);
}

llvm::Expected<std::vector<std::string>>
GraphResolver::allDependents(StringRef id) const {
  auto index = indexFor(id);
  if (!index)
    return index.takeError();

  const auto& reverseEdges = getDependents();

  // Post order over the reverse edges lists every dependent after the
  // dependents built on top of it, and proves the reachable part of the graph
  // is acyclic.
  std::vector<ComponentIndex> postOrder;
  if (auto error = visitPostOrder(*index, reverseEdges, postOrder))
    return std::move(error);

  // Compute the longest chain length from the target to each dependent,
  // relaxing edges in topological order (the reversed post order).
  std::vector<unsigned> rank(reverseEdges.size(), 0);
  for (auto it = postOrder.rbegin(), ie = postOrder.rend(); it != ie; ++it) {
    for (auto dependent : reverseEdges[*it])
      rank[dependent] = std::max(rank[dependent], rank[*it] + 1);
  }

  std::vector<ComponentIndex> result;
  result.reserve(postOrder.size());
  for (auto node : postOrder) {
    if (node != *index)
      result.push_back(node);
  }

  // Highest rank first; equal ranks keep declaration order.
  std::sort(result.begin(), result.end(),
            [&](ComponentIndex lhs, ComponentIndex rhs) {
              if (rank[lhs] != rank[rhs])
                return rank[lhs] > rank[rhs];
              return lhs < rhs;
            });

  return namesFor(result);
}
