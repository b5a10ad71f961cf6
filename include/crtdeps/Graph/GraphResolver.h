//===- GraphResolver.h ------------------------------------------*- C++ -*-===//
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

#ifndef CRTDEPS_GRAPH_GRAPHRESOLVER_H
#define CRTDEPS_GRAPH_GRAPHRESOLVER_H

#include "crtdeps/Basic/Compiler.h"
#include "crtdeps/Basic/LLVM.h"
#include "crtdeps/Graph/ComponentRegistry.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <memory>
#include <string>
#include <vector>

namespace crtdeps {
namespace graph {

/// Computes transitive closures over a component registry.
///
/// Forward edges come straight from each component's dependency list. The
/// reverse edges (dependency -> direct dependents) are derived from them the
/// first time a dependents query needs them and reused afterwards.
class GraphResolver {
  GraphResolver(const GraphResolver&) CRTDEPS_DELETED_FUNCTION;
  void operator=(const GraphResolver&) CRTDEPS_DELETED_FUNCTION;

  using ComponentIndex = unsigned;
  using AdjacencyList = std::vector<std::vector<ComponentIndex>>;

  const ComponentRegistry& registry;

  /// The forward edges, by declaration index.
  AdjacencyList dependencies;

  /// The reverse edges, by declaration index, in declaration order of the
  /// dependents.
  mutable std::unique_ptr<AdjacencyList> dependents;

  const AdjacencyList& getDependents() const;

  llvm::Expected<ComponentIndex> indexFor(StringRef id) const;

  std::vector<std::string> namesFor(ArrayRef<ComponentIndex> indices) const;

  /// Walk \p edges from \p start depth first, appending every reached node
  /// (including \p start) to \p postOrder once all of its successors are.
  llvm::Error visitPostOrder(ComponentIndex start, const AdjacencyList& edges,
                             std::vector<ComponentIndex>& postOrder) const;

public:
  explicit GraphResolver(const ComponentRegistry& registry);

  const ComponentRegistry& getRegistry() const { return registry; }

  /// Get the direct dependencies of a component, in declared order.
  llvm::Expected<std::vector<std::string>> directDeps(StringRef id) const;

  /// Get the components that list \p id as a direct dependency, in
  /// declaration order.
  llvm::Expected<std::vector<std::string>> directDependents(StringRef id) const;

  /// Get every component which must be built before \p id, followed by \p id
  /// itself.
  ///
  /// Every dependency appears strictly before its dependents, and siblings are
  /// visited in declared dependency order.
  llvm::Expected<std::vector<std::string>> allDeps(StringRef id) const;

  /// Get every component which depends on \p id, directly or transitively,
  /// excluding \p id.
  ///
  /// The result is ordered by decreasing rank, where the rank of a dependent
  /// is the length of the longest dependency chain leading from it down to
  /// \p id. Components of equal rank appear in declaration order. Processing
  /// the result front to back therefore always handles a component before
  /// anything it depends on.
  llvm::Expected<std::vector<std::string>> allDependents(StringRef id) const;
};

}
}

#endif
