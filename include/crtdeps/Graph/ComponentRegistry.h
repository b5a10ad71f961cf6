//===- ComponentRegistry.h --------------------------------------*- C++ -*-===//
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

#ifndef CRTDEPS_GRAPH_COMPONENTREGISTRY_H
#define CRTDEPS_GRAPH_COMPONENTREGISTRY_H

#include "crtdeps/Basic/LLVM.h"
#include "crtdeps/Graph/Component.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <vector>

namespace crtdeps {
namespace graph {

/// The immutable table of every known component, in declaration order.
///
/// A registry is only ever built through \see create(), which checks the
/// table invariants, or \see getDefault() for the built-in topology.
class ComponentRegistry {
  /// The components, in declaration order.
  std::vector<Component> components;

  /// Maps component ids to their position in `components`.
  llvm::StringMap<unsigned> indexByID;

  explicit ComponentRegistry(std::vector<Component> components);

public:
  ComponentRegistry(ComponentRegistry&&) = default;
  ComponentRegistry& operator=(ComponentRegistry&&) = default;

  /// Build a registry from a component table.
  ///
  /// Ids must be unique, and every dependency list must name declared
  /// components, without repeats and without the component itself. Cycles
  /// spanning several components are not rejected here; the closure
  /// operations report them.
  static llvm::Expected<ComponentRegistry>
  create(std::vector<Component> components);

  /// The built-in registry, constructed on first use.
  static const ComponentRegistry& getDefault();

  /// The component table the built-in registry is made from.
  static std::vector<Component> getDefaultComponents();

  /// Look up a component by id, failing with UnknownComponentError.
  llvm::Expected<const Component&> lookup(StringRef id) const;

  /// Look up a component by id, returning nullptr if not found.
  const Component* findComponent(StringRef id) const;

  /// Get the declaration index of a component, if it is declared.
  Optional<unsigned> getIndex(StringRef id) const;

  ArrayRef<Component> getComponents() const { return components; }

  unsigned size() const { return components.size(); }
};

}
}

#endif
