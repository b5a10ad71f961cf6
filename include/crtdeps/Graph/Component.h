//===- Component.h ----------------------------------------------*- C++ -*-===//
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

#ifndef CRTDEPS_GRAPH_COMPONENT_H
#define CRTDEPS_GRAPH_COMPONENT_H

#include "crtdeps/Basic/LLVM.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"

#include <string>
#include <vector>

namespace crtdeps {
namespace graph {

/// The kind of a component, which decides how it is built and how its
/// artifacts are probed.
enum class ComponentKind {
  /// A native library the native client is built on.
  NativeDependency,

  /// The top-level native client.
  NativeClient,

  /// A client built by a managed language toolchain (cargo, maven, pip).
  ManagedClient,

  /// A benchmark runner for exactly one client.
  Runner,
};

StringRef stringForKind(ComponentKind kind);
Optional<ComponentKind> kindForString(StringRef text);

/// A single piece of filesystem evidence that a component has been built.
enum class ArtifactKind {
  /// The installed CMake package configuration directory.
  PackageConfigDirectory,

  /// The installed static library archive.
  StaticArchive,

  /// The installed public header directory.
  HeaderDirectory,

  /// The installed runner executable.
  RunnerExecutable,

  /// The output directory of a managed language toolchain.
  ToolchainOutput,
};

StringRef stringForArtifactKind(ArtifactKind kind);

/// A buildable unit tracked by the resolver.
struct Component {
  /// The canonical identifier.
  std::string id;

  ComponentKind kind;

  /// The components which must be built before this one, in the order the
  /// build scripts declare them.
  std::vector<std::string> directDependencies;

  /// The artifacts which must all be present for the component to be
  /// considered built.
  std::vector<ArtifactKind> artifacts;

  /// The short name the external build script knows this component by, or
  /// empty if it is addressed by its id.
  std::string buildAlias;

  StringRef getBuildName() const {
    return buildAlias.empty() ? StringRef(id) : StringRef(buildAlias);
  }

  bool isNative() const {
    return kind == ComponentKind::NativeDependency ||
      kind == ComponentKind::NativeClient;
  }
};

}
}

#endif
