//===- ArtifactProber.h -----------------------------------------*- C++ -*-===//
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

#ifndef CRTDEPS_GRAPH_ARTIFACTPROBER_H
#define CRTDEPS_GRAPH_ARTIFACTPROBER_H

#include "crtdeps/Basic/LLVM.h"
#include "crtdeps/Graph/Component.h"
#include "crtdeps/Graph/ComponentRegistry.h"
#include "crtdeps/Graph/ResolverError.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace crtdeps {
namespace basic {
class FileSystem;
}

namespace graph {

/// The location of a single artifact of a component.
struct ArtifactPath {
  ArtifactKind kind;
  std::string path;

  /// Whether the artifact is a directory, rather than a file.
  bool isDirectory() const {
    return kind == ArtifactKind::PackageConfigDirectory ||
      kind == ArtifactKind::HeaderDirectory ||
      kind == ArtifactKind::ToolchainOutput;
  }
};

/// The roots artifact paths are resolved against.
struct ArtifactLayout {
  /// The installation prefix the native builds install into.
  std::string installRoot;

  /// The checkout holding the managed client sources, if known.
  std::string sourceRoot;
};

/// Receives the problems the prober recovers from.
class ArtifactProberDelegate {
public:
  virtual ~ArtifactProberDelegate();

  /// Called when a filesystem failure was downgraded to "not built".
  virtual void probeFailed(StringRef componentID,
                           const ArtifactProbeError& error) = 0;
};

/// Decides whether a component's build output is already installed.
class ArtifactProber {
  const ComponentRegistry& registry;
  basic::FileSystem& fileSystem;
  ArtifactProberDelegate* delegate;

  llvm::Expected<bool> checkArtifact(const ArtifactPath& artifact) const;

public:
  ArtifactProber(const ComponentRegistry& registry,
                 basic::FileSystem& fileSystem,
                 ArtifactProberDelegate* delegate = nullptr)
      : registry(registry), fileSystem(fileSystem), delegate(delegate) {}

  /// Whether the prober's answer for components of \p kind can be trusted.
  ///
  /// Managed toolchains keep their own incremental state, so the prober never
  /// claims such a component is built.
  static bool isAuthoritative(ComponentKind kind);

  /// Resolve every artifact of \p component to a concrete path. Toolchain
  /// output directories are only resolved when the layout has a source root.
  std::vector<ArtifactPath>
  getArtifactPaths(const Component& component,
                   const ArtifactLayout& layout) const;

  /// Check whether every artifact of the component is present.
  ///
  /// \returns UnknownComponentError for an undeclared id, ArtifactProbeError
  /// if the filesystem could not be inspected, and otherwise the answer.
  llvm::Expected<bool> probe(StringRef componentID, StringRef installRoot) const;

  /// Check whether every artifact of the component is present, treating any
  /// failure (including an unknown id) as "not built".
  bool isBuilt(StringRef componentID, StringRef installRoot) const;
};

}
}

#endif
