//===-- ArtifactProber.cpp ------------------------------------------------===//
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

#include "crtdeps/Graph/ArtifactProber.h"

#include "crtdeps/Basic/FileSystem.h"
#include "crtdeps/Graph/NameNormalizer.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/Path.h"

using namespace crtdeps;
using namespace crtdeps::graph;

ArtifactProberDelegate::~ArtifactProberDelegate() {}

bool ArtifactProber::isAuthoritative(ComponentKind kind) {
  switch (kind) {
  case ComponentKind::NativeDependency:
  case ComponentKind::NativeClient:
  case ComponentKind::Runner:
    return true;
  case ComponentKind::ManagedClient:
    return false;
  }
  llvm_unreachable("invalid component kind");
}

std::vector<ArtifactPath>
ArtifactProber::getArtifactPaths(const Component& component,
                                 const ArtifactLayout& layout) const {
  namespace path = llvm::sys::path;

  std::vector<ArtifactPath> result;
  for (auto kind : component.artifacts) {
    SmallString<256> artifactPath(layout.installRoot);
    switch (kind) {
    case ArtifactKind::PackageConfigDirectory:
      path::append(artifactPath, "lib", "cmake", component.id);
      break;
    case ArtifactKind::StaticArchive:
      path::append(artifactPath, "lib", Twine("lib") + component.id + ".a");
      break;
    case ArtifactKind::HeaderDirectory:
      path::append(artifactPath, "include", "aws",
                   deriveHeaderDirName(component.id));
      break;
    case ArtifactKind::RunnerExecutable:
      path::append(artifactPath, "bin",
                   Twine("s3-") + deriveRunnerShortName(component.id) +
                   "-runner");
      break;
    case ArtifactKind::ToolchainOutput:
      if (layout.sourceRoot.empty())
        continue;
      artifactPath = layout.sourceRoot;
      path::append(artifactPath, "clients", component.id, "target",
                   "release");
      break;
    }
    result.push_back({ kind, artifactPath.str().str() });
  }
  return result;
}

llvm::Expected<bool>
ArtifactProber::checkArtifact(const ArtifactPath& artifact) const {
  auto present = artifact.isDirectory() ?
    fileSystem.isDirectory(artifact.path) :
    fileSystem.isRegularFile(artifact.path);
  if (!present)
    return llvm::make_error<ArtifactProbeError>(artifact.path,
                                                present.getError());
  return *present;
}

llvm::Expected<bool>
ArtifactProber::probe(StringRef componentID, StringRef installRoot) const {
  auto component = registry.lookup(componentID);
  if (!component)
    return component.takeError();

  if (!isAuthoritative(component->kind))
    return false;

  ArtifactLayout layout;
  layout.installRoot = installRoot.str();
  auto artifacts = getArtifactPaths(*component, layout);
  if (artifacts.empty())
    return false;

  // Every artifact must be present; a partial install tree is left behind by
  // an interrupted build and has to be rebuilt.
  for (const auto& artifact : artifacts) {
    auto present = checkArtifact(artifact);
    if (!present)
      return present.takeError();
    if (!*present)
      return false;
  }
  return true;
}

bool ArtifactProber::isBuilt(StringRef componentID,
                             StringRef installRoot) const {
  auto result = probe(componentID, installRoot);
  if (result)
    return *result;

  llvm::handleAllErrors(
      result.takeError(),
      [&](const ArtifactProbeError& error) {
        if (delegate)
          delegate->probeFailed(componentID, error);
      },
      [&](const UnknownComponentError&) {});
  return false;
}
