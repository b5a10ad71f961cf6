//===-- Component.cpp -----------------------------------------------------===//
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

#include "crtdeps/Graph/Component.h"

#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/ErrorHandling.h"

using namespace crtdeps;
using namespace crtdeps::graph;

StringRef graph::stringForKind(ComponentKind kind) {
  switch (kind) {
#define CASE(kind, name) case ComponentKind::kind: return name
    CASE(NativeDependency, "native-dependency");
    CASE(NativeClient, "native-client");
    CASE(ManagedClient, "managed-client");
    CASE(Runner, "runner");
#undef CASE
  }
  llvm_unreachable("invalid component kind");
}

Optional<ComponentKind> graph::kindForString(StringRef text) {
  return llvm::StringSwitch<Optional<ComponentKind>>(text)
    .Case("native-dependency", ComponentKind::NativeDependency)
    .Case("native-client", ComponentKind::NativeClient)
    .Case("managed-client", ComponentKind::ManagedClient)
    .Case("runner", ComponentKind::Runner)
    .Default(None);
}

StringRef graph::stringForArtifactKind(ArtifactKind kind) {
  switch (kind) {
#define CASE(kind, name) case ArtifactKind::kind: return name
    CASE(PackageConfigDirectory, "package-config");
    CASE(StaticArchive, "archive");
    CASE(HeaderDirectory, "headers");
    CASE(RunnerExecutable, "executable");
    CASE(ToolchainOutput, "toolchain-output");
#undef CASE
  }
  llvm_unreachable("invalid artifact kind");
}
