//===-- NameNormalizer.cpp ------------------------------------------------===//
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

#include "crtdeps/Graph/NameNormalizer.h"

#include "llvm/ADT/StringSwitch.h"
#include "llvm/ADT/Twine.h"

using namespace crtdeps;
using namespace crtdeps::graph;

const char graph::RunnerFamilyPrefix[] = "runner-";
const char graph::S3RunnerPrefix[] = "runner-s3-";

/// The library family prefixes, longest first.
static const char* const libraryFamilyPrefixes[] = { "aws-c-", "aws-" };

Optional<NameHint> graph::parseNameHint(StringRef text) {
  return llvm::StringSwitch<Optional<NameHint>>(text)
    .Cases("dep", "dependency", NameHint::Dependency)
    .Case("client", NameHint::Client)
    .Case("runner", NameHint::Runner)
    .Default(None);
}

std::string graph::normalizeComponent(NameHint hint, StringRef rawName) {
  if (hint != NameHint::Runner || rawName.startswith(RunnerFamilyPrefix))
    return rawName.str();

  // The clear script spells runners as "s3-<name>", so only the family prefix
  // is missing there.
  if (rawName.startswith("s3-"))
    return (Twine(RunnerFamilyPrefix) + rawName).str();

  return (Twine(S3RunnerPrefix) + rawName).str();
}

std::string graph::deriveHeaderDirName(StringRef componentID) {
  for (const char* prefix : libraryFamilyPrefixes) {
    StringRef name = componentID;
    if (name.consume_front(prefix) && !name.empty())
      return name.str();
  }
  return componentID.str();
}

std::string graph::deriveRunnerShortName(StringRef componentID) {
  StringRef name = componentID;
  if (name.consume_front(S3RunnerPrefix) && !name.empty())
    return name.str();
  return componentID.str();
}
