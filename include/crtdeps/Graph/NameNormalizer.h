//===- NameNormalizer.h -----------------------------------------*- C++ -*-===//
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
//
// Pure string transforms between the shorthand names the build scripts use
// and canonical registry ids. None of these functions consult the registry,
// so none of them can fail.
//
//===----------------------------------------------------------------------===//

#ifndef CRTDEPS_GRAPH_NAMENORMALIZER_H
#define CRTDEPS_GRAPH_NAMENORMALIZER_H

#include "crtdeps/Basic/LLVM.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"

#include <string>

namespace crtdeps {
namespace graph {

/// The prefix every runner id carries.
extern const char RunnerFamilyPrefix[];

/// The qualified prefix of the S3 runner family.
extern const char S3RunnerPrefix[];

/// The kind of component a caller claims a raw name refers to.
enum class NameHint {
  None,
  Dependency,
  Client,
  Runner,
};

/// Parse a name hint ("dep", "dependency", "client" or "runner").
Optional<NameHint> parseNameHint(StringRef text);

/// Canonicalize a caller supplied name.
///
/// A runner shorthand without the runner family prefix is qualified: "c"
/// becomes "runner-s3-c", and "s3-c" becomes "runner-s3-c". Every other name
/// is returned unchanged.
std::string normalizeComponent(NameHint hint, StringRef rawName);

/// Derive the include directory leaf name of a native library by stripping
/// its library family prefix ("aws-c-io" -> "io", "aws-checksums" ->
/// "checksums"). Ids outside the family are returned unchanged.
std::string deriveHeaderDirName(StringRef componentID);

/// Derive the short runner name from a runner id ("runner-s3-c" -> "c"). Ids
/// without the S3 runner prefix are returned unchanged.
std::string deriveRunnerShortName(StringRef componentID);

}
}

#endif
