//===- Commands.h -----------------------------------------------*- C++ -*-===//
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
// This header describes the interfaces in the Commands crtdeps library, which
// contains the command line tool implementation.
//
//===----------------------------------------------------------------------===//

#ifndef CRTDEPS_COMMANDS_H
#define CRTDEPS_COMMANDS_H

#include "crtdeps/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <string>
#include <vector>

namespace crtdeps {
namespace commands {

/// Register the program name.
void setProgramName(StringRef name);

/// Get the registered program name.
const char* getProgramName();

/// The process wide settings the resolver commands run with.
struct ResolverConfig {
  /// The install root used when a command is not given one.
  std::string installRoot;

  /// The source checkout used to locate managed toolchain output.
  std::string sourceRoot;

  /// Whether to emit notes about what the resolver is doing.
  bool verbose = false;

  /// Read the configuration from the CRTDEPS_INSTALL_DIR,
  /// CRTDEPS_SOURCE_ROOT and CRTDEPS_VERBOSE environment variables.
  static ResolverConfig fromEnvironment();
};

/// Run a resolver command line (without the program name), writing results to
/// \p os and diagnostics to \p errs.
///
/// \returns The process exit code: 0 on success, 1 for an unknown component,
/// a dependency cycle or a component which is not built, and 2 for a usage
/// error.
int executeResolverCommand(const std::vector<std::string>& args,
                           const ResolverConfig& config,
                           raw_ostream& os, raw_ostream& errs);

}
}

#endif
