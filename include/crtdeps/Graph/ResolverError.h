//===- ResolverError.h ------------------------------------------*- C++ -*-===//
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
// Error payloads produced by the component graph. They travel inside
// llvm::Error and can be told apart with llvm::handleErrors.
//
//===----------------------------------------------------------------------===//

#ifndef CRTDEPS_GRAPH_RESOLVERERROR_H
#define CRTDEPS_GRAPH_RESOLVERERROR_H

#include "crtdeps/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>
#include <system_error>
#include <vector>

namespace crtdeps {
namespace graph {

/// The requested id is not in the registry.
class UnknownComponentError : public llvm::ErrorInfo<UnknownComponentError> {
  std::string componentID;

public:
  static char ID;

  explicit UnknownComponentError(StringRef componentID)
      : componentID(componentID) {}

  const std::string& getComponentID() const { return componentID; }

  void log(raw_ostream& os) const override;
  std::error_code convertToErrorCode() const override;
};

/// The registry contains a dependency cycle, so no build order exists.
class CyclicDependencyError : public llvm::ErrorInfo<CyclicDependencyError> {
  /// The ids along the cycle; the first id is repeated at the end.
  std::vector<std::string> cycle;

public:
  static char ID;

  explicit CyclicDependencyError(std::vector<std::string> cycle)
      : cycle(std::move(cycle)) {}

  const std::vector<std::string>& getCycle() const { return cycle; }

  void log(raw_ostream& os) const override;
  std::error_code convertToErrorCode() const override;
};

/// A registry definition violates the component table rules.
class InvalidRegistryError : public llvm::ErrorInfo<InvalidRegistryError> {
  std::string message;

public:
  static char ID;

  explicit InvalidRegistryError(const Twine& message) : message(message.str()) {}

  void log(raw_ostream& os) const override;
  std::error_code convertToErrorCode() const override;
};

/// The filesystem could not be inspected while probing for an artifact.
class ArtifactProbeError : public llvm::ErrorInfo<ArtifactProbeError> {
  std::string path;
  std::error_code ec;

public:
  static char ID;

  ArtifactProbeError(StringRef path, std::error_code ec)
      : path(path), ec(ec) {}

  const std::string& getPath() const { return path; }

  void log(raw_ostream& os) const override;
  std::error_code convertToErrorCode() const override { return ec; }
};

}
}

#endif
