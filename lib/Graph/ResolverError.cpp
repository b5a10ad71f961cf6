//===-- ResolverError.cpp -------------------------------------------------===//
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

#include "crtdeps/Graph/ResolverError.h"

#include "llvm/Support/raw_ostream.h"

using namespace crtdeps;
using namespace crtdeps::graph;

char UnknownComponentError::ID = 0;
char CyclicDependencyError::ID = 0;
char InvalidRegistryError::ID = 0;
char ArtifactProbeError::ID = 0;

void UnknownComponentError::log(raw_ostream& os) const {
  os << "unknown component '" << componentID << "'";
}

std::error_code UnknownComponentError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}

void CyclicDependencyError::log(raw_ostream& os) const {
  os << "dependency cycle detected: ";
  for (unsigned i = 0, e = cycle.size(); i != e; ++i) {
    if (i != 0)
      os << " -> ";
    os << cycle[i];
  }
}

std::error_code CyclicDependencyError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}

void InvalidRegistryError::log(raw_ostream& os) const {
  os << "invalid component registry: " << message;
}

std::error_code InvalidRegistryError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}

void ArtifactProbeError::log(raw_ostream& os) const {
  os << "unable to inspect '" << path << "' (" << ec.message() << ")";
}
