//===- Version.h ------------------------------------------------*- C++ -*-===//
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

#ifndef CRTDEPS_BASIC_VERSION_H
#define CRTDEPS_BASIC_VERSION_H

#include "crtdeps/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <string>

namespace crtdeps {

std::string getCrtDepsFullVersion(StringRef productName = "resolver");

}

#endif
