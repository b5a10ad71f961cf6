//===- CommandUtil.h --------------------------------------------*- C++ -*-===//
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

#ifndef CRTDEPS_COMMANDS_COMMANDUTIL_H
#define CRTDEPS_COMMANDS_COMMANDUTIL_H

#include "crtdeps/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"

#include <string>

namespace crtdeps {
namespace commands {
namespace util {

std::string escapedString(StringRef str);

/// Emit "error: <program>: <message>".
void emitError(raw_ostream& os, const Twine& message);

/// Emit every error payload in \p error as a separate error line.
void emitError(raw_ostream& os, Error error);

/// Emit "warning: <program>: <message>".
void emitWarning(raw_ostream& os, const Twine& message);

/// Emit "note: <message>".
void emitNote(raw_ostream& os, const Twine& message);

}
}
}

#endif
