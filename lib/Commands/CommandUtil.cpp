//===-- CommandUtil.cpp ---------------------------------------------------===//
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

#include "CommandUtil.h"
#include "crtdeps/Commands/Commands.h"

#include "llvm/Support/raw_ostream.h"

#include <cctype>

using namespace crtdeps;
using namespace crtdeps::commands;

static std::string programName;

void commands::setProgramName(StringRef name) {
  programName = name.str();
}

const char* commands::getProgramName() {
  if (programName.empty())
    return nullptr;

  return programName.c_str();
}

static StringRef getDisplayName() {
  const char* name = getProgramName();
  return name ? StringRef(name) : StringRef("resolver");
}

static char hexdigit(unsigned input) {
  return (input < 10) ? '0' + input : 'A' + input - 10;
}

std::string util::escapedString(StringRef str) {
  std::string result;
  llvm::raw_string_ostream resultStream(result);
  for (unsigned i = 0; i < str.size(); ++i) {
    char c = str[i];
    if (c == '"') {
      resultStream << "\\\"";
    } else if (isprint(c)) {
      resultStream << c;
    } else if (c == '\n') {
      resultStream << "\\n";
    } else {
      resultStream << "\\x"
             << hexdigit(((unsigned char) c >> 4) & 0xF)
             << hexdigit((unsigned char) c & 0xF);
    }
  }
  resultStream.flush();
  return result;
}

void util::emitError(raw_ostream& os, const Twine& message) {
  os << "error: " << getDisplayName() << ": " << message << "\n";
}

void util::emitError(raw_ostream& os, Error error) {
  llvm::handleAllErrors(std::move(error), [&](const llvm::ErrorInfoBase& info) {
    emitError(os, info.message());
  });
}

void util::emitWarning(raw_ostream& os, const Twine& message) {
  os << "warning: " << getDisplayName() << ": " << message << "\n";
}

void util::emitNote(raw_ostream& os, const Twine& message) {
  os << "note: " << message << "\n";
}
