//===- FileSystem.h ---------------------------------------------*- C++ -*-===//
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

#ifndef CRTDEPS_BASIC_FILESYSTEM_H
#define CRTDEPS_BASIC_FILESYSTEM_H

#include "crtdeps/Basic/Compiler.h"
#include "crtdeps/Basic/FileInfo.h"
#include "crtdeps/Basic/LLVM.h"

#include "llvm/Support/ErrorOr.h"

#include <memory>
#include <string>

namespace crtdeps {
namespace basic {

// Abstract interface for inspecting a file system. This allows mocking of
// operations for testing, and for clients to provide virtualized interfaces.
//
// The interface is read-only; nothing in the resolver modifies an install
// tree.
class FileSystem  {
  // DO NOT COPY
  FileSystem(const FileSystem&) CRTDEPS_DELETED_FUNCTION;
  void operator=(const FileSystem&) CRTDEPS_DELETED_FUNCTION;
  FileSystem &operator=(FileSystem&& rhs) CRTDEPS_DELETED_FUNCTION;

public:
  FileSystem() {}
  virtual ~FileSystem();

  /// Get the information to represent the state of the given path in the file
  /// system, looking through symbolic links.
  ///
  /// \returns The FileInfo for the given path, which will be missing if the
  /// path does not exist, or the error encountered while inspecting it.
  virtual llvm::ErrorOr<FileInfo> getFileInfo(const std::string& path) = 0;

  /// Check whether \p path names an existing directory.
  ///
  /// \returns The answer, or the error encountered while inspecting the path.
  llvm::ErrorOr<bool> isDirectory(const std::string& path);

  /// Check whether \p path names an existing regular file.
  ///
  /// \returns The answer, or the error encountered while inspecting the path.
  llvm::ErrorOr<bool> isRegularFile(const std::string& path);
};

/// Create a FileSystem instance suitable for accessing the local filesystem.
std::unique_ptr<FileSystem> createLocalFileSystem();

}
}

#endif
