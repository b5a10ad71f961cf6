//===- FileInfo.h -----------------------------------------------*- C++ -*-===//
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
// This file contains the FileInfo wrapper used by the artifact prober to
// decide whether an installed file or directory is present.
//
//===----------------------------------------------------------------------===//

#ifndef CRTDEPS_BASIC_FILEINFO_H
#define CRTDEPS_BASIC_FILEINFO_H

#include "llvm/Support/ErrorOr.h"

#include <cstdint>
#include <string>

namespace crtdeps {
namespace basic {

/// File information for a single path, as reported by stat(2).
///
/// This structure is intentionally sized to have no packing holes.
struct FileInfo {
  /// The device number.
  uint64_t device = 0;
  /// The inode number.
  uint64_t inode = 0;
  /// The mode flags of the file.
  uint64_t mode = 0;
  /// The size of the file.
  uint64_t size = 0;

  /// Check if this is a FileInfo representing a missing file.
  bool isMissing() const {
    // We use an all-zero FileInfo as a sentinel, under the assumption this can
    // never exist in normal circumstances.
    return (device == 0 && inode == 0 && mode == 0 && size == 0);
  }

  /// Check if the FileInfo corresponds to a directory.
  bool isDirectory() const;

  /// Check if the FileInfo corresponds to a regular file.
  bool isRegularFile() const;

  bool operator==(const FileInfo& rhs) const {
    return (device == rhs.device &&
            inode == rhs.inode &&
            mode == rhs.mode &&
            size == rhs.size);
  }

  bool operator!=(const FileInfo& rhs) const {
    return !(*this == rhs);
  }

  /// Get the information to represent the state of the given path in the file
  /// system.
  ///
  /// \returns The FileInfo for the given path, which will be missing if the
  /// path (or one of its parent directories) does not exist. Any other stat
  /// failure, such as a permission error, is returned as an error code.
  static llvm::ErrorOr<FileInfo> getInfoForPath(const std::string& path);
};

}
}

#endif
