//===-- FileInfo.cpp ------------------------------------------------------===//
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

#include "crtdeps/Basic/FileInfo.h"

#include <sys/stat.h>

#include <cassert>
#include <cerrno>
#include <system_error>

using namespace crtdeps;
using namespace crtdeps::basic;

bool FileInfo::isDirectory() const {
  return S_ISDIR(mode);
}

bool FileInfo::isRegularFile() const {
  return S_ISREG(mode);
}

llvm::ErrorOr<FileInfo> FileInfo::getInfoForPath(const std::string& path) {
  FileInfo result;

  struct ::stat buf;
  if (::stat(path.c_str(), &buf) != 0) {
    // A missing entry anywhere along the path just means the file is not
    // there; everything else is a real failure to inspect it.
    if (errno == ENOENT || errno == ENOTDIR) {
      assert(result.isMissing());
      return result;
    }
    return std::error_code(errno, std::generic_category());
  }

  result.device = buf.st_dev;
  result.inode = buf.st_ino;
  result.mode = buf.st_mode;
  result.size = buf.st_size;

  // Enforce we never accidentally create our sentinel missing file value.
  assert(!result.isMissing());

  return result;
}
