//===-- FileSystem.cpp ----------------------------------------------------===//
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

#include "crtdeps/Basic/FileSystem.h"

#include <memory>

using namespace crtdeps;
using namespace crtdeps::basic;

FileSystem::~FileSystem() {}

llvm::ErrorOr<bool> FileSystem::isDirectory(const std::string& path) {
  auto info = getFileInfo(path);
  if (!info)
    return info.getError();
  return !info->isMissing() && info->isDirectory();
}

llvm::ErrorOr<bool> FileSystem::isRegularFile(const std::string& path) {
  auto info = getFileInfo(path);
  if (!info)
    return info.getError();
  return !info->isMissing() && info->isRegularFile();
}

namespace {

class LocalFileSystem : public FileSystem {
public:
  LocalFileSystem() {}

  virtual llvm::ErrorOr<FileInfo>
  getFileInfo(const std::string& path) override {
    return FileInfo::getInfoForPath(path);
  }
};

}

std::unique_ptr<FileSystem> basic::createLocalFileSystem() {
  return std::make_unique<LocalFileSystem>();
}
