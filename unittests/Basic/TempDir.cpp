//===- unittests/Basic/TempDir.cpp ----------------------------------------===//
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

#include "TempDir.h"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#include <cassert>

crtdeps::TmpDir::TmpDir(llvm::StringRef namePrefix) {
    llvm::SmallString<256> tempDirPrefix;
    llvm::sys::path::system_temp_directory(true, tempDirPrefix);
    llvm::sys::path::append(tempDirPrefix, namePrefix);

    std::error_code ec = llvm::sys::fs::createUniqueDirectory(
        tempDirPrefix.str(), tempDir);
    assert(!ec);
    (void)ec;
}

crtdeps::TmpDir::~TmpDir() {
    std::error_code ec = llvm::sys::fs::remove_directories(tempDir.str());
    assert(!ec);
    (void)ec;
}

const char *crtdeps::TmpDir::c_str() { return tempDir.c_str(); }
std::string crtdeps::TmpDir::str() const { return tempDir.str().str(); }

std::string crtdeps::TmpDir::path(llvm::StringRef relativePath) const {
    llvm::SmallString<256> result(tempDir);
    llvm::sys::path::append(result, relativePath);
    return result.str().str();
}

std::string crtdeps::TmpDir::makeDirectory(llvm::StringRef relativePath) {
    std::string result = path(relativePath);
    std::error_code ec = llvm::sys::fs::create_directories(result);
    assert(!ec);
    (void)ec;
    return result;
}

std::string crtdeps::TmpDir::makeFile(llvm::StringRef relativePath,
                                      llvm::StringRef contents) {
    std::string result = path(relativePath);
    std::error_code ec = llvm::sys::fs::create_directories(
        llvm::sys::path::parent_path(result));
    assert(!ec);

    llvm::raw_fd_ostream os(result, ec, llvm::sys::fs::OF_Text);
    assert(!ec);
    os << contents;
    os.close();
    (void)ec;
    return result;
}
