//===- unittests/Basic/TempDir.h --------------------------------*- C++ -*-===//
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

#ifndef CRTDEPS_TESTS_TEMPDIR
#define CRTDEPS_TESTS_TEMPDIR

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringRef.h"

#include <string>

namespace crtdeps {

/// Creates a temporary directory in its constructor and removes it in its
/// destructor. Makes it available via str() and c_str().
class TmpDir {
private:
    TmpDir(const TmpDir&) = delete;
    TmpDir& operator=(const TmpDir&) = delete;

    llvm::SmallString<256> tempDir;

public:
    TmpDir(llvm::StringRef namePrefix = "");
    ~TmpDir();

    const char *c_str();
    std::string str() const;

    /// Get the path of \p relativePath inside the directory.
    std::string path(llvm::StringRef relativePath) const;

    /// Create a directory (and its parents) inside the directory.
    std::string makeDirectory(llvm::StringRef relativePath);

    /// Create a file (and its parent directories) inside the directory.
    std::string makeFile(llvm::StringRef relativePath,
                         llvm::StringRef contents = "");
};

}

#endif /* CRTDEPS_TESTS_TEMPDIR */
