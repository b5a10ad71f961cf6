//===- unittests/Graph/GraphResolverTest.cpp ------------------------------===//
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

#include "crtdeps/Graph/GraphResolver.h"
#include "crtdeps/Graph/ResolverError.h"

#include "gtest/gtest.h"

#include <algorithm>
#include <set>

using namespace crtdeps;
using namespace crtdeps::graph;

namespace {

Component makeComponent(StringRef id, std::vector<std::string> dependencies) {
  Component result;
  result.id = id.str();
  result.kind = ComponentKind::NativeDependency;
  result.directDependencies = std::move(dependencies);
  return result;
}

ComponentRegistry makeRegistry(std::vector<Component> components) {
  return llvm::cantFail(ComponentRegistry::create(std::move(components)));
}

/// Unwrap a closure result, failing the test on error.
std::vector<std::string> expectOK(Expected<std::vector<std::string>> result) {
  if (!result) {
    ADD_FAILURE() << llvm::toString(result.takeError());
    return {};
  }
  return std::move(*result);
}

/// Get the cycle reported by a failed closure, or an empty vector if it did
/// not fail with a cycle.
std::vector<std::string> cycleOf(Expected<std::vector<std::string>> result) {
  if (result)
    return {};
  std::vector<std::string> cycle;
  llvm::handleAllErrors(result.takeError(),
                        [&](const CyclicDependencyError& error) {
                          cycle = error.getCycle();
                        },
                        [&](const llvm::ErrorInfoBase& error) {
                          ADD_FAILURE() << error.message();
                        });
  return cycle;
}

bool isUnknownComponent(Expected<std::vector<std::string>> result) {
  if (result)
    return false;
  Error error = result.takeError();
  bool isUnknown = error.isA<UnknownComponentError>();
  llvm::consumeError(std::move(error));
  return isUnknown;
}

size_t indexOf(const std::vector<std::string>& sequence, StringRef id) {
  return std::find(sequence.begin(), sequence.end(), id) - sequence.begin();
}

TEST(GraphResolverTest, allDepsOrdersDependenciesFirst) {
  const auto& registry = ComponentRegistry::getDefault();
  GraphResolver resolver(registry);

  for (const auto& component : registry.getComponents()) {
    auto deps = expectOK(resolver.allDeps(component.id));
    ASSERT_FALSE(deps.empty()) << component.id;

    // The target appears exactly once, last.
    EXPECT_EQ(component.id, deps.back());
    EXPECT_EQ(1, std::count(deps.begin(), deps.end(), component.id));

    // No duplicates.
    std::set<std::string> unique(deps.begin(), deps.end());
    EXPECT_EQ(unique.size(), deps.size()) << component.id;

    // Every edge inside the closure points backwards.
    for (const auto& id : deps) {
      const Component* node = registry.findComponent(id);
      ASSERT_NE(nullptr, node);
      for (const auto& dependency : node->directDependencies) {
        size_t dependencyIndex = indexOf(deps, dependency);
        ASSERT_LT(dependencyIndex, deps.size())
          << dependency << " missing from closure of " << component.id;
        EXPECT_LT(dependencyIndex, indexOf(deps, id));
      }
    }
  }
}

TEST(GraphResolverTest, nativeClientChain) {
  GraphResolver resolver(ComponentRegistry::getDefault());

  std::vector<std::string> expected = {
    "aws-c-common", "aws-lc", "s2n", "aws-c-cal", "aws-c-io",
    "aws-checksums", "aws-c-compression", "aws-c-http", "aws-c-sdkutils",
    "aws-c-auth", "aws-c-s3",
  };
  EXPECT_EQ(expected, expectOK(resolver.allDeps("aws-c-s3")));

  expected.push_back("runner-s3-c");
  EXPECT_EQ(expected, expectOK(resolver.allDeps("runner-s3-c")));

  EXPECT_EQ(std::vector<std::string>({ "aws-c-common" }),
            expectOK(resolver.allDeps("aws-c-common")));
  EXPECT_EQ(std::vector<std::string>({ "aws-crt-java", "aws-sdk-java-v2",
                                       "runner-s3-java" }),
            expectOK(resolver.allDeps("runner-s3-java")));
}

TEST(GraphResolverTest, allDependentsOfCommonUtilities) {
  GraphResolver resolver(ComponentRegistry::getDefault());

  std::vector<std::string> expected = {
    // Furthest from the target first.
    "runner-s3-c", "aws-c-s3", "aws-c-auth", "aws-c-http", "aws-c-io",
    "aws-c-cal",
    // Direct dependents only, in declaration order.
    "aws-lc", "s2n", "aws-checksums", "aws-c-compression", "aws-c-sdkutils",
  };
  EXPECT_EQ(expected, expectOK(resolver.allDependents("aws-c-common")));
}

TEST(GraphResolverTest, allDependentsOfIntermediateLayer) {
  GraphResolver resolver(ComponentRegistry::getDefault());

  // aws-c-auth depends on aws-c-io both directly and through aws-c-http, so
  // it has to come before aws-c-http.
  EXPECT_EQ(std::vector<std::string>({ "runner-s3-c", "aws-c-s3",
                                       "aws-c-auth", "aws-c-http" }),
            expectOK(resolver.allDependents("aws-c-io")));
  EXPECT_EQ(std::vector<std::string>({ "runner-s3-java", "aws-sdk-java-v2" }),
            expectOK(resolver.allDependents("aws-crt-java")));
  EXPECT_TRUE(expectOK(resolver.allDependents("runner-s3-c")).empty());
  EXPECT_TRUE(expectOK(resolver.allDependents("runner-s3-rust")).empty());
}

TEST(GraphResolverTest, closuresAreConsistent) {
  const auto& registry = ComponentRegistry::getDefault();
  GraphResolver resolver(registry);

  for (const auto& component : registry.getComponents()) {
    auto dependents = expectOK(resolver.allDependents(component.id));

    EXPECT_EQ(dependents.size(), indexOf(dependents, component.id))
      << component.id << " listed among its own dependents";

    std::set<std::string> unique(dependents.begin(), dependents.end());
    EXPECT_EQ(unique.size(), dependents.size());

    for (const auto& dependent : dependents) {
      auto deps = expectOK(resolver.allDeps(dependent));
      EXPECT_LT(indexOf(deps, component.id), deps.size())
        << component.id << " missing from the closure of " << dependent;
    }

    // Processing front to back never handles a component before something
    // built on top of it.
    for (size_t i = 0; i != dependents.size(); ++i) {
      auto deps = expectOK(resolver.allDeps(dependents[i]));
      for (size_t j = 0; j != i; ++j) {
        EXPECT_EQ(deps.size(), indexOf(deps, dependents[j]))
          << dependents[i] << " depends on earlier " << dependents[j];
      }
    }
  }
}

TEST(GraphResolverTest, closuresAreIdempotent) {
  GraphResolver resolver(ComponentRegistry::getDefault());

  auto deps = expectOK(resolver.allDeps("runner-s3-c"));
  EXPECT_EQ(deps, expectOK(resolver.allDeps("runner-s3-c")));

  auto dependents = expectOK(resolver.allDependents("aws-c-cal"));
  EXPECT_EQ(dependents, expectOK(resolver.allDependents("aws-c-cal")));

  // A second resolver over the same registry agrees.
  GraphResolver other(ComponentRegistry::getDefault());
  EXPECT_EQ(dependents, expectOK(other.allDependents("aws-c-cal")));
}

TEST(GraphResolverTest, equalRankUsesDeclarationOrder) {
  auto registry = makeRegistry({
    makeComponent("base", {}),
    makeComponent("zeta", {"base"}),
    makeComponent("alpha", {"base"}),
    makeComponent("mid", {"alpha"}),
    makeComponent("top", {"mid", "zeta"}),
    makeComponent("beta", {"base"}),
  });
  GraphResolver resolver(registry);

  // Ranks: top 3, mid 2, and zeta, alpha, beta 1.
  EXPECT_EQ(std::vector<std::string>({ "top", "mid", "zeta", "alpha",
                                       "beta" }),
            expectOK(resolver.allDependents("base")));

  // Siblings are visited in declared order.
  EXPECT_EQ(std::vector<std::string>({ "base", "alpha", "mid", "zeta",
                                       "top" }),
            expectOK(resolver.allDeps("top")));
}

TEST(GraphResolverTest, directEdges) {
  GraphResolver resolver(ComponentRegistry::getDefault());

  EXPECT_EQ(std::vector<std::string>({ "aws-c-common", "aws-c-io",
                                       "aws-c-compression" }),
            expectOK(resolver.directDeps("aws-c-http")));
  EXPECT_EQ(std::vector<std::string>({ "aws-c-auth", "aws-c-s3" }),
            expectOK(resolver.directDependents("aws-c-http")));
  EXPECT_EQ(std::vector<std::string>({ "runner-s3-c" }),
            expectOK(resolver.directDependents("aws-c-s3")));
  EXPECT_TRUE(expectOK(resolver.directDeps("aws-c-common")).empty());
  EXPECT_EQ(10U, expectOK(resolver.directDependents("aws-c-common")).size());
}

TEST(GraphResolverTest, unknownComponent) {
  GraphResolver resolver(ComponentRegistry::getDefault());

  EXPECT_TRUE(isUnknownComponent(resolver.allDeps("aws-c-nope")));
  EXPECT_TRUE(isUnknownComponent(resolver.allDependents("aws-c-nope")));
  EXPECT_TRUE(isUnknownComponent(resolver.directDeps("aws-c-nope")));
  EXPECT_TRUE(isUnknownComponent(resolver.directDependents("aws-c-nope")));

  // Shorthands must be normalized before they reach the resolver.
  EXPECT_TRUE(isUnknownComponent(resolver.allDeps("c")));
}

TEST(GraphResolverTest, twoComponentCycle) {
  auto registry = makeRegistry({
    makeComponent("leaf", {}),
    makeComponent("a", {"b", "leaf"}),
    makeComponent("b", {"a"}),
    makeComponent("user", {"a"}),
    makeComponent("unrelated", {"leaf"}),
  });
  GraphResolver resolver(registry);

  std::vector<std::string> expected = { "a", "b", "a" };
  EXPECT_EQ(expected, cycleOf(resolver.allDeps("a")));
  EXPECT_EQ(std::vector<std::string>({ "b", "a", "b" }),
            cycleOf(resolver.allDeps("b")));
  EXPECT_EQ(expected, cycleOf(resolver.allDeps("user")));
  EXPECT_EQ(expected, cycleOf(resolver.allDependents("a")));
  EXPECT_EQ(std::vector<std::string>({ "b", "a", "b" }),
            cycleOf(resolver.allDependents("b")));

  // The dependents of "leaf" run into the cycle as well.
  EXPECT_FALSE(cycleOf(resolver.allDependents("leaf")).empty());

  // Queries that never touch the cycle still succeed.
  EXPECT_EQ(std::vector<std::string>({ "leaf", "unrelated" }),
            expectOK(resolver.allDeps("unrelated")));
  EXPECT_TRUE(expectOK(resolver.allDependents("user")).empty());
}

TEST(GraphResolverTest, longCycleIsReportedAlongDependencies) {
  auto registry = makeRegistry({
    makeComponent("a", {"b"}),
    makeComponent("b", {"c"}),
    makeComponent("c", {"a"}),
  });
  GraphResolver resolver(registry);

  std::vector<std::string> expected = { "a", "b", "c", "a" };
  EXPECT_EQ(expected, cycleOf(resolver.allDeps("a")));
  EXPECT_EQ(expected, cycleOf(resolver.allDependents("a")));

  auto result = resolver.allDeps("a");
  ASSERT_FALSE(bool(result));
  EXPECT_EQ("dependency cycle detected: a -> b -> c -> a",
            llvm::toString(result.takeError()));
}

}
