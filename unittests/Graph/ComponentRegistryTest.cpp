//===- unittests/Graph/ComponentRegistryTest.cpp --------------------------===//
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

#include "crtdeps/Graph/ComponentRegistry.h"
#include "crtdeps/Graph/ResolverError.h"

#include "gtest/gtest.h"

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

/// Check that creating a registry from \p components is rejected.
bool isRejected(std::vector<Component> components) {
  auto registry = ComponentRegistry::create(std::move(components));
  if (registry)
    return false;
  Error error = registry.takeError();
  bool result = error.isA<InvalidRegistryError>();
  llvm::consumeError(std::move(error));
  return result;
}

TEST(ComponentRegistryTest, defaultTopology) {
  const auto& registry = ComponentRegistry::getDefault();
  EXPECT_EQ(19U, registry.size());

  const Component* common = registry.findComponent("aws-c-common");
  ASSERT_NE(nullptr, common);
  EXPECT_EQ(ComponentKind::NativeDependency, common->kind);
  EXPECT_TRUE(common->directDependencies.empty());
  EXPECT_EQ(0U, registry.getIndex("aws-c-common").getValue());

  const Component* client = registry.findComponent("aws-c-s3");
  ASSERT_NE(nullptr, client);
  EXPECT_EQ(ComponentKind::NativeClient, client->kind);
  EXPECT_EQ(10U, client->directDependencies.size());
  EXPECT_EQ(3U, client->artifacts.size());

  const Component* rust = registry.findComponent("aws-s3-transfer-manager-rs");
  ASSERT_NE(nullptr, rust);
  EXPECT_EQ(ComponentKind::ManagedClient, rust->kind);
  EXPECT_EQ("rust", rust->getBuildName());

  // Every runner benchmarks exactly one client.
  unsigned numRunners = 0;
  for (const auto& component : registry.getComponents()) {
    if (component.kind != ComponentKind::Runner)
      continue;
    ++numRunners;
    ASSERT_EQ(1U, component.directDependencies.size()) << component.id;
    const Component* benchmarked =
      registry.findComponent(component.directDependencies[0]);
    ASSERT_NE(nullptr, benchmarked);
    EXPECT_TRUE(benchmarked->kind == ComponentKind::NativeClient ||
                benchmarked->kind == ComponentKind::ManagedClient);
  }
  EXPECT_EQ(4U, numRunners);

  const Component* runner = registry.findComponent("runner-s3-c");
  ASSERT_NE(nullptr, runner);
  EXPECT_EQ("aws-c-s3", runner->directDependencies[0]);
  EXPECT_EQ("c", runner->getBuildName());

  // Native dependencies have no alias; they are built by id.
  EXPECT_EQ("aws-c-common", common->getBuildName());
}

TEST(ComponentRegistryTest, lookup) {
  const auto& registry = ComponentRegistry::getDefault();

  auto found = registry.lookup("aws-c-io");
  ASSERT_TRUE(bool(found));
  EXPECT_EQ("aws-c-io", found->id);

  auto missing = registry.lookup("aws-c-nope");
  ASSERT_FALSE(bool(missing));
  std::string missingID;
  llvm::handleAllErrors(missing.takeError(),
                        [&](const UnknownComponentError& error) {
                          missingID = error.getComponentID();
                        });
  EXPECT_EQ("aws-c-nope", missingID);

  EXPECT_EQ(nullptr, registry.findComponent("aws-c-nope"));
  EXPECT_FALSE(registry.getIndex("aws-c-nope").hasValue());

  // Ids are case sensitive.
  EXPECT_EQ(nullptr, registry.findComponent("AWS-C-IO"));
}

TEST(ComponentRegistryTest, createValidatesTable) {
  EXPECT_TRUE(isRejected({ makeComponent("a", {}), makeComponent("a", {}) }));
  EXPECT_TRUE(isRejected({ makeComponent("a", {"a"}) }));
  EXPECT_TRUE(isRejected({ makeComponent("a", {"b"}) }));
  EXPECT_TRUE(isRejected({ makeComponent("a", {}),
                           makeComponent("b", {"a", "a"}) }));
  EXPECT_TRUE(isRejected({ makeComponent("", {}) }));

  // Forward references are fine, the table need not be sorted.
  auto sorted = ComponentRegistry::create({ makeComponent("b", {"a"}),
                                            makeComponent("a", {}) });
  ASSERT_TRUE(bool(sorted));
  EXPECT_EQ(2U, sorted->size());
  EXPECT_EQ(1U, sorted->getIndex("a").getValue());
}

TEST(ComponentRegistryTest, createAcceptsCycles) {
  // Cycles are reported by the closure operations, not at construction.
  auto registry = ComponentRegistry::create({ makeComponent("a", {"b"}),
                                              makeComponent("b", {"a"}) });
  ASSERT_TRUE(bool(registry));
  EXPECT_EQ(2U, registry->size());
}

TEST(ComponentRegistryTest, kindNames) {
  EXPECT_EQ("native-dependency",
            stringForKind(ComponentKind::NativeDependency));
  EXPECT_EQ("runner", stringForKind(ComponentKind::Runner));
  EXPECT_EQ(ComponentKind::ManagedClient,
            kindForString("managed-client").getValue());
  EXPECT_EQ(ComponentKind::NativeClient,
            kindForString("native-client").getValue());
  EXPECT_FALSE(kindForString("library").hasValue());
}

}
