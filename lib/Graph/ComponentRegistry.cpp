//===-- ComponentRegistry.cpp ---------------------------------------------===//
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

#include "crtdeps/Graph/NameNormalizer.h"
#include "crtdeps/Graph/ResolverError.h"

#include "llvm/ADT/StringSet.h"
#include "llvm/ADT/Twine.h"

using namespace crtdeps;
using namespace crtdeps::graph;

namespace {

Component makeNative(StringRef id, ComponentKind kind,
                     std::vector<std::string> dependencies) {
  Component result;
  result.id = id.str();
  result.kind = kind;
  result.directDependencies = std::move(dependencies);
  result.artifacts = {
    ArtifactKind::PackageConfigDirectory,
    ArtifactKind::StaticArchive,
    ArtifactKind::HeaderDirectory,
  };
  return result;
}

Component makeManagedClient(StringRef id, StringRef alias,
                            std::vector<std::string> dependencies = {}) {
  Component result;
  result.id = id.str();
  result.kind = ComponentKind::ManagedClient;
  result.directDependencies = std::move(dependencies);
  result.artifacts = { ArtifactKind::ToolchainOutput };
  result.buildAlias = alias.str();
  return result;
}

Component makeRunner(StringRef shortName, StringRef client) {
  Component result;
  result.id = (Twine(S3RunnerPrefix) + shortName).str();
  result.kind = ComponentKind::Runner;
  result.directDependencies = { client.str() };
  result.artifacts = { ArtifactKind::RunnerExecutable };
  result.buildAlias = shortName.str();
  return result;
}

}

ComponentRegistry::ComponentRegistry(std::vector<Component> components)
    : components(std::move(components)) {
  for (unsigned i = 0, e = this->components.size(); i != e; ++i)
    indexByID[this->components[i].id] = i;
}

llvm::Expected<ComponentRegistry>
ComponentRegistry::create(std::vector<Component> components) {
  llvm::StringSet<> declared;
  for (const auto& component : components) {
    if (component.id.empty())
      return llvm::make_error<InvalidRegistryError>("empty component id");
    if (!declared.insert(component.id).second)
      return llvm::make_error<InvalidRegistryError>(
          Twine("duplicate component '") + component.id + "'");
  }

  for (const auto& component : components) {
    llvm::StringSet<> seen;
    for (const auto& dependency : component.directDependencies) {
      if (dependency == component.id)
        return llvm::make_error<InvalidRegistryError>(
            Twine("component '") + component.id + "' depends on itself");
      if (!declared.count(dependency))
        return llvm::make_error<InvalidRegistryError>(
            Twine("component '") + component.id +
            "' depends on undeclared component '" + dependency + "'");
      if (!seen.insert(dependency).second)
        return llvm::make_error<InvalidRegistryError>(
            Twine("component '") + component.id + "' lists '" + dependency +
            "' more than once");
    }
  }

  return ComponentRegistry(std::move(components));
}

std::vector<Component> ComponentRegistry::getDefaultComponents() {
  const auto native = ComponentKind::NativeDependency;

  return {
    // Native dependencies, in build order.
    makeNative("aws-c-common", native, {}),
    makeNative("aws-lc", native, {"aws-c-common"}),
    makeNative("s2n", native, {"aws-c-common"}),
    makeNative("aws-c-cal", native, {"aws-c-common", "aws-lc", "s2n"}),
    makeNative("aws-c-io", native, {"aws-c-common", "aws-c-cal", "s2n"}),
    makeNative("aws-checksums", native, {"aws-c-common"}),
    makeNative("aws-c-compression", native, {"aws-c-common"}),
    makeNative("aws-c-http", native,
               {"aws-c-common", "aws-c-io", "aws-c-compression"}),
    makeNative("aws-c-sdkutils", native, {"aws-c-common"}),
    makeNative("aws-c-auth", native,
               {"aws-c-common", "aws-c-io", "aws-c-http", "aws-c-sdkutils",
                "aws-c-cal"}),

    // The native client.
    makeNative("aws-c-s3", ComponentKind::NativeClient,
               {"aws-c-common", "aws-lc", "s2n", "aws-c-cal", "aws-c-io",
                "aws-checksums", "aws-c-compression", "aws-c-http",
                "aws-c-sdkutils", "aws-c-auth"}),

    // Managed language clients.
    makeManagedClient("aws-crt-python", "python"),
    makeManagedClient("aws-crt-java", "java"),
    makeManagedClient("aws-sdk-java-v2", "java", {"aws-crt-java"}),
    makeManagedClient("aws-s3-transfer-manager-rs", "rust"),

    // Runners, one per client they benchmark.
    makeRunner("c", "aws-c-s3"),
    makeRunner("python", "aws-crt-python"),
    makeRunner("java", "aws-sdk-java-v2"),
    makeRunner("rust", "aws-s3-transfer-manager-rs"),
  };
}

const ComponentRegistry& ComponentRegistry::getDefault() {
  static const ComponentRegistry registry = llvm::cantFail(
      create(getDefaultComponents()), "built-in component table is invalid");
  return registry;
}

llvm::Expected<const Component&> ComponentRegistry::lookup(StringRef id) const {
  if (const Component* component = findComponent(id))
    return *component;
  return llvm::make_error<UnknownComponentError>(id);
}

const Component* ComponentRegistry::findComponent(StringRef id) const {
  auto it = indexByID.find(id);
  return (it == indexByID.end()) ? nullptr : &components[it->second];
}

Optional<unsigned> ComponentRegistry::getIndex(StringRef id) const {
  auto it = indexByID.find(id);
  if (it == indexByID.end())
    return None;
  return it->second;
}
