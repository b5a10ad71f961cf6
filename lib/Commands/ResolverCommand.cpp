//===-- ResolverCommand.cpp -----------------------------------------------===//
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

#include "crtdeps/Commands/Commands.h"

#include "CommandUtil.h"

#include "crtdeps/Basic/FileSystem.h"
#include "crtdeps/Basic/LLVM.h"
#include "crtdeps/Basic/Version.h"
#include "crtdeps/Graph/ArtifactProber.h"
#include "crtdeps/Graph/ComponentRegistry.h"
#include "crtdeps/Graph/GraphResolver.h"
#include "crtdeps/Graph/NameNormalizer.h"
#include "crtdeps/Graph/ResolverError.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/raw_ostream.h"

#include <cassert>
#include <cstdlib>
#include <memory>

using namespace crtdeps;
using namespace crtdeps::commands;
using namespace crtdeps::graph;

ResolverConfig ResolverConfig::fromEnvironment() {
  ResolverConfig config;
  if (const char* installRoot = ::getenv("CRTDEPS_INSTALL_DIR"))
    config.installRoot = installRoot;
  if (const char* sourceRoot = ::getenv("CRTDEPS_SOURCE_ROOT"))
    config.sourceRoot = sourceRoot;
  if (const char* verbose = ::getenv("CRTDEPS_VERBOSE"))
    config.verbose = StringRef(verbose) != "" && StringRef(verbose) != "0";
  return config;
}

namespace {

enum ExitCode {
  ExitSuccess = 0,
  ExitFailure = 1,
  ExitUsage = 2,
};

#pragma mark - Command Infrastructure

/// The subcommands, with the arguments they accept.
struct SubcommandInfo {
  const char* name;
  const char* arguments;
  const char* description;
  unsigned minPositional;
  unsigned maxPositional;
  bool acceptsNameHint;
};

static const SubcommandInfo subcommands[] = {
  { "all-deps", "<component>",
    "List a component after everything it needs, in build order", 1, 1, true },
  { "all-dependents", "<component>",
    "List everything built on a component, furthest dependents first",
    1, 1, true },
  { "is-built", "<component> [<install-root>]",
    "Exit with 0 if the component's artifacts are installed", 1, 2, true },
  { "deps", "<component>",
    "List the direct dependencies of a component", 1, 1, true },
  { "dependents", "<component>",
    "List the components depending directly on a component", 1, 1, true },
  { "artifacts", "<component> [<install-root>]",
    "List the artifact paths proving a component is built", 1, 2, true },
  { "build-target", "<component>",
    "Print the build script arguments selecting a component", 1, 1, true },
  { "list", "",
    "List every known component in declaration order", 0, 0, false },
};

static const SubcommandInfo* findSubcommand(StringRef name) {
  for (const auto& info : subcommands) {
    if (name == info.name)
      return &info;
  }
  return nullptr;
}

/// The options and positional arguments of a single subcommand invocation.
struct ParsedArguments {
  NameHint hint = NameHint::None;
  std::string sourceRoot;
  Optional<ComponentKind> kindFilter;
  bool showHelp = false;
  std::vector<std::string> positional;
};

/// Shared state for running one resolver command.
class CommandContext : public ArtifactProberDelegate {
  const ResolverConfig& config;

public:
  raw_ostream& os;
  raw_ostream& errs;
  const ComponentRegistry& registry;
  GraphResolver resolver;
  std::unique_ptr<basic::FileSystem> fileSystem;

  CommandContext(const ResolverConfig& config, raw_ostream& os,
                 raw_ostream& errs)
      : config(config), os(os), errs(errs),
        registry(ComponentRegistry::getDefault()), resolver(registry),
        fileSystem(basic::createLocalFileSystem()) {}

  const ResolverConfig& getConfig() const { return config; }

  void note(const Twine& message) {
    if (config.verbose)
      util::emitNote(errs, message);
  }

  /// Report a structural failure and produce the matching exit code.
  int fail(Error error) {
    util::emitError(errs, std::move(error));
    return ExitFailure;
  }

  /// Normalize a raw component name, reporting what changed.
  std::string canonicalize(const ParsedArguments& args, StringRef rawName) {
    std::string id = normalizeComponent(args.hint, rawName);
    if (id != rawName)
      note(Twine("resolved '") + rawName + "' to '" + id + "'");
    return id;
  }

  void printList(ArrayRef<std::string> ids) {
    for (const auto& id : ids)
      os << id << "\n";
  }

  virtual void probeFailed(StringRef componentID,
                           const ArtifactProbeError& error) override {
    util::emitWarning(errs, Twine(error.message()) + "; treating '" +
                      componentID + "' as not built");
  }
};

static void subcommandUsage(raw_ostream& errs, const SubcommandInfo& info) {
  int optionWidth = 24;
  errs << "Usage: " << (getProgramName() ? getProgramName() : "resolver")
       << " " << info.name << " [options] " << info.arguments << "\n";
  errs << "\n" << info.description << ".\n";
  errs << "\nOptions:\n";
  errs << "  " << llvm::left_justify("--help", optionWidth)
       << " show this help message and exit\n";
  if (info.acceptsNameHint) {
    errs << "  " << llvm::left_justify("-r, --runner", optionWidth)
         << " the component is a runner (\"c\" means \"runner-s3-c\")\n";
    errs << "  " << llvm::left_justify("-c, --client", optionWidth)
         << " the component is a client\n";
    errs << "  " << llvm::left_justify("-d, --dep", optionWidth)
         << " the component is a native dependency\n";
  }
  if (StringRef(info.name) == "artifacts") {
    errs << "  " << llvm::left_justify("--source-root <dir>", optionWidth)
         << " locate managed toolchain output under <dir>\n";
  }
  if (StringRef(info.name) == "list") {
    errs << "  " << llvm::left_justify("--kind <kind>", optionWidth)
         << " only list components of the given kind\n";
  }
}

/// Parse the options of a subcommand.
///
/// \returns True on success; on failure the problem has been reported.
static bool parseArguments(CommandContext& context, const SubcommandInfo& info,
                           std::vector<std::string> args,
                           ParsedArguments& result) {
  StringRef command = info.name;
  result.sourceRoot = context.getConfig().sourceRoot;

  while (!args.empty() && args[0].size() > 1 && args[0][0] == '-') {
    const std::string option = args[0];
    args.erase(args.begin());

    if (option == "--")
      break;

    if (option == "--help") {
      result.showHelp = true;
      return true;
    }

    StringRef hintName = llvm::StringSwitch<StringRef>(option)
      .Cases("-r", "-R", "--runner", "runner")
      .Cases("-c", "-C", "--client", "client")
      .Cases("-d", "-D", "--dep", "dep")
      .Case("--dependency", "dependency")
      .Default("");
    auto hint = parseNameHint(hintName);
    if (hint && info.acceptsNameHint) {
      result.hint = *hint;
    } else if (option == "--source-root" && command == "artifacts") {
      if (args.empty()) {
        util::emitError(context.errs, "missing argument to '--source-root'");
        return false;
      }
      result.sourceRoot = args[0];
      args.erase(args.begin());
    } else if (option == "--kind" && command == "list") {
      if (args.empty()) {
        util::emitError(context.errs, "missing argument to '--kind'");
        return false;
      }
      result.kindFilter = kindForString(args[0]);
      if (!result.kindFilter) {
        util::emitError(context.errs,
                        Twine("invalid component kind: '") + args[0] + "'");
        return false;
      }
      args.erase(args.begin());
    } else {
      util::emitError(context.errs, Twine("invalid option: '") +
                      util::escapedString(option) + "'");
      return false;
    }
  }

  if (args.size() < info.minPositional || args.size() > info.maxPositional) {
    util::emitError(context.errs, "invalid number of arguments");
    return false;
  }

  result.positional = std::move(args);
  return true;
}

#pragma mark - Graph Queries

static int executeAllDepsCommand(CommandContext& context,
                                 const ParsedArguments& args) {
  std::string id = context.canonicalize(args, args.positional[0]);
  auto result = context.resolver.allDeps(id);
  if (!result)
    return context.fail(result.takeError());

  context.note(Twine("'") + id + "' requires " + Twine(result->size() - 1) +
               " components");
  context.printList(*result);
  return ExitSuccess;
}

static int executeAllDependentsCommand(CommandContext& context,
                                       const ParsedArguments& args) {
  std::string id = context.canonicalize(args, args.positional[0]);
  auto result = context.resolver.allDependents(id);
  if (!result)
    return context.fail(result.takeError());

  context.note(Twine("'") + id + "' has " + Twine(result->size()) +
               " dependents");
  context.printList(*result);
  return ExitSuccess;
}

static int executeDepsCommand(CommandContext& context,
                              const ParsedArguments& args) {
  std::string id = context.canonicalize(args, args.positional[0]);
  auto result = context.resolver.directDeps(id);
  if (!result)
    return context.fail(result.takeError());

  context.printList(*result);
  return ExitSuccess;
}

static int executeDependentsCommand(CommandContext& context,
                                    const ParsedArguments& args) {
  std::string id = context.canonicalize(args, args.positional[0]);
  auto result = context.resolver.directDependents(id);
  if (!result)
    return context.fail(result.takeError());

  context.printList(*result);
  return ExitSuccess;
}

#pragma mark - Artifact Queries

/// Pick the install root from the arguments, falling back to the
/// configuration.
static bool getInstallRoot(CommandContext& context,
                           const ParsedArguments& args,
                           std::string& installRoot) {
  if (args.positional.size() > 1) {
    installRoot = args.positional[1];
  } else {
    installRoot = context.getConfig().installRoot;
  }

  if (installRoot.empty()) {
    util::emitError(context.errs,
                    "missing install root (pass one, or set "
                    "CRTDEPS_INSTALL_DIR)");
    return false;
  }
  return true;
}

static int executeIsBuiltCommand(CommandContext& context,
                                 const ParsedArguments& args) {
  std::string installRoot;
  if (!getInstallRoot(context, args, installRoot))
    return ExitUsage;

  std::string id = context.canonicalize(args, args.positional[0]);
  auto component = context.registry.lookup(id);
  if (!component)
    return context.fail(component.takeError());

  if (!ArtifactProber::isAuthoritative(component->kind)) {
    context.note(Twine("'") + id + "' is a " +
                 stringForKind(component->kind) +
                 ", its toolchain decides whether to rebuild");
  }

  ArtifactProber prober(context.registry, *context.fileSystem, &context);
  bool built = prober.isBuilt(id, installRoot);
  context.note(Twine("'") + id + "' is " + (built ? "built" : "not built") +
               " in '" + installRoot + "'");
  return built ? ExitSuccess : ExitFailure;
}

static int executeArtifactsCommand(CommandContext& context,
                                   const ParsedArguments& args) {
  ArtifactLayout layout;
  if (!getInstallRoot(context, args, layout.installRoot))
    return ExitUsage;
  layout.sourceRoot = args.sourceRoot;

  std::string id = context.canonicalize(args, args.positional[0]);
  auto component = context.registry.lookup(id);
  if (!component)
    return context.fail(component.takeError());

  ArtifactProber prober(context.registry, *context.fileSystem, &context);
  for (const auto& artifact : prober.getArtifactPaths(*component, layout)) {
    context.note(Twine(stringForArtifactKind(artifact.kind)) + ": " +
                 artifact.path);
    context.os << artifact.path << "\n";
  }
  return ExitSuccess;
}

#pragma mark - Registry Queries

static int executeBuildTargetCommand(CommandContext& context,
                                     const ParsedArguments& args) {
  std::string id = context.canonicalize(args, args.positional[0]);
  auto component = context.registry.lookup(id);
  if (!component)
    return context.fail(component.takeError());

  StringRef flag;
  switch (component->kind) {
  case ComponentKind::NativeDependency:
    flag = "--dep";
    break;
  case ComponentKind::NativeClient:
  case ComponentKind::ManagedClient:
    flag = "--client";
    break;
  case ComponentKind::Runner:
    flag = "--runner";
    break;
  }

  context.os << flag << " " << component->getBuildName() << "\n";
  return ExitSuccess;
}

static int executeListCommand(CommandContext& context,
                              const ParsedArguments& args) {
  for (const auto& component : context.registry.getComponents()) {
    if (args.kindFilter && component.kind != *args.kindFilter)
      continue;
    context.os << component.id << "\n";
  }
  return ExitSuccess;
}

}

#pragma mark - Resolver Top-Level Command

static void usage(raw_ostream& errs) {
  int commandWidth = 16;
  errs << "Usage: " << (getProgramName() ? getProgramName() : "resolver")
       << " [--version] [--help] [--verbose] <command> [<args>]\n";
  errs << "\n";
  errs << "Available commands:\n";
  for (const auto& info : subcommands) {
    errs << "  " << llvm::left_justify(info.name, commandWidth) << "-- "
         << info.description << "\n";
  }
  errs << "\n";
}

int commands::executeResolverCommand(const std::vector<std::string>& args,
                                     const ResolverConfig& config,
                                     raw_ostream& os, raw_ostream& errs) {
  ResolverConfig effectiveConfig = config;

  auto it = args.begin(), ie = args.end();
  for (; it != ie && StringRef(*it).startswith("-"); ++it) {
    if (*it == "--help") {
      usage(errs);
      return ExitSuccess;
    } else if (*it == "--version") {
      os << getCrtDepsFullVersion() << "\n";
      return ExitSuccess;
    } else if (*it == "--verbose") {
      effectiveConfig.verbose = true;
    } else {
      util::emitError(errs, Twine("invalid option: '") +
                      util::escapedString(*it) + "'");
      usage(errs);
      return ExitUsage;
    }
  }

  if (it == ie) {
    usage(errs);
    return ExitUsage;
  }

  // Expect the next argument to be the name of a subcommand.
  const std::string& command = *it;
  const SubcommandInfo* info = findSubcommand(command);
  if (!info) {
    util::emitError(errs, Twine("unknown command '") +
                    util::escapedString(command) + "'");
    usage(errs);
    return ExitUsage;
  }

  CommandContext context(effectiveConfig, os, errs);
  ParsedArguments parsed;
  if (!parseArguments(context, *info, {it + 1, ie}, parsed)) {
    subcommandUsage(errs, *info);
    return ExitUsage;
  }
  if (parsed.showHelp) {
    subcommandUsage(errs, *info);
    return ExitSuccess;
  }

  StringRef name = info->name;
  if (name == "all-deps")
    return executeAllDepsCommand(context, parsed);
  if (name == "all-dependents")
    return executeAllDependentsCommand(context, parsed);
  if (name == "is-built")
    return executeIsBuiltCommand(context, parsed);
  if (name == "deps")
    return executeDepsCommand(context, parsed);
  if (name == "dependents")
    return executeDependentsCommand(context, parsed);
  if (name == "artifacts")
    return executeArtifactsCommand(context, parsed);
  if (name == "build-target")
    return executeBuildTargetCommand(context, parsed);
  assert(name == "list" && "unhandled subcommand");
  return executeListCommand(context, parsed);
}
