#include "compiler/resourceCompiler.hpp"
#include "ast/resourceReader.hpp"
#include "runtime/errors.hpp"

#include <iostream>

namespace l20n {

ResourceCompiler::ResourceCompiler(CompilerOptions options)
    : options(options) {}

bool ResourceCompiler::compile(const Json &definitions, Resource &resource) {
  diagnosticsData.clear();
  firstMalformed.reset();

  const Json *list = nullptr;
  try {
    list = &definitionsOf(definitions);
  } catch (const MalformedNodeError &e) {
    diagnosticsData.emplace_back(e.what());
    firstMalformed.emplace(e);
    return false;
  }

  log("Compiling " + std::to_string(list->size()) + " definitions");
  for (size_t position = 0; position < list->size(); position++) {
    compileDefinition((*list)[position], static_cast<int>(position), resource);
  }
  log("Compiled " + std::to_string(resource.size()) + " entries");

  return !hasErrors();
}

void ResourceCompiler::compileDefinition(const Json &node, int position,
                                         Resource &resource) {
  std::string id;
  try {
    std::optional<NodeKind> kind;
    if (node.is_object() && node.contains("type") && node["type"].is_string())
      kind = nodeKindFromString(node["type"].get<std::string>());

    if (kind == NodeKind::Entity) {
      id = idOf(node);
      insert(id, std::make_unique<Entity>(node), position, resource);
    } else if (kind == NodeKind::Macro) {
      id = idOf(node);
      insert(id, std::make_unique<Macro>(node), position, resource);
    } else {
      std::string tag = node.is_object() && node.contains("type")
                            ? node["type"].dump()
                            : std::string(node.type_name());
      log("Skipping definition " + std::to_string(position) + " of kind " + tag);
      diagnosticsData.emplace_back("skipped top-level " + tag, "", position,
                                   DiagnosticSeverity::Information);
    }
  } catch (const MalformedNodeError &e) {
    log("Dropping definition " + std::to_string(position) + ": " + e.what());
    diagnosticsData.emplace_back(e.what(), id, position);
    if (!firstMalformed)
      firstMalformed.emplace(e);
  }
}

void ResourceCompiler::insert(const std::string &id, Resource::Entry entry,
                              int position, Resource &resource) {
  if (resource.contains(id)) {
    if (options.rejectDuplicateIds) {
      diagnosticsData.emplace_back("duplicate id '" + id + "'", id, position);
      return;
    }
    log("Redefinition of " + id + " replaces the earlier entry");
    diagnosticsData.emplace_back("'" + id + "' redefined, the later definition wins",
                                 id, position, DiagnosticSeverity::Warning);
  } else {
    log("Compiled " + id);
  }
  resource.insert(id, std::move(entry));
}

bool ResourceCompiler::hasErrors() const {
  for (const auto &diagnostic : diagnosticsData) {
    if (diagnostic.isError())
      return true;
  }
  return false;
}

void ResourceCompiler::printDiagnostics() const {
  for (const auto &diagnostic : diagnosticsData) {
    std::cerr << diagnostic.toString() << "\n";
  }
}

void ResourceCompiler::log(const std::string &message) const {
  if (options.debug) {
    std::cerr << "[l20n] " << message << std::endl;
  }
}

Resource compile(const Json &definitions) {
  Resource resource;
  ResourceCompiler compiler;
  if (!compiler.compile(definitions, resource)) {
    if (compiler.malformedNode())
      throw *compiler.malformedNode();
    for (const auto &diagnostic : compiler.diagnostics()) {
      if (diagnostic.isError())
        throw Error(diagnostic.toString());
    }
  }
  return resource;
}

} // namespace l20n
