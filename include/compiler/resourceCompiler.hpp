#pragma once

#include "ast/syntaxNode.hpp"
#include "compiler/compilerOptions.hpp"
#include "compiler/diagnostic.hpp"
#include "compiler/resource.hpp"
#include "runtime/errors.hpp"

#include <optional>
#include <string>
#include <vector>

namespace l20n {

/**
 * ResourceCompiler - Entry point turning definitions into a Resource
 *
 * Walks the flat definition list once: entity definitions become Entities,
 * macro definitions become Macros, other kinds are skipped. A malformed
 * definition is dropped and reported; the rest still compile.
 */
class ResourceCompiler {
public:
  explicit ResourceCompiler(CompilerOptions options = {});

  /**
   * Compile `definitions` into `resource`
   * @param definitions Definition array or a parser document with a body
   * @return true if no error diagnostics were produced
   */
  bool compile(const Json &definitions, Resource &resource);

  /**
   * Get the diagnostics of the last compile
   */
  const std::vector<Diagnostic> &diagnostics() const { return diagnosticsData; }

  bool hasErrors() const;
  // First malformed definition of the last compile, if any
  const std::optional<MalformedNodeError> &malformedNode() const {
    return firstMalformed;
  }

  void printDiagnostics() const;

private:
  void compileDefinition(const Json &node, int position, Resource &resource);
  void insert(const std::string &id, Resource::Entry entry, int position,
              Resource &resource);
  void log(const std::string &message) const;

  CompilerOptions options;
  std::vector<Diagnostic> diagnosticsData;
  std::optional<MalformedNodeError> firstMalformed;
};

// Compile with default options
// @throws MalformedNodeError for the first malformed definition
Resource compile(const Json &definitions);

} // namespace l20n
