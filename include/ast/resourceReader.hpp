#pragma once

#include "ast/syntaxNode.hpp"

#include <string>

namespace l20n {

// Parse a JSON resource from memory
Json parseResource(const std::string &text);

// Read and parse a JSON resource from disk
Json readResourceFile(const std::string &path);

/**
 * Get the flat definition list of a resource
 * Accepts either a bare array or a parser document {"type": "L20n", "body": [...]}
 */
const Json &definitionsOf(const Json &document);

} // namespace l20n
