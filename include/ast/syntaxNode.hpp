#pragma once

#include "ast/nodeKind.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace l20n {

using Json = nlohmann::json;

/**
 * Syntax nodes are the JSON objects produced by the resource parser.
 * The compiler only reads them; these helpers check the shape of a node and
 * throw MalformedNodeError when a field is missing or has the wrong type.
 */
NodeKind kindOf(const Json &node);

const Json &requireField(const Json &node, const std::string &field);
std::string requireString(const Json &node, const std::string &field);
const Json &requireArray(const Json &node, const std::string &field);

// Optional boolean flag ("default", "local", "computed"), false when absent
bool flag(const Json &node, const std::string &field);

// Ids are written either as plain strings or as identifier nodes
std::string idOf(const Json &node);

} // namespace l20n
