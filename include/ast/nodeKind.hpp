#pragma once

#include <optional>
#include <string>

namespace l20n {

/**
 * Node kind enumeration
 * Corresponds to the "type" tags written by the resource parser.
 */
enum class NodeKind {
  // Primary expressions
  Identifier,    // entity or macro name
  This,          // ~
  Variable,      // $name
  Global,        // @name
  Number,        // 42
  String,        // "text"
  Array,         // [ "one", "many" ]
  Hash,          // { one: "...", *other: "..." }
  ComplexString, // "Hello, {{ $name }}"
  KeyValuePair,  // one: "..."

  // Logical expressions
  UnaryExpression,
  BinaryExpression,
  LogicalExpression,
  ConditionalExpression,

  // Member expressions
  CallExpression,
  PropertyExpression,
  AttributeExpression,

  // Definitions
  Entity,
  Attribute,
  Macro
};

std::optional<NodeKind> nodeKindFromString(const std::string &tag);
std::string nodeKindToString(NodeKind kind);

} // namespace l20n
