#include "ast/syntaxNode.hpp"
#include "runtime/errors.hpp"

namespace l20n {

static std::string describe(const Json &node) {
  if (node.is_object() && node.contains("type") && node["type"].is_string())
    return node["type"].get<std::string>() + " node";
  return "node";
}

NodeKind kindOf(const Json &node) {
  if (!node.is_object())
    throw MalformedNodeError("expected an object, got " +
                             std::string(node.type_name()));
  std::string tag = requireString(node, "type");
  auto kind = nodeKindFromString(tag);
  if (!kind)
    throw MalformedNodeError("unknown node type '" + tag + "'");
  return *kind;
}

const Json &requireField(const Json &node, const std::string &field) {
  if (!node.is_object() || !node.contains(field) || node[field].is_null())
    throw MalformedNodeError(describe(node) + " is missing '" + field + "'");
  return node[field];
}

std::string requireString(const Json &node, const std::string &field) {
  const Json &value = requireField(node, field);
  if (!value.is_string())
    throw MalformedNodeError(describe(node) + " field '" + field +
                             "' must be a string");
  return value.get<std::string>();
}

const Json &requireArray(const Json &node, const std::string &field) {
  const Json &value = requireField(node, field);
  if (!value.is_array())
    throw MalformedNodeError(describe(node) + " field '" + field +
                             "' must be an array");
  return value;
}

bool flag(const Json &node, const std::string &field) {
  if (!node.is_object() || !node.contains(field))
    return false;
  const Json &value = node[field];
  return value.is_boolean() && value.get<bool>();
}

std::string idOf(const Json &node) {
  const Json &id = requireField(node, "id");
  if (id.is_string())
    return id.get<std::string>();
  if (id.is_object())
    return requireString(id, "name");
  throw MalformedNodeError(describe(node) +
                           " id must be a string or an identifier");
}

} // namespace l20n
