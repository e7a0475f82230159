#include "ast/nodeKind.hpp"

#include <unordered_map>

namespace l20n {

static const std::unordered_map<std::string, NodeKind> nodeKinds = {
    {"identifier", NodeKind::Identifier},
    {"this", NodeKind::This},
    {"variable", NodeKind::Variable},
    {"global", NodeKind::Global},
    {"number", NodeKind::Number},
    {"string", NodeKind::String},
    {"array", NodeKind::Array},
    {"hash", NodeKind::Hash},
    {"complexString", NodeKind::ComplexString},
    {"keyValuePair", NodeKind::KeyValuePair},
    {"unaryExpression", NodeKind::UnaryExpression},
    {"binaryExpression", NodeKind::BinaryExpression},
    {"logicalExpression", NodeKind::LogicalExpression},
    {"conditionalExpression", NodeKind::ConditionalExpression},
    {"callExpression", NodeKind::CallExpression},
    {"propertyExpression", NodeKind::PropertyExpression},
    {"attributeExpression", NodeKind::AttributeExpression},
    {"entity", NodeKind::Entity},
    {"attribute", NodeKind::Attribute},
    {"macro", NodeKind::Macro},
};

std::optional<NodeKind> nodeKindFromString(const std::string &tag) {
  auto it = nodeKinds.find(tag);
  if (it == nodeKinds.end())
    return std::nullopt;
  return it->second;
}

std::string nodeKindToString(NodeKind kind) {
  switch (kind) {
  case NodeKind::Identifier:
    return "identifier";
  case NodeKind::This:
    return "this";
  case NodeKind::Variable:
    return "variable";
  case NodeKind::Global:
    return "global";
  case NodeKind::Number:
    return "number";
  case NodeKind::String:
    return "string";
  case NodeKind::Array:
    return "array";
  case NodeKind::Hash:
    return "hash";
  case NodeKind::ComplexString:
    return "complexString";
  case NodeKind::KeyValuePair:
    return "keyValuePair";
  case NodeKind::UnaryExpression:
    return "unaryExpression";
  case NodeKind::BinaryExpression:
    return "binaryExpression";
  case NodeKind::LogicalExpression:
    return "logicalExpression";
  case NodeKind::ConditionalExpression:
    return "conditionalExpression";
  case NodeKind::CallExpression:
    return "callExpression";
  case NodeKind::PropertyExpression:
    return "propertyExpression";
  case NodeKind::AttributeExpression:
    return "attributeExpression";
  case NodeKind::Entity:
    return "entity";
  case NodeKind::Attribute:
    return "attribute";
  case NodeKind::Macro:
    return "macro";
  }
  return "?";
}

} // namespace l20n
