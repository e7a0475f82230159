#include "compiler/entity.hpp"
#include "runtime/errors.hpp"

#include <algorithm>

namespace l20n {

void to_json(nlohmann::json &j, const EntitySnapshot &snapshot) {
  j = nlohmann::json{{"attributes", snapshot.attributes}};
  if (snapshot.value) {
    j["value"] = *snapshot.value;
  } else {
    j["value"] = nullptr;
  }
}

Entity::Entity(const Json &node) : idData(idOf(node)), local(flag(node, "local")) {
  if (node.contains("value") && !node["value"].is_null()) {
    value = compileExpression(node["value"]);
  }

  if (node.contains("index") && !node["index"].is_null()) {
    std::vector<IndexKey> keys;
    for (const Json &key : requireArray(node, "index")) {
      indexExpressions.push_back(compileExpression(key));
      keys.emplace_back(static_cast<const Expression *>(indexExpressions.back().get()));
    }
    indexData = Index(std::move(keys));
  }

  if (node.contains("attrs") && !node["attrs"].is_null()) {
    for (const Json &attributeNode : requireArray(node, "attrs")) {
      Attribute attribute(attributeNode);
      auto existing = std::find_if(
          attributesData.begin(), attributesData.end(),
          [&](const Attribute &other) { return other.id() == attribute.id(); });
      if (existing != attributesData.end()) {
        *existing = std::move(attribute);
      } else {
        attributesData.push_back(std::move(attribute));
      }
    }
  }
}

const Attribute *Entity::attribute(const std::string &name) const {
  for (const auto &attribute : attributesData) {
    if (attribute.id() == name)
      return &attribute;
  }
  return nullptr;
}

Value Entity::evaluate(Resolution &resolution, Index index,
                       bool resolveMode) const {
  Resolution::Frame frame(resolution, "entity '" + idData + "'");
  if (!value)
    return Undefined{};
  auto locals = std::make_shared<Locals>(this, resolveMode);
  return value->evaluate(locals, resolution, std::move(index));
}

Value Entity::yield(Resolution &resolution, Index index) const {
  return evaluate(resolution, std::move(index), false);
}

Value Entity::resolve(Resolution &resolution,
                      std::optional<Index> index) const {
  return evaluate(resolution, index ? *index : indexData, true);
}

std::string Entity::resolveAttribute(const std::string &name,
                                     Resolution &resolution) const {
  const Attribute *found = attribute(name);
  if (!found)
    throw AttributeNotFoundError(idData, name);
  return found->get(*this, resolution);
}

std::string Entity::get(const Context &context, const Scope &data,
                        std::optional<Index> index) const {
  if (!value)
    throw TypeMismatchError("entity '" + idData + "' has no value");
  Resolution resolution(context, data);
  return resolution.toText(resolve(resolution, std::move(index)));
}

std::string Entity::getAttribute(const std::string &name,
                                 const Context &context,
                                 const Scope &data) const {
  Resolution resolution(context, data);
  return resolveAttribute(name, resolution);
}

std::map<std::string, std::string>
Entity::getAttributes(const Context &context, const Scope &data) const {
  std::map<std::string, std::string> result;
  for (const auto &attribute : attributesData) {
    Resolution resolution(context, data);
    result[attribute.id()] = attribute.get(*this, resolution);
  }
  return result;
}

EntitySnapshot Entity::getEntity(const Context &context,
                                 const Scope &data) const {
  EntitySnapshot snapshot;
  if (hasValue())
    snapshot.value = get(context, data);
  snapshot.attributes = getAttributes(context, data);
  return snapshot;
}

} // namespace l20n
