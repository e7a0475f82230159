#include "compiler/attribute.hpp"
#include "compiler/entity.hpp"

namespace l20n {

Attribute::Attribute(const Json &node)
    : idData(idOf(node)), local(flag(node, "local")),
      value(compileExpression(requireField(node, "value"))) {}

Value Attribute::yield(const Entity &owner, Resolution &resolution,
                       Index index) const {
  Resolution::Frame frame(resolution, "attribute '" + idData + "'");
  auto locals = std::make_shared<Locals>(&owner, false);
  return value->evaluate(locals, resolution, std::move(index));
}

Value Attribute::resolve(const Entity &owner, Resolution &resolution,
                         std::optional<Index> index) const {
  Resolution::Frame frame(resolution, "attribute '" + idData + "'");
  auto locals = std::make_shared<Locals>(&owner, true);
  return value->evaluate(locals, resolution,
                         index ? *index : owner.defaultIndex());
}

std::string Attribute::get(const Entity &owner, Resolution &resolution,
                           std::optional<Index> index) const {
  return resolution.toText(resolve(owner, resolution, std::move(index)));
}

} // namespace l20n
