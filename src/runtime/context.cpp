#include "runtime/context.hpp"
#include "compiler/resource.hpp"

#include <stdexcept>

namespace l20n {

Scope scopeFromJson(const nlohmann::json &object) {
  if (!object.is_object()) {
    throw std::invalid_argument("scope must be a JSON object, got " +
                                std::string(object.type_name()));
  }
  Scope scope;
  for (auto it = object.begin(); it != object.end(); ++it) {
    const auto &item = it.value();
    if (item.is_string()) {
      scope[it.key()] = item.get<std::string>();
    } else if (item.is_boolean()) {
      scope[it.key()] = item.get<bool>();
    } else if (item.is_number()) {
      scope[it.key()] = item.get<double>();
    } else if (item.is_null()) {
      scope[it.key()] = Undefined{};
    } else {
      throw std::invalid_argument("unsupported value for '" + it.key() +
                                  "': " + item.type_name());
    }
  }
  return scope;
}

Value Context::lookup(const std::string &name) const {
  if (!resource)
    return Undefined{};
  return resource->lookup(name);
}

Value Context::global(const std::string &name) const {
  auto it = globals.find(name);
  if (it == globals.end())
    return Undefined{};
  return it->second;
}

} // namespace l20n
