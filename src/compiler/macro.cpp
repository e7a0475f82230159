#include "compiler/macro.hpp"

namespace l20n {

Macro::Macro(const Json &node)
    : idData(idOf(node)), body(compileExpression(requireField(node, "expression"))) {
  if (node.contains("args") && !node["args"].is_null()) {
    for (const Json &parameter : requireArray(node, "args")) {
      parametersData.push_back(requireString(parameter, "name"));
    }
  }
}

Value Macro::call(const std::vector<Value> &arguments,
                  Resolution &resolution) const {
  Resolution::Frame frame(resolution, "macro '" + idData + "'");
  auto locals = std::make_shared<Locals>();
  for (size_t parameterIndex = 0; parameterIndex < parametersData.size();
       parameterIndex++) {
    locals->bindings[parametersData[parameterIndex]] =
        parameterIndex < arguments.size() ? arguments[parameterIndex]
                                          : Value(Undefined{});
  }
  return body->evaluate(locals, resolution, Index{});
}

Value Macro::call(const std::vector<Value> &arguments, const Context &context,
                  const Scope &data) const {
  Resolution resolution(context, data);
  return call(arguments, resolution);
}

} // namespace l20n
