#include "runtime/resolution.hpp"
#include "compiler/attribute.hpp"
#include "compiler/entity.hpp"
#include "compiler/expression.hpp"
#include "compiler/macro.hpp"
#include "runtime/errors.hpp"

namespace l20n {

const Value *Locals::find(const std::string &name) const {
  auto it = bindings.find(name);
  if (it == bindings.end())
    return nullptr;
  return &it->second;
}

Resolution::Resolution(const Context &context, const Scope &data)
    : contextRef(context), dataRef(data) {}

std::string Resolution::toText(Value value, Index index) {
  for (int step = 0;; step++) {
    if (auto *text = std::get_if<std::string>(&value))
      return *text;
    if (auto *number = std::get_if<double>(&value))
      return formatNumber(*number);
    if (auto *boolean = std::get_if<bool>(&value))
      return *boolean ? "true" : "false";
    if (auto *macro = std::get_if<const Macro *>(&value))
      throw TypeMismatchError("macro '" + (*macro)->id() +
                              "' cannot be used as text");
    if (isUndefined(value))
      throw TypeMismatchError("undefined value cannot be used as text");

    if (step >= contextRef.limits.maxResolutionSteps) {
      throw ResolutionLimitError(
          "value did not resolve to a string within " +
          std::to_string(contextRef.limits.maxResolutionSteps) + " steps");
    }

    if (auto *entity = std::get_if<const Entity *>(&value)) {
      value = (*entity)->resolve(*this);
    } else if (auto *attribute = std::get_if<AttributeRef>(&value)) {
      value = attribute->attribute->resolve(*attribute->owner, *this);
    } else if (auto *thunk = std::get_if<Thunk>(&value)) {
      // copy out, the assignment below destroys the thunk
      Thunk pending = *thunk;
      value = pending.expression->evaluate(pending.locals, *this, index);
      index = index.rest();
    }
  }
}

Resolution::Guard::Guard(Resolution &resolution, const Expression *node)
    : resolution(resolution), node(node) {
  if (!resolution.activeNodes.insert(node).second) {
    throw CyclicReferenceError(
        "string refers back to itself while being resolved");
  }
}

Resolution::Guard::~Guard() { resolution.activeNodes.erase(node); }

Resolution::Frame::Frame(Resolution &resolution, const std::string &what)
    : resolution(resolution) {
  if (resolution.depth >= resolution.contextRef.limits.maxCallDepth) {
    throw ResolutionLimitError("nesting deeper than " +
                               std::to_string(resolution.contextRef.limits.maxCallDepth) +
                               " levels while resolving " + what);
  }
  resolution.depth++;
}

Resolution::Frame::~Frame() { resolution.depth--; }

} // namespace l20n
