#pragma once

#include <memory>
#include <string>
#include <variant>

namespace l20n {

class Attribute;
class Entity;
class Expression;
class Macro;
struct Locals;

// Result of looking up a name that is not bound anywhere
struct Undefined {
  bool operator==(const Undefined &) const { return true; }
  bool operator!=(const Undefined &) const { return false; }
};

// Attributes carry no link to their owner, so references pair the two
struct AttributeRef {
  const Entity *owner = nullptr;
  const Attribute *attribute = nullptr;

  bool operator==(const AttributeRef &other) const {
    return owner == other.owner && attribute == other.attribute;
  }
  bool operator!=(const AttributeRef &other) const { return !(*this == other); }
};

/**
 * Thunk - A selector branch that was picked but not evaluated
 *
 * Holds the locals it was selected under so that driving it later sees the
 * same `this` and macro bindings.
 */
struct Thunk {
  const Expression *expression = nullptr;
  std::shared_ptr<const Locals> locals;

  bool operator==(const Thunk &other) const {
    return expression == other.expression && locals == other.locals;
  }
  bool operator!=(const Thunk &other) const { return !(*this == other); }
};

using Value = std::variant<Undefined,         // missing name
                           std::string,       // string
                           double,            // number
                           bool,              // boolean
                           const Entity *,    // entity reference
                           AttributeRef,      // attribute reference
                           const Macro *,     // macro reference
                           Thunk              // unresolved branch
                           >;

bool isUndefined(const Value &value);
// Undefined, string, number or boolean
bool isPrimitive(const Value &value);
bool isTruthy(const Value &value);
bool valuesEqual(const Value &left, const Value &right);

// Name of the held alternative, used in error messages
std::string typeName(const Value &value);

// Format a number the way it appears in localized text: 3, 2.5, 1e-7, NaN, Infinity
std::string formatNumber(double number);

} // namespace l20n
