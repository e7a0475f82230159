#pragma once

#include "runtime/context.hpp"
#include "runtime/index.hpp"
#include "runtime/value.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace l20n {

class Entity;
class Expression;

/**
 * Locals - Bindings of one invocation
 *
 * `self` is the entity bound to `this`, `resolve` selects between forcing
 * selectors to a final value and yielding the selected branch.
 */
struct Locals {
  const Entity *self = nullptr;
  bool resolve = false;
  std::unordered_map<std::string, Value> bindings;

  Locals() = default;
  Locals(const Entity *self, bool resolve) : self(self), resolve(resolve) {}

  // Bound value, nullptr when the name has no binding
  const Value *find(const std::string &name) const;
};

using LocalsPtr = std::shared_ptr<const Locals>;

/**
 * Resolution - State of one public call (get, getAttribute, macro call)
 *
 * Carries the caller's context and data together with the set of
 * interpolated strings currently being evaluated. A new Resolution is made
 * for every call, so compiled entries hold no mutable state.
 */
class Resolution {
public:
  Resolution(const Context &context, const Scope &data);

  Resolution(const Resolution &) = delete;
  Resolution &operator=(const Resolution &) = delete;

  const Context &context() const { return contextRef; }
  const Scope &data() const { return dataRef; }

  /**
   * Drive a value to a plain string
   * Resolves entity and attribute references, invokes thunks with `index`
   * (one key consumed per step) and formats numbers and booleans.
   */
  std::string toText(Value value, Index index = {});

  // Marks an interpolated string as in progress for the guard's lifetime
  class Guard {
  public:
    Guard(Resolution &resolution, const Expression *node);
    ~Guard();

    Guard(const Guard &) = delete;
    Guard &operator=(const Guard &) = delete;

  private:
    Resolution &resolution;
    const Expression *node;
  };

  // Counts one level of nested entity, attribute or macro resolution
  class Frame {
  public:
    Frame(Resolution &resolution, const std::string &what);
    ~Frame();

    Frame(const Frame &) = delete;
    Frame &operator=(const Frame &) = delete;

  private:
    Resolution &resolution;
  };

private:
  const Context &contextRef;
  const Scope &dataRef;
  std::unordered_set<const Expression *> activeNodes;
  int depth = 0;
};

} // namespace l20n
