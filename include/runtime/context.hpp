#pragma once

#include "runtime/value.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <unordered_map>

namespace l20n {

class Resource;

// Variable bindings by name (caller data, globals)
using Scope = std::unordered_map<std::string, Value>;

/**
 * Build a scope from a JSON object
 * Strings, numbers and booleans map to values, null maps to Undefined.
 */
Scope scopeFromJson(const nlohmann::json &object);

struct ResolutionLimits {
  // Maximum steps of a single drive-to-completion loop (thunks, references).
  int maxResolutionSteps = 256;
  // Maximum nesting of entity, attribute and macro resolutions in one call.
  // Cycles spanning several entities end here instead of on the stack.
  int maxCallDepth = 64;
};

/**
 * Context - Caller-owned, read-only environment of a resolution
 *
 * Supplied on every call and never retained by compiled entries.
 */
struct Context {
  // Entries visible to identifier lookups
  const Resource *resource = nullptr;
  Scope globals;
  ResolutionLimits limits;

  Context() = default;
  explicit Context(const Resource *resource, Scope globals = {})
      : resource(resource), globals(std::move(globals)) {}

  // Entity or macro named `name`, Undefined when absent
  Value lookup(const std::string &name) const;

  // Global variable named `name`, Undefined when absent
  Value global(const std::string &name) const;
};

} // namespace l20n
