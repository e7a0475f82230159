#pragma once

#include "compiler/expression.hpp"

#include <optional>
#include <string>

namespace l20n {

class Entity;

/**
 * Attribute - A named value owned by an entity
 *
 * The owner is not stored; callers pass it in and it is bound to `this`.
 * Without an explicit index the owner's default index is used.
 */
class Attribute {
public:
  explicit Attribute(const Json &node);

  const std::string &id() const { return idData; }
  bool isLocal() const { return local; }

  // Evaluate with selectors yielding their branch unevaluated
  Value yield(const Entity &owner, Resolution &resolution, Index index) const;

  // Evaluate with selectors forced to their final value
  Value resolve(const Entity &owner, Resolution &resolution,
                std::optional<Index> index = std::nullopt) const;

  std::string get(const Entity &owner, Resolution &resolution,
                  std::optional<Index> index = std::nullopt) const;

private:
  std::string idData;
  bool local = false;
  ExpressionPtr value;
};

} // namespace l20n
