#pragma once

#include "compiler/attribute.hpp"
#include "compiler/expression.hpp"
#include "runtime/context.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace l20n {

// Resolved entity handed to consumers
struct EntitySnapshot {
  std::optional<std::string> value;
  std::map<std::string, std::string> attributes;
};

void to_json(nlohmann::json &j, const EntitySnapshot &snapshot);

/**
 * Entity - A compiled localizable message
 *
 * Owns its value expression, the expressions of its default index and its
 * attributes. Immutable after construction; every public call builds its
 * own Resolution from the supplied context and caller data.
 */
class Entity {
public:
  explicit Entity(const Json &node);

  Entity(const Entity &) = delete;
  Entity &operator=(const Entity &) = delete;

  const std::string &id() const { return idData; }
  bool isLocal() const { return local; }
  bool hasValue() const { return value != nullptr; }
  const Index &defaultIndex() const { return indexData; }
  const std::vector<Attribute> &attributes() const { return attributesData; }

  // Attribute declared as `name`, nullptr when absent
  const Attribute *attribute(const std::string &name) const;

  /**
   * Resolve the entity value to a string
   * @param index Selector keys, the entity's default index when omitted
   */
  std::string get(const Context &context, const Scope &data,
                  std::optional<Index> index = std::nullopt) const;

  /**
   * Resolve one attribute to a string
   * @throws AttributeNotFoundError when no attribute `name` is declared
   */
  std::string getAttribute(const std::string &name, const Context &context,
                           const Scope &data) const;

  std::map<std::string, std::string> getAttributes(const Context &context,
                                                   const Scope &data) const;

  EntitySnapshot getEntity(const Context &context, const Scope &data) const;

  // Next unresolved step, used by member access chains
  Value yield(Resolution &resolution, Index index) const;

  // Value with selectors forced, references may remain
  Value resolve(Resolution &resolution,
                std::optional<Index> index = std::nullopt) const;

  // Resolve attribute `name` with a fresh `this` binding
  std::string resolveAttribute(const std::string &name,
                               Resolution &resolution) const;

private:
  Value evaluate(Resolution &resolution, Index index, bool resolveMode) const;

  std::string idData;
  bool local = false;
  ExpressionPtr value;
  std::vector<ExpressionPtr> indexExpressions;
  Index indexData;
  std::vector<Attribute> attributesData;
};

} // namespace l20n
