#pragma once

#include "compiler/entity.hpp"
#include "compiler/macro.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace l20n {

/**
 * Resource - Compiled entries of one parsed resource, by id
 *
 * Ids keep the order in which they were first defined. Inserting an id that
 * already exists replaces the entry in place.
 */
class Resource {
public:
  using Entry = std::variant<std::unique_ptr<Entity>, std::unique_ptr<Macro>>;

  Resource() = default;
  Resource(Resource &&other) noexcept = default;
  Resource &operator=(Resource &&other) noexcept = default;

  Resource(const Resource &) = delete;
  Resource &operator=(const Resource &) = delete;

  void insert(const std::string &id, Entry entry);
  bool contains(const std::string &id) const;

  // Entity with this id, nullptr when absent or a macro
  const Entity *entity(const std::string &id) const;

  // Macro with this id, nullptr when absent or an entity
  const Macro *macro(const std::string &id) const;

  // Entity or macro reference, Undefined when absent
  Value lookup(const std::string &id) const;

  const std::vector<std::string> &ids() const { return idsData; }
  size_t size() const { return idsData.size(); }
  bool empty() const { return idsData.empty(); }

private:
  std::vector<std::string> idsData;
  std::unordered_map<std::string, Entry> entriesData;
};

} // namespace l20n
