#include "compiler/resource.hpp"

namespace l20n {

void Resource::insert(const std::string &id, Entry entry) {
  auto it = entriesData.find(id);
  if (it != entriesData.end()) {
    it->second = std::move(entry);
    return;
  }
  idsData.push_back(id);
  entriesData.emplace(id, std::move(entry));
}

bool Resource::contains(const std::string &id) const {
  return entriesData.count(id) > 0;
}

const Entity *Resource::entity(const std::string &id) const {
  auto it = entriesData.find(id);
  if (it == entriesData.end())
    return nullptr;
  if (auto *entity = std::get_if<std::unique_ptr<Entity>>(&it->second))
    return entity->get();
  return nullptr;
}

const Macro *Resource::macro(const std::string &id) const {
  auto it = entriesData.find(id);
  if (it == entriesData.end())
    return nullptr;
  if (auto *macro = std::get_if<std::unique_ptr<Macro>>(&it->second))
    return macro->get();
  return nullptr;
}

Value Resource::lookup(const std::string &id) const {
  if (const Entity *found = entity(id))
    return found;
  if (const Macro *found = macro(id))
    return found;
  return Undefined{};
}

} // namespace l20n
