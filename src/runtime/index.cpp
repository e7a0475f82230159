#include "runtime/index.hpp"

namespace l20n {

Index::Index(std::vector<IndexKey> keys)
    : keysData(std::make_shared<const std::vector<IndexKey>>(std::move(keys))) {}

Index::Index(std::initializer_list<Value> keys) {
  std::vector<IndexKey> converted;
  converted.reserve(keys.size());
  for (const Value &key : keys) {
    converted.emplace_back(key);
  }
  keysData = std::make_shared<const std::vector<IndexKey>>(std::move(converted));
}

Index::Index(std::initializer_list<double> keys) {
  std::vector<IndexKey> converted;
  converted.reserve(keys.size());
  for (double key : keys) {
    converted.emplace_back(Value(key));
  }
  keysData = std::make_shared<const std::vector<IndexKey>>(std::move(converted));
}

bool Index::empty() const { return size() == 0; }

size_t Index::size() const {
  if (!keysData || position >= keysData->size())
    return 0;
  return keysData->size() - position;
}

const IndexKey *Index::head() const {
  if (empty())
    return nullptr;
  return &(*keysData)[position];
}

Index Index::rest() const {
  Index next = *this;
  if (!empty())
    next.position++;
  return next;
}

} // namespace l20n
