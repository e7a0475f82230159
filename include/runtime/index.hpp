#pragma once

#include "runtime/value.hpp"

#include <initializer_list>
#include <memory>
#include <variant>
#include <vector>

namespace l20n {

class Expression;

// A selector key, either a ready value or an evaluator run at selection time
using IndexKey = std::variant<Value, const Expression *>;

/**
 * Index - Selector cursor
 *
 * An immutable key sequence plus a position. Every nested selector consumes
 * one key; consuming returns a new cursor and leaves this one untouched.
 */
class Index {
public:
  Index() = default;
  explicit Index(std::vector<IndexKey> keys);
  Index(std::initializer_list<Value> keys);
  // Numeric keys, so that Index{1} needs no Value wrapper
  Index(std::initializer_list<double> keys);

  bool empty() const;
  size_t size() const;

  // Current key, nullptr once every key was consumed
  const IndexKey *head() const;
  Index rest() const;

private:
  std::shared_ptr<const std::vector<IndexKey>> keysData;
  size_t position = 0;
};

} // namespace l20n
