#pragma once

#include "compiler/expression.hpp"
#include "runtime/context.hpp"

#include <string>
#include <vector>

namespace l20n {

/**
 * Macro - A compiled parameterized expression
 *
 * Each call binds the arguments positionally into fresh locals; the caller's
 * locals are never visible to the body. Missing arguments bind to Undefined.
 */
class Macro {
public:
  explicit Macro(const Json &node);

  Macro(const Macro &) = delete;
  Macro &operator=(const Macro &) = delete;

  const std::string &id() const { return idData; }
  const std::vector<std::string> &parameters() const { return parametersData; }

  Value call(const std::vector<Value> &arguments,
             Resolution &resolution) const;

  Value call(const std::vector<Value> &arguments, const Context &context,
             const Scope &data) const;

private:
  std::string idData;
  std::vector<std::string> parametersData;
  ExpressionPtr body;
};

} // namespace l20n
