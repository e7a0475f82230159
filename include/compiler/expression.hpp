#pragma once

#include "ast/syntaxNode.hpp"
#include "runtime/index.hpp"
#include "runtime/resolution.hpp"
#include "runtime/value.hpp"

#include <memory>

namespace l20n {

/**
 * Expression - A compiled evaluator for one syntax node
 *
 * Compiled once, evaluated any number of times. Evaluation reads the
 * invocation's locals and the per-call resolution state and never mutates
 * the expression.
 */
class Expression {
public:
  virtual ~Expression() = default;

  virtual Value evaluate(const LocalsPtr &locals, Resolution &resolution,
                         Index index) const = 0;
};

using ExpressionPtr = std::unique_ptr<Expression>;

/**
 * Compile a syntax node into an evaluator
 * Children are compiled once and owned by the returned expression.
 * @throws MalformedNodeError for unknown kinds, definition kinds and
 * malformed fields
 */
ExpressionPtr compileExpression(const Json &node);

} // namespace l20n
