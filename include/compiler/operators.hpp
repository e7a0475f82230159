#pragma once

#include "runtime/value.hpp"

#include <string>

namespace l20n {

using UnaryOperator = Value (*)(const Value &operand);
using BinaryOperator = Value (*)(const Value &left, const Value &right);

/**
 * Operator tables
 * Tokens: unary - + !, binary == != < <= > >= + - * / %, logical && ||
 * @throws MalformedNodeError for unknown tokens
 */
UnaryOperator unaryOperator(const std::string &token);
BinaryOperator binaryOperator(const std::string &token);
BinaryOperator logicalOperator(const std::string &token);

} // namespace l20n
