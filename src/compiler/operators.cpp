#include "compiler/operators.hpp"
#include "runtime/errors.hpp"

#include <cmath>
#include <unordered_map>

namespace l20n {

static double numberOperand(const Value &value, const std::string &token) {
  if (auto *number = std::get_if<double>(&value))
    return *number;
  throw TypeMismatchError("operator " + token + " expects a number, got " +
                          typeName(value));
}

template <typename Compare>
static Value compareValues(const Value &left, const Value &right,
                           const std::string &token, Compare compare) {
  auto *leftNumber = std::get_if<double>(&left);
  auto *rightNumber = std::get_if<double>(&right);
  if (leftNumber && rightNumber)
    return compare(*leftNumber, *rightNumber);
  auto *leftText = std::get_if<std::string>(&left);
  auto *rightText = std::get_if<std::string>(&right);
  if (leftText && rightText)
    return compare(*leftText, *rightText);
  throw TypeMismatchError("cannot compare " + typeName(left) + " " + token +
                          " " + typeName(right));
}

// Unary

static Value negativeOperator(const Value &operand) {
  return -numberOperand(operand, "-");
}

static Value positiveOperator(const Value &operand) {
  return +numberOperand(operand, "+");
}

static Value notOperator(const Value &operand) { return !isTruthy(operand); }

// Binary

static Value equalOperator(const Value &left, const Value &right) {
  return valuesEqual(left, right);
}

static Value notEqualOperator(const Value &left, const Value &right) {
  return !valuesEqual(left, right);
}

static Value lessThanOperator(const Value &left, const Value &right) {
  return compareValues(left, right, "<",
                       [](const auto &a, const auto &b) { return a < b; });
}

static Value lessThanEqualOperator(const Value &left, const Value &right) {
  return compareValues(left, right, "<=",
                       [](const auto &a, const auto &b) { return a <= b; });
}

static Value greaterThanOperator(const Value &left, const Value &right) {
  return compareValues(left, right, ">",
                       [](const auto &a, const auto &b) { return a > b; });
}

static Value greaterThanEqualOperator(const Value &left, const Value &right) {
  return compareValues(left, right, ">=",
                       [](const auto &a, const auto &b) { return a >= b; });
}

static Value addOperator(const Value &left, const Value &right) {
  auto *leftText = std::get_if<std::string>(&left);
  auto *rightText = std::get_if<std::string>(&right);
  if (leftText && rightText)
    return *leftText + *rightText;
  return numberOperand(left, "+") + numberOperand(right, "+");
}

static Value subtractOperator(const Value &left, const Value &right) {
  return numberOperand(left, "-") - numberOperand(right, "-");
}

static Value multiplyOperator(const Value &left, const Value &right) {
  return numberOperand(left, "*") * numberOperand(right, "*");
}

static Value divideOperator(const Value &left, const Value &right) {
  return numberOperand(left, "/") / numberOperand(right, "/");
}

static Value moduloOperator(const Value &left, const Value &right) {
  return std::fmod(numberOperand(left, "%"), numberOperand(right, "%"));
}

// Logical, both operands are already evaluated

static Value andOperator(const Value &left, const Value &right) {
  return isTruthy(left) ? right : left;
}

static Value orOperator(const Value &left, const Value &right) {
  return isTruthy(left) ? left : right;
}

UnaryOperator unaryOperator(const std::string &token) {
  static const std::unordered_map<std::string, UnaryOperator> table = {
      {"-", negativeOperator},
      {"+", positiveOperator},
      {"!", notOperator},
  };
  auto it = table.find(token);
  if (it == table.end())
    throw MalformedNodeError("unknown unary operator '" + token + "'");
  return it->second;
}

BinaryOperator binaryOperator(const std::string &token) {
  static const std::unordered_map<std::string, BinaryOperator> table = {
      {"==", equalOperator},          {"!=", notEqualOperator},
      {"<", lessThanOperator},        {"<=", lessThanEqualOperator},
      {">", greaterThanOperator},     {">=", greaterThanEqualOperator},
      {"+", addOperator},             {"-", subtractOperator},
      {"*", multiplyOperator},        {"/", divideOperator},
      {"%", moduloOperator},
  };
  auto it = table.find(token);
  if (it == table.end())
    throw MalformedNodeError("unknown binary operator '" + token + "'");
  return it->second;
}

BinaryOperator logicalOperator(const std::string &token) {
  static const std::unordered_map<std::string, BinaryOperator> table = {
      {"&&", andOperator},
      {"||", orOperator},
  };
  auto it = table.find(token);
  if (it == table.end())
    throw MalformedNodeError("unknown logical operator '" + token + "'");
  return it->second;
}

} // namespace l20n
