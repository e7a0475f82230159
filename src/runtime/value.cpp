#include "runtime/value.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace l20n {

bool isUndefined(const Value &value) {
  return std::holds_alternative<Undefined>(value);
}

bool isPrimitive(const Value &value) {
  return std::holds_alternative<Undefined>(value) ||
         std::holds_alternative<std::string>(value) ||
         std::holds_alternative<double>(value) ||
         std::holds_alternative<bool>(value);
}

bool isTruthy(const Value &value) {
  if (std::holds_alternative<Undefined>(value))
    return false;
  if (auto *text = std::get_if<std::string>(&value))
    return !text->empty();
  if (auto *number = std::get_if<double>(&value))
    return *number != 0 && !std::isnan(*number);
  if (auto *boolean = std::get_if<bool>(&value))
    return *boolean;
  return true;
}

bool valuesEqual(const Value &left, const Value &right) {
  // different alternatives never compare equal, NaN is unequal to itself
  return left == right;
}

std::string typeName(const Value &value) {
  switch (value.index()) {
  case 0:
    return "undefined";
  case 1:
    return "string";
  case 2:
    return "number";
  case 3:
    return "boolean";
  case 4:
    return "entity";
  case 5:
    return "attribute";
  case 6:
    return "macro";
  case 7:
    return "unresolved branch";
  }
  return "?";
}

std::string formatNumber(double number) {
  if (std::isnan(number))
    return "NaN";
  if (std::isinf(number))
    return number < 0 ? "-Infinity" : "Infinity";
  if (number == 0)
    return "0";

  double magnitude = std::fabs(number);
  std::ostringstream out;
  // integers are exact in a double up to 2^53
  if (number == std::trunc(number) && magnitude < 9007199254740992.0) {
    out << static_cast<long long>(number);
    return out.str();
  }

  // plain decimal notation between 1e-6 and 1e21, exponent notation outside
  if (magnitude >= 1e-6 && magnitude < 1e21) {
    int exponent = static_cast<int>(std::floor(std::log10(magnitude)));
    out << std::fixed << std::setprecision(std::max(0, 14 - exponent)) << number;
    std::string text = out.str();
    if (text.find('.') != std::string::npos) {
      text.erase(text.find_last_not_of('0') + 1);
      if (text.back() == '.')
        text.pop_back();
    }
    return text;
  }

  out << std::setprecision(15) << number;
  std::string text = out.str();
  // 1e-07 -> 1e-7
  size_t mark = text.find('e');
  if (mark != std::string::npos) {
    size_t digits = mark + 2;
    while (digits + 1 < text.size() && text[digits] == '0')
      text.erase(digits, 1);
  }
  return text;
}

} // namespace l20n
