#include "ast/resourceReader.hpp"
#include "runtime/errors.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace l20n {

Json parseResource(const std::string &text) {
  try {
    return Json::parse(text);
  } catch (const Json::parse_error &e) {
    throw std::runtime_error("Invalid resource JSON: " + std::string(e.what()));
  }
}

Json readResourceFile(const std::string &path) {
  std::ifstream file(path);
  if (!file) {
    throw std::runtime_error("Cannot open file: " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  try {
    return Json::parse(buffer.str());
  } catch (const Json::parse_error &e) {
    throw std::runtime_error(path + ": " + e.what());
  }
}

const Json &definitionsOf(const Json &document) {
  if (document.is_array())
    return document;
  if (document.is_object() && document.contains("body") &&
      document["body"].is_array())
    return document["body"];
  throw MalformedNodeError("resource must be a definition array or a "
                           "document with a 'body' array");
}

} // namespace l20n
