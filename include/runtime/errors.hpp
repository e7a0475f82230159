#pragma once

#include <stdexcept>
#include <string>

namespace l20n {

class Error : public std::runtime_error {
public:
  explicit Error(const std::string &message) : std::runtime_error(message) {}
};

// Unrecognized node kind or a node with missing/mistyped fields
class MalformedNodeError : public Error {
public:
  explicit MalformedNodeError(const std::string &message)
      : Error("Malformed node: " + message) {}
};

// An interpolated string was re-entered while it was being evaluated
class CyclicReferenceError : public Error {
public:
  explicit CyclicReferenceError(const std::string &message)
      : Error("Cyclic reference: " + message) {}
};

class AttributeNotFoundError : public Error {
public:
  AttributeNotFoundError(const std::string &entityId,
                         const std::string &attributeId)
      : Error("Attribute not found: " + entityId + "::" + attributeId),
        entity(entityId), attribute(attributeId) {}

  std::string entity;
  std::string attribute;
};

class TypeMismatchError : public Error {
public:
  explicit TypeMismatchError(const std::string &message)
      : Error("Type mismatch: " + message) {}
};

// Step count or call depth of a single resolution exceeded its limit
class ResolutionLimitError : public Error {
public:
  explicit ResolutionLimitError(const std::string &message)
      : Error("Resolution limit exceeded: " + message) {}
};

} // namespace l20n
