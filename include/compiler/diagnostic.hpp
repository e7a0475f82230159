#pragma once

#include <string>

namespace l20n {

enum class DiagnosticSeverity { Error = 1, Warning = 2, Information = 3, Hint = 4 };

struct Diagnostic {
  std::string message;
  std::string entryId; // id of the definition, empty when unknown
  int position;        // 0-based index in the definition list, -1 for the resource
  DiagnosticSeverity severity;

  Diagnostic(std::string msg, std::string id = "", int pos = -1,
             DiagnosticSeverity sev = DiagnosticSeverity::Error)
      : message(std::move(msg)), entryId(std::move(id)), position(pos),
        severity(sev) {}

  bool isError() const { return severity == DiagnosticSeverity::Error; }

  std::string toString() const {
    std::string location;
    if (position >= 0) {
      location = "definition " + std::to_string(position);
      if (!entryId.empty()) {
        location += " (" + entryId + ")";
      }
    } else if (!entryId.empty()) {
      location = entryId;
    }

    std::string severityString;
    switch (severity) {
    case DiagnosticSeverity::Error:
      severityString = "Error";
      break;
    case DiagnosticSeverity::Warning:
      severityString = "Warning";
      break;
    case DiagnosticSeverity::Information:
      severityString = "Info";
      break;
    case DiagnosticSeverity::Hint:
      severityString = "Hint";
      break;
    }

    if (!location.empty()) {
      return severityString + " at " + location + ": " + message;
    } else {
      return severityString + ": " + message;
    }
  }
};

} // namespace l20n
