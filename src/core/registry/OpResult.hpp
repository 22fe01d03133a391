#pragma once
#include <string>
#include <utility>

namespace objreg {

enum class ErrorKind {
  NotFound,       // operation needs an objective and there is none
  AlreadyExists,  // operation needs the key to be free and it is not
  InvalidInput,   // a field failed its validation predicate
};

inline const char* errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NotFound:      return "NotFound";
    case ErrorKind::AlreadyExists: return "AlreadyExists";
    case ErrorKind::InvalidInput:  return "InvalidInput";
  }
  return "Unknown";
}

// Outcome of a registry operation. Business-rule failures travel here;
// only storage failures are thrown.
struct OpResult {
  bool        ok = false;
  ErrorKind   error = ErrorKind::InvalidInput;   // meaningful only when !ok
  std::string message;

  static OpResult success(std::string msg) {
    OpResult r;
    r.ok = true;
    r.message = std::move(msg);
    return r;
  }

  static OpResult failure(ErrorKind kind, std::string msg) {
    OpResult r;
    r.error = kind;
    r.message = std::move(msg);
    return r;
  }
};

} // namespace objreg
