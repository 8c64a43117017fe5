#pragma once

#include <stdexcept>
#include <string>

namespace cataphract {

enum class ErrorKind {
  None,
  Validation,
  Authorization,
  NotFound,
  InvalidRoute,
  InvalidState,
  Conflict,
  Internal,
};

const char* error_kind_label(ErrorKind k);

// Base of all user-facing engine errors.
class EngineError : public std::runtime_error {
 public:
  EngineError(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}
  ErrorKind kind() const { return kind_; }

 private:
  ErrorKind kind_;
};

// Malformed or missing order parameters. The order never enters a queue.
class ValidationError : public EngineError {
 public:
  explicit ValidationError(const std::string& msg) : EngineError(ErrorKind::Validation, msg) {}
};

// The issuing commander does not control the acting army / ship.
class AuthorizationError : public EngineError {
 public:
  explicit AuthorizationError(const std::string& msg) : EngineError(ErrorKind::Authorization, msg) {}
};

class NotFoundError : public EngineError {
 public:
  explicit NotFoundError(const std::string& msg) : EngineError(ErrorKind::NotFound, msg) {}
};

class InvalidRouteError : public EngineError {
 public:
  explicit InvalidRouteError(const std::string& msg) : EngineError(ErrorKind::InvalidRoute, msg) {}
};

class InvalidStateError : public EngineError {
 public:
  explicit InvalidStateError(const std::string& msg) : EngineError(ErrorKind::InvalidState, msg) {}
};

class ConflictError : public EngineError {
 public:
  explicit ConflictError(const std::string& msg) : EngineError(ErrorKind::Conflict, msg) {}
};

// A broken campaign invariant (negative supply, dangling hex reference...).
// This is a bug, never a user error: the tick that produced it is discarded.
class InvariantViolation : public std::logic_error {
 public:
  explicit InvariantViolation(const std::string& msg) : std::logic_error(msg) {}
};

} // namespace cataphract
