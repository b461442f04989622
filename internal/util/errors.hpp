#pragma once

#include <stdexcept>
#include <string>

namespace vault::util {

/*
  Central error types.

  Denials are not errors: access decisions are returned as values
  (see internal/access/decision.hpp). These are thrown for malformed
  input, missing entities and store contention.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// lost a race against a concurrent mutation; retrying is safe
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// store is busy, locked or failing I/O
class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// actor has too many recent authentication failures
class LockedOut : public std::runtime_error {
 public:
  explicit LockedOut(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace vault::util
