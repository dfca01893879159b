#pragma once

#include <stdexcept>
#include <string>

namespace mapper::util {

/*
  Central error types.

  Every engine failure surfaces as one of these. Messages always name the
  model, and the field or identifier where one is involved.
*/

class SchemaError : public std::runtime_error {
 public:
  explicit SchemaError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnknownModelError : public std::runtime_error {
 public:
  explicit UnknownModelError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnknownFieldError : public std::runtime_error {
 public:
  explicit UnknownFieldError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MissingFieldError : public std::runtime_error {
 public:
  explicit MissingFieldError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TypeMismatchError : public std::runtime_error {
 public:
  explicit TypeMismatchError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DuplicateKeyError : public std::runtime_error {
 public:
  explicit DuplicateKeyError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFoundError : public std::runtime_error {
 public:
  explicit NotFoundError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgumentError : public std::runtime_error {
 public:
  explicit InvalidArgumentError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Backend failure that is not part of the storage contract (I/O, corruption).
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace mapper::util
