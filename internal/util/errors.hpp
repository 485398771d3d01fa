#pragma once

#include <stdexcept>
#include <string>

namespace streamledger::util {

/*
  Central error types.

  Every entry point aborts by throwing one of these before its transaction
  commits. They get translated later to gRPC status codes.
*/

class NotAuthorized : public std::runtime_error {
 public:
  explicit NotAuthorized(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InsufficientPayment : public std::runtime_error {
 public:
  explicit InsufficientPayment(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidQuality : public std::runtime_error {
 public:
  explicit InvalidQuality(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
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

// Checked balance arithmetic would exceed 64 bits.
class Overflow : public std::runtime_error {
 public:
  explicit Overflow(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InsufficientFunds : public std::runtime_error {
 public:
  explicit InsufficientFunds(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace streamledger::util
