#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace mc3d::util {

/*
  Central error types.

  Record-level errors (FormatError, UnknownDatabaseError) fail a single
  record. OracleFailure fails the containing chunk. LedgerConflictError and
  ConsistencyFailure stop the current stage before anything is written.
*/

class FormatError : public std::runtime_error {
 public:
  explicit FormatError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnknownDatabaseError : public std::runtime_error {
 public:
  explicit UnknownDatabaseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class OracleFailure : public std::runtime_error {
 public:
  explicit OracleFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LedgerConflictError : public std::runtime_error {
 public:
  LedgerConflictError(const std::string& msg, std::vector<std::string> keys)
      : std::runtime_error(msg), keys_(std::move(keys)) {
  }

  const std::vector<std::string>& Keys() const {
    return keys_;
  }

 private:
  std::vector<std::string> keys_;
};

class ConsistencyFailure : public std::runtime_error {
 public:
  explicit ConsistencyFailure(const std::string& msg) : std::runtime_error(msg) {
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

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace mc3d::util
