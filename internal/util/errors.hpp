#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"

namespace doccache::util {

/*
  Central error types.

  Corruption and InvalidArgument are fatal: they signal a programming or
  storage-integrity defect and must never be retried or swallowed.
*/

class Corruption : public std::runtime_error {
 public:
  explicit Corruption(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreFailure : public std::runtime_error {
 public:
  StoreFailure(db::ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  db::ErrorCode code() const {
    return code_;
  }

 private:
  db::ErrorCode code_;
};

class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Converts a failed repository result into the matching exception.
void ThrowIfDbError(const db::Result& result, const std::string& context);

} // namespace doccache::util
