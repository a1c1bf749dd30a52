#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace warranty::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

const char* ToString(ErrorCode code);

// Busy, serialization failures and optimistic conflicts clear up on retry.
inline bool IsTransient(ErrorCode code) {
  return code == ErrorCode::Busy || code == ErrorCode::SerializationFailure || code == ErrorCode::Conflict;
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  // Rows touched by an UPDATE/DELETE; compare-and-set callers inspect it.
  std::size_t affected = 0;

  static Result Ok(std::size_t affected = 0) {
    Result r;
    r.affected = affected;
    return r;
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    Result r;
    r.code    = c;
    r.message = std::move(msg);
    return r;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

/*
  Thrown by Transaction::Commit() when the backend refuses the commit.
  Carries the same portable code as Result.
*/
class DbError : public std::runtime_error {
 public:
  DbError(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  ErrorCode Code() const {
    return code_;
  }

 private:
  ErrorCode code_;
};

} // namespace warranty::db
