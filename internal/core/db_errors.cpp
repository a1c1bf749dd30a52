#include "db_errors.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace warranty::core {

namespace {

[[noreturn]] void Throw(db::ErrorCode code, const std::string& message) {
  switch (code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::Busy:
    case db::ErrorCode::SerializationFailure:
      throw util::Conflict(message);
    default:
      throw util::Internal(util::NewId(), message);
  }
}

} // namespace

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }
  Throw(result.code, result.message.empty() ? context : context + ": " + result.message);
}

void ThrowDbError(const db::DbError& error, const std::string& context) {
  Throw(error.Code(), context + ": " + error.what());
}

} // namespace warranty::core
