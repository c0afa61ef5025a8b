#pragma once

#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace muse::db {

/*
  Portable DB result codes.

  Drivers translate backend errors into these.
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

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }

  // Busy, IOError and SerializationFailure may succeed on a later attempt.
  bool IsTransient() const {
    return code == ErrorCode::Busy || code == ErrorCode::IOError || code == ErrorCode::SerializationFailure;
  }
};

/*
  Converts a failed Result into the exception taxonomy:
    transient codes        -> TransientStoreError
    ConstraintViolation    -> ValidationError
    NotFound/AlreadyExists -> NotFound/AlreadyExists
    everything else        -> std::runtime_error
*/
inline void ThrowIfError(const Result& result, std::string_view context) {
  if (result) return;

  const std::string message = std::string(context) + ": " + result.message;
  if (result.IsTransient()) throw util::TransientStoreError(message);

  switch (result.code) {
    case ErrorCode::ConstraintViolation:
      throw util::ValidationError(message);
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace muse::db
