#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace tables::service {

// Maps a failed repository call onto the util exception the callers expect.
inline void ThrowIfDbError(const tables::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case tables::db::ErrorCode::NotFound:
      throw tables::util::NotFound(message);
    case tables::db::ErrorCode::AlreadyExists:
    case tables::db::ErrorCode::ConstraintViolation:
      throw tables::util::InvalidArgument(message);
    case tables::db::ErrorCode::Conflict:
    case tables::db::ErrorCode::Busy:
      throw tables::util::TableConflict(message);
    default:
      throw tables::util::Error(tables::db::ToString(result.code), message);
  }
}

} // namespace tables::service
