#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace settle::db {

// Lifts a repository Result into the exception types the store callers
// handle: duplicates and missing ids keep their identity, everything else
// is a StoreError.
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) return;

  const auto message = context + " (" + result.Describe() + ")";
  switch (result.code) {
    case ErrorCode::AlreadyExists: throw util::AlreadyExists(message);
    case ErrorCode::NotFound: throw util::NotFound(message);
    default: throw util::StoreError(message);
  }
}

} // namespace settle::db
