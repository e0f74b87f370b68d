#pragma once

#include <stdexcept>
#include <string>

namespace settle::util {

// Base of every error the settlement core throws on purpose. Anything that
// escapes a flow step is contained by the engine for that item only.
class SettleError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Item or record missing from the store.
class NotFound : public SettleError {
 public:
  using SettleError::SettleError;
};

// Insert of an id that is already open or terminal.
class AlreadyExists : public SettleError {
 public:
  using SettleError::SettleError;
};

// Transition not allowed from the current status, or a finished transaction.
class InvalidState : public SettleError {
 public:
  using SettleError::SettleError;
};

// Ledger adapter timeout, rate limit or dropped connection. Retried next pass.
class TransientError : public SettleError {
 public:
  using SettleError::SettleError;
};

// Backend failure: sqlite/pqxx error, constraint violation, commit conflict.
class StoreError : public SettleError {
 public:
  using SettleError::SettleError;
};

} // namespace settle::util
