#pragma once

#include <stdexcept>
#include <string>

namespace copytrade {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Exception hierarchy thrown inside components and normalized into
//         result structs at every public entry point.
//
// @details
//   CopyTradeError
//   ├── ValidationError        malformed signal / out-of-bounds parameter.
//   │                          Never retried; the trade is skipped.
//   ├── ConfigError            invalid configuration file or value.
//   ├── StateCorruptionError   unreadable persisted breaker state. Recovered
//   │                          by falling back to the default state.
//   ├── OrderError             order placement rejected or failed. Never
//   │                          retried, to avoid duplicate fills.
//   └── TransientIOError       read-side I/O that may succeed if repeated.
//       ├── PriceUnavailableError
//       ├── PriceTimeoutError   price fetch exceeded its timeout. Not
//       │                       retried within a supervision pass.
//       ├── BalanceUnavailableError
//       └── StateWriteError     persisting the breaker state failed.
//
// Expected outcomes (trade blocked, trade skipped, position already closed)
// are NOT exceptions; they are TradeGate / ExecutionResult / CloseResult
// values.
// -----------------------------------------------------------------------------
class CopyTradeError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ValidationError : public CopyTradeError {
 public:
  using CopyTradeError::CopyTradeError;
};

class ConfigError : public CopyTradeError {
 public:
  using CopyTradeError::CopyTradeError;
};

class StateCorruptionError : public CopyTradeError {
 public:
  using CopyTradeError::CopyTradeError;
};

class OrderError : public CopyTradeError {
 public:
  using CopyTradeError::CopyTradeError;
};

class TransientIOError : public CopyTradeError {
 public:
  using CopyTradeError::CopyTradeError;
};

class PriceUnavailableError : public TransientIOError {
 public:
  using TransientIOError::TransientIOError;
};

class PriceTimeoutError : public TransientIOError {
 public:
  using TransientIOError::TransientIOError;
};

class BalanceUnavailableError : public TransientIOError {
 public:
  using TransientIOError::TransientIOError;
};

class StateWriteError : public TransientIOError {
 public:
  using TransientIOError::TransientIOError;
};

}  // namespace copytrade
