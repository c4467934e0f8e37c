#pragma once
#include <stdexcept>
#include <string>

enum class ErrorCode {
  // validation
  AmountMustBeMoreThanZero,
  TokenNotAllowed,
  TokenAndPriceFeedLengthMismatch,
  DuplicateCollateralToken,
  InsufficientCollateralBalance,
  BurnAmountExceedsDebt,
  // invariant
  BreaksHealthFactor,
  // oracle
  InvalidPrice,
  StalePrice,
  // transfer
  TransferFailed,
  MintFailed,
  // liquidation
  HealthFactorOk,
  InsufficientCollateral,
  // guard
  Reentrancy,
  // checked 256-bit arithmetic
  ArithmeticOverflow
};

enum class ErrorCategory { Validation, Invariant, Oracle, Transfer, Liquidation, Reentrancy, Arithmetic };

const char* ErrorCodeName(ErrorCode code);
const char* ErrorCategoryName(ErrorCategory category);
ErrorCategory CategoryOf(ErrorCode code);

// Base of every failure raised by the engine. An operation that throws has
// already unwound all of its own ledger and token effects.
class EngineError : public std::runtime_error {
public:
  EngineError(ErrorCode code, const std::string& detail);
  ErrorCode Code() const { return code_; }
  ErrorCategory Category() const { return CategoryOf(code_); }
private:
  ErrorCode code_;
};

class ValidationError : public EngineError { public: using EngineError::EngineError; };
class InvariantViolation : public EngineError { public: using EngineError::EngineError; };
class OracleError : public EngineError { public: using EngineError::EngineError; };
class TransferError : public EngineError { public: using EngineError::EngineError; };
class LiquidationError : public EngineError { public: using EngineError::EngineError; };
class ReentrancyError : public EngineError { public: using EngineError::EngineError; };
class ArithmeticError : public EngineError { public: using EngineError::EngineError; };

// Throws the EngineError subclass matching the code's category.
[[noreturn]] void ThrowEngineError(ErrorCode code, const std::string& detail);
