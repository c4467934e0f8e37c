#include "common/errors.hpp"

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::AmountMustBeMoreThanZero: return "AmountMustBeMoreThanZero";
    case ErrorCode::TokenNotAllowed: return "TokenNotAllowed";
    case ErrorCode::TokenAndPriceFeedLengthMismatch: return "TokenAndPriceFeedLengthMismatch";
    case ErrorCode::DuplicateCollateralToken: return "DuplicateCollateralToken";
    case ErrorCode::InsufficientCollateralBalance: return "InsufficientCollateralBalance";
    case ErrorCode::BurnAmountExceedsDebt: return "BurnAmountExceedsDebt";
    case ErrorCode::BreaksHealthFactor: return "BreaksHealthFactor";
    case ErrorCode::InvalidPrice: return "InvalidPrice";
    case ErrorCode::StalePrice: return "StalePrice";
    case ErrorCode::TransferFailed: return "TransferFailed";
    case ErrorCode::MintFailed: return "MintFailed";
    case ErrorCode::HealthFactorOk: return "HealthFactorOk";
    case ErrorCode::InsufficientCollateral: return "InsufficientCollateral";
    case ErrorCode::Reentrancy: return "Reentrancy";
    case ErrorCode::ArithmeticOverflow: return "ArithmeticOverflow";
  }
  return "Unknown";
}

const char* ErrorCategoryName(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::Validation: return "validation";
    case ErrorCategory::Invariant: return "invariant";
    case ErrorCategory::Oracle: return "oracle";
    case ErrorCategory::Transfer: return "transfer";
    case ErrorCategory::Liquidation: return "liquidation";
    case ErrorCategory::Reentrancy: return "reentrancy";
    case ErrorCategory::Arithmetic: return "arithmetic";
  }
  return "unknown";
}

ErrorCategory CategoryOf(ErrorCode code) {
  switch (code) {
    case ErrorCode::AmountMustBeMoreThanZero:
    case ErrorCode::TokenNotAllowed:
    case ErrorCode::TokenAndPriceFeedLengthMismatch:
    case ErrorCode::DuplicateCollateralToken:
    case ErrorCode::InsufficientCollateralBalance:
    case ErrorCode::BurnAmountExceedsDebt:
      return ErrorCategory::Validation;
    case ErrorCode::BreaksHealthFactor:
      return ErrorCategory::Invariant;
    case ErrorCode::InvalidPrice:
    case ErrorCode::StalePrice:
      return ErrorCategory::Oracle;
    case ErrorCode::TransferFailed:
    case ErrorCode::MintFailed:
      return ErrorCategory::Transfer;
    case ErrorCode::HealthFactorOk:
    case ErrorCode::InsufficientCollateral:
      return ErrorCategory::Liquidation;
    case ErrorCode::Reentrancy:
      return ErrorCategory::Reentrancy;
    case ErrorCode::ArithmeticOverflow:
      return ErrorCategory::Arithmetic;
  }
  return ErrorCategory::Validation;
}

EngineError::EngineError(ErrorCode code, const std::string& detail)
  : std::runtime_error(std::string(ErrorCodeName(code)) + (detail.empty() ? "" : ": " + detail)),
    code_(code) {}

void ThrowEngineError(ErrorCode code, const std::string& detail) {
  switch (CategoryOf(code)) {
    case ErrorCategory::Validation: throw ValidationError(code, detail);
    case ErrorCategory::Invariant: throw InvariantViolation(code, detail);
    case ErrorCategory::Oracle: throw OracleError(code, detail);
    case ErrorCategory::Transfer: throw TransferError(code, detail);
    case ErrorCategory::Liquidation: throw LiquidationError(code, detail);
    case ErrorCategory::Reentrancy: throw ReentrancyError(code, detail);
    case ErrorCategory::Arithmetic: throw ArithmeticError(code, detail);
  }
  throw EngineError(code, detail);
}
