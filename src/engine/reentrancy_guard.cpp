#include "engine/reentrancy_guard.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

ReentrancyGuard::Scope::Scope(ReentrancyGuard& guard, const std::string& operation) : guard_(guard) {
  if (guard_.locked_) {
    Logger::Warning("Rejected re-entrant " + operation + " while " + guard_.active_operation_ + " is active");
    ThrowEngineError(ErrorCode::Reentrancy, operation + " entered during " + guard_.active_operation_);
  }
  guard_.locked_ = true;
  guard_.active_operation_ = operation;
}

ReentrancyGuard::Scope::~Scope() {
  guard_.locked_ = false;
  guard_.active_operation_.clear();
}
