#pragma once
#include <string>

// Mutual exclusion for the engine's mutating entry points. Holding a Scope
// marks the engine busy; constructing a second Scope before the first is
// destroyed (e.g. from a token callback) throws ReentrancyError.
class ReentrancyGuard {
public:
  class Scope {
  public:
    Scope(ReentrancyGuard& guard, const std::string& operation);
    ~Scope();
    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;
  private:
    ReentrancyGuard& guard_;
  };

  bool Locked() const { return locked_; }
  const std::string& ActiveOperation() const { return active_operation_; }

private:
  bool locked_ = false;
  std::string active_operation_;
};
