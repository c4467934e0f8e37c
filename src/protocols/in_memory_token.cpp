#include "protocols/in_memory_token.hpp"
#include "common/fixed_point.hpp"
#include "common/logger.hpp"
#include <exception>
#include <limits>

InMemoryToken::InMemoryToken(std::string symbol, Address address, Address owner)
  : symbol_(std::move(symbol)), address_(std::move(address)), owner_(std::move(owner)) {}

void InMemoryToken::TransferOwnership(const Address& new_owner) {
  Logger::Info(symbol_ + " ownership " + owner_ + " -> " + new_owner);
  owner_ = new_owner;
}

Amount InMemoryToken::BalanceOf(const Address& owner) const {
  auto it = balances_.find(owner);
  return it == balances_.end() ? Amount(0) : it->second;
}

Amount InMemoryToken::Allowance(const Address& owner, const Address& spender) const {
  auto it = allowances_.find(owner);
  if (it == allowances_.end()) return 0;
  auto jt = it->second.find(spender);
  return jt == it->second.end() ? Amount(0) : jt->second;
}

void InMemoryToken::Approve(const Address& owner, const Address& spender, const Amount& amount) {
  allowances_[owner][spender] = amount;
}

bool InMemoryToken::Move(const Address& from, const Address& to, const Amount& amount) {
  if (fail_transfers_ || to.empty()) return false;
  Amount& from_balance = balances_[from];
  if (from_balance < amount) return false;
  from_balance -= amount;
  balances_[to] += amount;
  return true;
}

void InMemoryToken::Notify(const Address& from, const Address& to, const Amount& amount) {
  if (hook_) hook_(from, to, amount);
}

bool InMemoryToken::Transfer(const Address& from, const Address& to, const Amount& amount) {
  if (!Move(from, to, amount)) return false;
  try {
    Notify(from, to, amount);
  } catch (const std::exception&) {
    balances_[to] -= amount;
    balances_[from] += amount;
    throw;
  }
  return true;
}

bool InMemoryToken::CanTransfer(const Address& from, const Address& to, const Amount& amount) const {
  return !fail_transfers_ && !to.empty() && BalanceOf(from) >= amount;
}

bool InMemoryToken::TransferFrom(const Address& spender, const Address& from, const Address& to, const Amount& amount) {
  Amount allowed = Allowance(from, spender);
  if (allowed < amount) return false;
  if (!Move(from, to, amount)) return false;
  if (allowed != std::numeric_limits<Amount>::max()) allowances_[from][spender] = allowed - amount;
  try {
    Notify(from, to, amount);
  } catch (const std::exception&) {
    balances_[to] -= amount;
    balances_[from] += amount;
    allowances_[from][spender] = allowed;
    throw;
  }
  return true;
}

bool InMemoryToken::Mint(const Address& caller, const Address& to, const Amount& amount) {
  if (fail_transfers_ || caller != owner_ || to.empty() || amount == 0) return false;
  balances_[to] += amount;
  total_supply_ += amount;
  try {
    Notify(Address(), to, amount);
  } catch (const std::exception&) {
    balances_[to] -= amount;
    total_supply_ -= amount;
    throw;
  }
  return true;
}

bool InMemoryToken::Burn(const Address& caller, const Amount& amount) {
  if (fail_transfers_ || caller != owner_ || amount == 0) return false;
  Amount& balance = balances_[caller];
  if (balance < amount) return false;
  balance -= amount;
  total_supply_ -= amount;
  try {
    Notify(caller, Address(), amount);
  } catch (const std::exception&) {
    balances_[caller] += amount;
    total_supply_ += amount;
    throw;
  }
  return true;
}

void InMemoryToken::Faucet(const Address& to, const Amount& amount) {
  balances_[to] += amount;
  total_supply_ += amount;
  Logger::Debug(symbol_ + " faucet " + FixedPoint::Format(amount) + " -> " + to);
}

TokenCapability InMemoryToken::CapabilityFor(const Address& operator_address) {
  TokenCapability cap;
  cap.address = address_;
  cap.transfer_from = [this, operator_address](const Address& from, const Address& to, const Amount& amount) {
    return TransferFrom(operator_address, from, to, amount);
  };
  cap.transfer = [this, operator_address](const Address& to, const Amount& amount) {
    return Transfer(operator_address, to, amount);
  };
  cap.can_transfer = [this, operator_address](const Address& to, const Amount& amount) {
    return CanTransfer(operator_address, to, amount);
  };
  cap.mint = [this, operator_address](const Address& to, const Amount& amount) {
    return Mint(operator_address, to, amount);
  };
  cap.burn = [this, operator_address](const Amount& amount) {
    return Burn(operator_address, amount);
  };
  cap.balance_of = [this](const Address& owner) { return BalanceOf(owner); };
  return cap;
}
