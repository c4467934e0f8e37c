#include "engine/collateral_ledger.hpp"
#include "engine/operation_journal.hpp"
#include "common/errors.hpp"
#include "common/fixed_point.hpp"
#include <set>

Amount CollateralLedger::CollateralOf(const Address& user, const Address& asset) const {
  auto it = collateral_.find(user);
  if (it == collateral_.end()) return 0;
  auto jt = it->second.find(asset);
  return jt == it->second.end() ? Amount(0) : jt->second;
}

Amount CollateralLedger::DebtOf(const Address& user) const {
  auto it = debt_.find(user);
  return it == debt_.end() ? Amount(0) : it->second;
}

Amount CollateralLedger::TotalCollateral(const Address& asset) const {
  auto it = total_collateral_.find(asset);
  return it == total_collateral_.end() ? Amount(0) : it->second;
}

std::vector<Address> CollateralLedger::Users() const {
  std::set<Address> users;
  for (const auto& kv : collateral_) users.insert(kv.first);
  for (const auto& kv : debt_) users.insert(kv.first);
  return std::vector<Address>(users.begin(), users.end());
}

void CollateralLedger::AddCollateral(const Address& user, const Address& asset, const Amount& amount) {
  collateral_[user][asset] += amount;
  total_collateral_[asset] += amount;
}

void CollateralLedger::SubCollateral(const Address& user, const Address& asset, const Amount& amount) {
  collateral_[user][asset] -= amount;
  total_collateral_[asset] -= amount;
}

void CollateralLedger::CreditCollateral(OperationJournal& journal, const Address& user, const Address& asset, const Amount& amount) {
  AddCollateral(user, asset, amount);
  journal.Record("credit collateral " + asset + " to " + user, [this, user, asset, amount]() {
    SubCollateral(user, asset, amount);
  });
}

void CollateralLedger::DebitCollateral(OperationJournal& journal, const Address& user, const Address& asset, const Amount& amount) {
  Amount balance = CollateralOf(user, asset);
  if (balance < amount) {
    ThrowEngineError(ErrorCode::InsufficientCollateralBalance,
                     user + " holds " + FixedPoint::Format(balance) + " of " + asset + ", needs " + FixedPoint::Format(amount));
  }
  SubCollateral(user, asset, amount);
  journal.Record("debit collateral " + asset + " from " + user, [this, user, asset, amount]() {
    AddCollateral(user, asset, amount);
  });
}

void CollateralLedger::IncreaseDebt(OperationJournal& journal, const Address& user, const Amount& amount) {
  debt_[user] += amount;
  total_debt_ += amount;
  journal.Record("increase debt of " + user, [this, user, amount]() {
    debt_[user] -= amount;
    total_debt_ -= amount;
  });
}

void CollateralLedger::DecreaseDebt(OperationJournal& journal, const Address& user, const Amount& amount) {
  Amount owed = DebtOf(user);
  if (owed < amount) {
    ThrowEngineError(ErrorCode::BurnAmountExceedsDebt,
                     user + " owes " + FixedPoint::Format(owed) + ", burn " + FixedPoint::Format(amount));
  }
  debt_[user] -= amount;
  total_debt_ -= amount;
  journal.Record("decrease debt of " + user, [this, user, amount]() {
    debt_[user] += amount;
    total_debt_ += amount;
  });
}
