#pragma once
#include "common/types.hpp"
#include <unordered_map>
#include <vector>

class OperationJournal;

// Per-user collateral balances and synthetic debt. The only place these
// numbers change; every mutation is journaled so the surrounding operation can
// unwind it. Entries are never erased, a fully repaid position stays as zeros.
class CollateralLedger {
public:
  Amount CollateralOf(const Address& user, const Address& asset) const;
  Amount DebtOf(const Address& user) const;
  Amount TotalCollateral(const Address& asset) const;
  Amount TotalDebt() const { return total_debt_; }
  // Every account that ever held collateral or debt, sorted
  std::vector<Address> Users() const;

  void CreditCollateral(OperationJournal& journal, const Address& user, const Address& asset, const Amount& amount);
  // Throws ValidationError(InsufficientCollateralBalance) instead of underflowing
  void DebitCollateral(OperationJournal& journal, const Address& user, const Address& asset, const Amount& amount);
  void IncreaseDebt(OperationJournal& journal, const Address& user, const Amount& amount);
  // Throws ValidationError(BurnAmountExceedsDebt) instead of underflowing
  void DecreaseDebt(OperationJournal& journal, const Address& user, const Amount& amount);

private:
  void AddCollateral(const Address& user, const Address& asset, const Amount& amount);
  void SubCollateral(const Address& user, const Address& asset, const Amount& amount);

  std::unordered_map<Address, std::unordered_map<Address, Amount>> collateral_;
  std::unordered_map<Address, Amount> debt_;
  std::unordered_map<Address, Amount> total_collateral_;
  Amount total_debt_ = 0;
};
