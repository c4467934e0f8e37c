#pragma once
#include "common/types.hpp"
#include "protocols/token.hpp"
#include <functional>
#include <string>
#include <unordered_map>

// ERC20-style balance and allowance book. Minting and burning are restricted to
// the owner. Collateral tokens and the synthetic token in the simulator are
// both instances of this class.
class InMemoryToken {
public:
  // Invoked after every successful balance movement (including mint/burn,
  // where the missing side is empty). May call back into the engine. If the
  // hook throws, the movement is undone and the exception propagates.
  using TransferHook = std::function<void(const Address& from, const Address& to, const Amount& amount)>;

  InMemoryToken(std::string symbol, Address address, Address owner);

  const std::string& Symbol() const { return symbol_; }
  const Address& GetAddress() const { return address_; }
  const Address& Owner() const { return owner_; }
  void TransferOwnership(const Address& new_owner);

  Amount BalanceOf(const Address& owner) const;
  Amount Allowance(const Address& owner, const Address& spender) const;
  Amount TotalSupply() const { return total_supply_; }

  void Approve(const Address& owner, const Address& spender, const Amount& amount);
  bool Transfer(const Address& from, const Address& to, const Amount& amount);
  // Dry run of Transfer. Hooks are not consulted.
  bool CanTransfer(const Address& from, const Address& to, const Amount& amount) const;
  bool TransferFrom(const Address& spender, const Address& from, const Address& to, const Amount& amount);
  bool Mint(const Address& caller, const Address& to, const Amount& amount);
  bool Burn(const Address& caller, const Amount& amount);
  // Unrestricted issuance for funding simulated wallets
  void Faucet(const Address& to, const Amount& amount);

  void SetTransferHook(TransferHook hook) { hook_ = std::move(hook); }
  // While set, every transfer/mint/burn reports failure without moving funds
  void SetFailTransfers(bool fail) { fail_transfers_ = fail; }

  // Capability acting as `operator_address`. References this token.
  TokenCapability CapabilityFor(const Address& operator_address);

private:
  bool Move(const Address& from, const Address& to, const Amount& amount);
  void Notify(const Address& from, const Address& to, const Amount& amount);

  std::string symbol_;
  Address address_;
  Address owner_;
  Amount total_supply_ = 0;
  std::unordered_map<Address, Amount> balances_;
  std::unordered_map<Address, std::unordered_map<Address, Amount>> allowances_;
  TransferHook hook_;
  bool fail_transfers_ = false;
};
