#pragma once
#include "common/types.hpp"
#include <functional>

// What the engine needs from a fungible token, bound to the engine as the
// acting account. Every mutating call reports success; false (or a thrown
// exception) aborts the calling engine operation.
//   transfer_from(from, to, amount)  moves `amount` using the engine's allowance
//   transfer(to, amount)             moves out of the engine's own balance
//   can_transfer(to, amount)         true when transfer(to, amount) would succeed now
//   mint(to, amount)                 issues new supply (synthetic token only)
//   burn(amount)                     destroys part of the engine's balance
struct TokenCapability {
  Address address;
  std::function<bool(const Address& from, const Address& to, const Amount& amount)> transfer_from;
  std::function<bool(const Address& to, const Amount& amount)> transfer;
  std::function<bool(const Address& to, const Amount& amount)> can_transfer;
  std::function<bool(const Address& to, const Amount& amount)> mint;
  std::function<bool(const Amount& amount)> burn;
  std::function<Amount(const Address& owner)> balance_of;
};
