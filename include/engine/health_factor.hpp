#pragma once
#include "common/types.hpp"

class CollateralLedger;
class CollateralRegistry;

// Health factor = (collateral USD * LIQUIDATION_THRESHOLD / LIQUIDATION_PRECISION)
//                 * PRECISION / debt, or Max() when there is no debt.
// >= MIN_HEALTH_FACTOR is healthy, below is liquidatable. Always recomputed
// from current ledger state and feed answers; nothing is cached.
class HealthFactorCalculator {
public:
  HealthFactorCalculator(const CollateralLedger& ledger, const CollateralRegistry& registry)
    : ledger_(ledger), registry_(registry) {}

  // Sum of UsdValue over every registered asset, zero balances included
  Amount CollateralValueUsd(const Address& user) const;
  Amount Calculate(const Address& user) const;

  static Amount Calculate(const Amount& total_debt, const Amount& collateral_value_usd);
  static Amount Max();
  static bool IsHealthy(const Amount& health_factor);

private:
  const CollateralLedger& ledger_;
  const CollateralRegistry& registry_;
};
