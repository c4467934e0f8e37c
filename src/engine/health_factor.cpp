#include "engine/health_factor.hpp"
#include "engine/collateral_ledger.hpp"
#include "engine/collateral_registry.hpp"
#include "oracle/price_oracle.hpp"
#include "constants/engine.hpp"
#include <limits>

Amount HealthFactorCalculator::CollateralValueUsd(const Address& user) const {
  Amount total = 0;
  for (const auto& asset : registry_.Assets()) {
    total += PriceOracle::UsdValue(asset.feed, ledger_.CollateralOf(user, asset.asset));
  }
  return total;
}

Amount HealthFactorCalculator::Calculate(const Address& user) const {
  return Calculate(ledger_.DebtOf(user), CollateralValueUsd(user));
}

Amount HealthFactorCalculator::Calculate(const Amount& total_debt, const Amount& collateral_value_usd) {
  if (total_debt == 0) return Max();
  Amount adjusted = collateral_value_usd * EngineConstants::LIQUIDATION_THRESHOLD / EngineConstants::LIQUIDATION_PRECISION;
  return adjusted * EngineConstants::PRECISION / total_debt;
}

Amount HealthFactorCalculator::Max() {
  return std::numeric_limits<Amount>::max();
}

bool HealthFactorCalculator::IsHealthy(const Amount& health_factor) {
  return health_factor >= EngineConstants::MIN_HEALTH_FACTOR;
}
