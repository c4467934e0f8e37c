#pragma once
#include "common/types.hpp"
#include <vector>

class CollateralLedger;
class CollateralRegistry;
class HealthFactorCalculator;
class OperationJournal;

struct SeizedCollateral {
  Address asset;
  Amount token_amount;
  Amount usd_value;  // value of token_amount after truncation
};

struct SeizurePlan {
  Amount target_usd = 0;
  Amount total_collateral_usd = 0;
  Amount seized_usd = 0;
  std::vector<SeizedCollateral> legs;
};

struct LiquidationReport {
  Address liquidator;
  Address user;
  Amount requested_cover = 0;
  Amount debt_covered = 0;
  Amount seizure_target_usd = 0;
  Amount seized_usd = 0;
  std::vector<SeizedCollateral> seized;
  Amount starting_health_factor = 0;
  Amount ending_health_factor = 0;
};

// Ledger side of a liquidation: validates eligibility, caps the repayment,
// debits the seized collateral across assets and reduces the target's debt.
// Token movements are the caller's job and happen only after this returns.
class LiquidationEngine {
public:
  LiquidationEngine(CollateralLedger& ledger, const CollateralRegistry& registry, const HealthFactorCalculator& health)
    : ledger_(ledger), registry_(registry), health_(health) {}

  // min(requested, CLOSE_FACTOR% of the user's debt)
  static Amount CapRepayment(const Amount& requested, const Amount& user_debt);
  // debt_covered plus LIQUIDATION_BONUS%
  static Amount SeizureTarget(const Amount& debt_covered);

  // Debits collateral worth `total_value_to_seize` USD from `user`, spread over
  // every asset the user holds in proportion to its share of the user's total
  // collateral value. The last asset visited takes the rounding residual.
  SeizurePlan SeizeProportionally(OperationJournal& journal, const Address& user,
                                  const Amount& total_value_to_seize, Timestamp now);

  LiquidationReport Liquidate(OperationJournal& journal, const Address& liquidator, const Address& user,
                              const Amount& debt_to_cover, Timestamp now);

private:
  CollateralLedger& ledger_;
  const CollateralRegistry& registry_;
  const HealthFactorCalculator& health_;
};
