#include "liquidation/liquidation_engine.hpp"
#include "engine/collateral_ledger.hpp"
#include "engine/collateral_registry.hpp"
#include "engine/health_factor.hpp"
#include "engine/operation_journal.hpp"
#include "oracle/price_oracle.hpp"
#include "constants/engine.hpp"
#include "common/errors.hpp"
#include "common/fixed_point.hpp"
#include "common/logger.hpp"
#include <algorithm>

Amount LiquidationEngine::CapRepayment(const Amount& requested, const Amount& user_debt) {
  Amount cap = user_debt * EngineConstants::CLOSE_FACTOR / EngineConstants::LIQUIDATION_PRECISION;
  return std::min(requested, cap);
}

Amount LiquidationEngine::SeizureTarget(const Amount& debt_covered) {
  Amount bonus = debt_covered * EngineConstants::LIQUIDATION_BONUS / EngineConstants::LIQUIDATION_PRECISION;
  return debt_covered + bonus;
}

SeizurePlan LiquidationEngine::SeizeProportionally(OperationJournal& journal, const Address& user,
                                                   const Amount& total_value_to_seize, Timestamp now) {
  SeizurePlan plan;
  plan.target_usd = total_value_to_seize;
  plan.total_collateral_usd = health_.CollateralValueUsd(user);
  if (plan.total_collateral_usd < total_value_to_seize) {
    ThrowEngineError(ErrorCode::InsufficientCollateral,
                     user + " holds $" + FixedPoint::Format(plan.total_collateral_usd) + ", seizure needs $" +
                     FixedPoint::Format(total_value_to_seize));
  }

  std::vector<const CollateralAsset*> held;
  for (const auto& asset : registry_.Assets()) {
    if (ledger_.CollateralOf(user, asset.asset) > 0) held.push_back(&asset);
  }

  for (size_t i = 0; i < held.size(); ++i) {
    if (plan.seized_usd >= total_value_to_seize) break;
    const CollateralAsset& asset = *held[i];
    const Amount balance = ledger_.CollateralOf(user, asset.asset);
    const bool last = (i + 1 == held.size());

    Amount share_usd;
    if (last) {
      share_usd = total_value_to_seize - plan.seized_usd;
    } else {
      Amount asset_usd = PriceOracle::UsdValue(asset.feed, balance);
      share_usd = asset_usd * total_value_to_seize / plan.total_collateral_usd;
    }
    if (share_usd == 0) continue;

    Amount tokens = PriceOracle::TokenAmountFromUsd(asset.feed, share_usd, now);
    // Prices may have moved since the valuation pass
    if (tokens > balance) tokens = balance;
    if (tokens == 0) continue;

    ledger_.DebitCollateral(journal, user, asset.asset, tokens);
    Amount moved_usd = PriceOracle::UsdValue(asset.feed, tokens);
    plan.seized_usd += moved_usd;
    plan.legs.push_back(SeizedCollateral{asset.asset, tokens, moved_usd});
  }

  if (plan.seized_usd * EngineConstants::SEIZURE_TOLERANCE_DEN < total_value_to_seize * EngineConstants::SEIZURE_TOLERANCE_NUM) {
    ThrowEngineError(ErrorCode::InsufficientCollateral,
                     "seized $" + FixedPoint::Format(plan.seized_usd) + " of $" + FixedPoint::Format(total_value_to_seize));
  }
  return plan;
}

LiquidationReport LiquidationEngine::Liquidate(OperationJournal& journal, const Address& liquidator, const Address& user,
                                               const Amount& debt_to_cover, Timestamp now) {
  if (debt_to_cover == 0) ThrowEngineError(ErrorCode::AmountMustBeMoreThanZero, "debt to cover");

  LiquidationReport report;
  report.liquidator = liquidator;
  report.user = user;
  report.requested_cover = debt_to_cover;
  report.starting_health_factor = health_.Calculate(user);
  if (HealthFactorCalculator::IsHealthy(report.starting_health_factor)) {
    ThrowEngineError(ErrorCode::HealthFactorOk,
                     user + " health factor " + FixedPoint::Format(report.starting_health_factor));
  }

  report.debt_covered = CapRepayment(debt_to_cover, ledger_.DebtOf(user));
  if (report.debt_covered == 0) ThrowEngineError(ErrorCode::AmountMustBeMoreThanZero, "repayment cap rounds to zero");
  report.seizure_target_usd = SeizureTarget(report.debt_covered);

  SeizurePlan plan = SeizeProportionally(journal, user, report.seizure_target_usd, now);
  report.seized_usd = plan.seized_usd;
  report.seized = std::move(plan.legs);

  ledger_.DecreaseDebt(journal, user, report.debt_covered);

  Amount liquidator_hf = health_.Calculate(liquidator);
  if (!HealthFactorCalculator::IsHealthy(liquidator_hf)) {
    ThrowEngineError(ErrorCode::BreaksHealthFactor,
                     "liquidator " + liquidator + " health factor " + FixedPoint::Format(liquidator_hf));
  }

  // Accepted: a deeply unhealthy position can end lower than it started
  report.ending_health_factor = health_.Calculate(user);
  if (report.ending_health_factor < report.starting_health_factor) {
    Logger::Warning("Liquidation of " + user + " lowered health factor " + FixedPoint::Format(report.starting_health_factor) +
                    " -> " + FixedPoint::Format(report.ending_health_factor));
  }
  return report;
}
