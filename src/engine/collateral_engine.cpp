#include "engine/collateral_engine.hpp"
#include "engine/operation_journal.hpp"
#include "oracle/price_oracle.hpp"
#include "telemetry/structured_logger.hpp"
#include "common/errors.hpp"
#include "common/fixed_point.hpp"
#include "common/logger.hpp"
#include <chrono>
#include <stdexcept>
#include <nlohmann/json.hpp>

Timestamp SystemClockNow() {
  return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::system_clock::now().time_since_epoch()).count());
}

static void RequirePositive(const Amount& amount, const char* what) {
  if (amount == 0) ThrowEngineError(ErrorCode::AmountMustBeMoreThanZero, what);
}

CollateralEngine::CollateralEngine(Address self,
                                   std::vector<TokenCapability> collateral_tokens,
                                   std::vector<PriceFeedHandle> price_feeds,
                                   TokenCapability synthetic_token,
                                   Clock clock)
  : self_(std::move(self)),
    registry_(std::move(collateral_tokens), std::move(price_feeds)),
    synthetic_(std::move(synthetic_token)),
    clock_(clock ? std::move(clock) : Clock(SystemClockNow)),
    health_(ledger_, registry_),
    liquidation_(ledger_, registry_, health_) {
  if (self_.empty()) throw std::invalid_argument("engine address must not be empty");
  if (synthetic_.address.empty()) ThrowEngineError(ErrorCode::TokenNotAllowed, "synthetic token address is empty");
  Logger::Info("CollateralEngine " + self_ + " configured with " + std::to_string(registry_.Size()) +
               " collateral asset(s), synthetic " + synthetic_.address);
}

void CollateralEngine::RunGuarded(const std::string& operation, const Address& caller,
                                  const std::function<void(OperationJournal&)>& body) {
  ReentrancyGuard::Scope scope(guard_, operation);
  OperationJournal journal(operation);
  DSC_LOG_DEBUG(operation + " by " + caller);
  try {
    body(journal);
    journal.Commit();
  } catch (const EngineError& e) {
    journal.Rollback();
    Logger::Warning(operation + " by " + caller + " reverted: " + e.what());
    StructuredLogger::Instance().LogEvent("operation_reverted", {
      {"operation", operation}, {"caller", caller}, {"code", ErrorCodeName(e.Code())},
      {"category", ErrorCategoryName(e.Category())}, {"reason", e.what()}});
    throw;
  } catch (const std::overflow_error& e) {
    journal.Rollback();
    Logger::Warning(operation + " by " + caller + " overflowed: " + e.what());
    throw ArithmeticError(ErrorCode::ArithmeticOverflow, operation + ": " + e.what());
  } catch (const std::range_error& e) {
    journal.Rollback();
    Logger::Warning(operation + " by " + caller + " underflowed: " + e.what());
    throw ArithmeticError(ErrorCode::ArithmeticOverflow, operation + ": " + e.what());
  } catch (...) {
    // Collaborator threw something of its own; unwind and let it through
    journal.Rollback();
    Logger::Error(operation + " by " + caller + " aborted by a collaborator exception");
    throw;
  }
}

void CollateralEngine::EmitEvent(const std::string& event, const Address& user, const Address& asset, const Amount& amount) const {
  nlohmann::json payload = {{"engine", self_}, {"user", user}, {"amount", FixedPoint::Format(amount)}};
  if (!asset.empty()) payload["asset"] = asset;
  StructuredLogger::Instance().LogEvent(event, std::move(payload));
}

// ---- token interactions ----

void CollateralEngine::PullCollateral(OperationJournal& journal, const CollateralAsset& asset, const Address& from, const Amount& amount) {
  if (!asset.token.transfer_from || !asset.token.transfer_from(from, self_, amount)) {
    ThrowEngineError(ErrorCode::TransferFailed, "pull " + FixedPoint::Format(amount) + " " + asset.asset + " from " + from);
  }
  const CollateralAsset* a = &asset;
  journal.Record("return " + asset.asset + " to " + from, [a, from, amount]() {
    if (!a->token.transfer(from, amount)) throw std::runtime_error("collateral refund rejected by token");
  });
}

void CollateralEngine::RequirePushable(const CollateralAsset& asset, const Address& to, const Amount& amount) const {
  if (!asset.token.can_transfer || !asset.token.can_transfer(to, amount)) {
    ThrowEngineError(ErrorCode::TransferFailed, "cannot send " + FixedPoint::Format(amount) + " " + asset.asset + " to " + to);
  }
}

// No undo is recorded; callers only push once nothing else can fail.
void CollateralEngine::PushCollateral(const CollateralAsset& asset, const Address& to, const Amount& amount) {
  if (!asset.token.transfer || !asset.token.transfer(to, amount)) {
    ThrowEngineError(ErrorCode::TransferFailed, "send " + FixedPoint::Format(amount) + " " + asset.asset + " to " + to);
  }
}

void CollateralEngine::PullAndBurnSynthetic(OperationJournal& journal, const Address& payer, const Amount& amount) {
  if (!synthetic_.transfer_from || !synthetic_.transfer_from(payer, self_, amount)) {
    ThrowEngineError(ErrorCode::TransferFailed, "pull " + FixedPoint::Format(amount) + " synthetic from " + payer);
  }
  journal.Record("return synthetic to " + payer, [this, payer, amount]() {
    if (!synthetic_.transfer(payer, amount)) throw std::runtime_error("synthetic refund rejected by token");
  });
  if (!synthetic_.burn || !synthetic_.burn(amount)) {
    ThrowEngineError(ErrorCode::TransferFailed, "burn " + FixedPoint::Format(amount) + " synthetic");
  }
  journal.Record("re-issue burned synthetic", [this, amount]() {
    if (!synthetic_.mint(self_, amount)) throw std::runtime_error("synthetic re-issue rejected by token");
  });
}

// ---- operation bodies ----

void CollateralEngine::DepositInternal(OperationJournal& journal, const Address& caller, const Address& asset, const Amount& amount) {
  RequirePositive(amount, "collateral amount");
  const CollateralAsset& collateral = registry_.Get(asset);
  ledger_.CreditCollateral(journal, caller, asset, amount);
  PullCollateral(journal, collateral, caller, amount);
}

void CollateralEngine::RedeemInternal(OperationJournal& journal, const Address& from, const Address& asset, const Amount& amount) {
  RequirePositive(amount, "collateral amount");
  const CollateralAsset& collateral = registry_.Get(asset);
  ledger_.DebitCollateral(journal, from, asset, amount);
  RevertIfHealthFactorIsBroken(from);
  PushCollateral(collateral, from, amount);
}

void CollateralEngine::MintInternal(OperationJournal& journal, const Address& caller, const Amount& amount) {
  RequirePositive(amount, "mint amount");
  ledger_.IncreaseDebt(journal, caller, amount);
  RevertIfHealthFactorIsBroken(caller);
  // Always the last step of its operation, so the issued tokens never need revoking
  if (!synthetic_.mint || !synthetic_.mint(caller, amount)) {
    ThrowEngineError(ErrorCode::MintFailed, "mint " + FixedPoint::Format(amount) + " to " + caller);
  }
}

void CollateralEngine::BurnInternal(OperationJournal& journal, const Address& on_behalf_of, const Address& payer, const Amount& amount) {
  RequirePositive(amount, "burn amount");
  ledger_.DecreaseDebt(journal, on_behalf_of, amount);
  PullAndBurnSynthetic(journal, payer, amount);
}

void CollateralEngine::RevertIfHealthFactorIsBroken(const Address& user) const {
  Amount hf = health_.Calculate(user);
  if (!HealthFactorCalculator::IsHealthy(hf)) {
    ThrowEngineError(ErrorCode::BreaksHealthFactor, user + " health factor " + FixedPoint::Format(hf));
  }
}

// ---- entry points ----

void CollateralEngine::DepositCollateral(const Address& caller, const Address& asset, const Amount& amount) {
  RunGuarded("depositCollateral", caller, [&](OperationJournal& journal) {
    DepositInternal(journal, caller, asset, amount);
  });
  EmitEvent("collateral_deposited", caller, asset, amount);
}

void CollateralEngine::DepositCollateralAndMintDebt(const Address& caller, const Address& asset,
                                                    const Amount& amount_collateral, const Amount& amount_to_mint) {
  RunGuarded("depositCollateralAndMintDebt", caller, [&](OperationJournal& journal) {
    DepositInternal(journal, caller, asset, amount_collateral);
    MintInternal(journal, caller, amount_to_mint);
  });
  EmitEvent("collateral_deposited", caller, asset, amount_collateral);
  EmitEvent("debt_minted", caller, "", amount_to_mint);
}

void CollateralEngine::RedeemCollateral(const Address& caller, const Address& asset, const Amount& amount) {
  RunGuarded("redeemCollateral", caller, [&](OperationJournal& journal) {
    RedeemInternal(journal, caller, asset, amount);
  });
  EmitEvent("collateral_redeemed", caller, asset, amount);
}

void CollateralEngine::RedeemCollateralForDebt(const Address& caller, const Address& asset,
                                               const Amount& amount_collateral, const Amount& amount_to_burn) {
  RunGuarded("redeemCollateralForDebt", caller, [&](OperationJournal& journal) {
    BurnInternal(journal, caller, caller, amount_to_burn);
    RedeemInternal(journal, caller, asset, amount_collateral);
  });
  EmitEvent("debt_burned", caller, "", amount_to_burn);
  EmitEvent("collateral_redeemed", caller, asset, amount_collateral);
}

void CollateralEngine::MintDebt(const Address& caller, const Amount& amount) {
  RunGuarded("mintDebt", caller, [&](OperationJournal& journal) {
    MintInternal(journal, caller, amount);
  });
  EmitEvent("debt_minted", caller, "", amount);
}

void CollateralEngine::BurnDebt(const Address& caller, const Amount& amount) {
  RunGuarded("burnDebt", caller, [&](OperationJournal& journal) {
    BurnInternal(journal, caller, caller, amount);
    // Burning only raises the health factor; checked anyway
    RevertIfHealthFactorIsBroken(caller);
  });
  EmitEvent("debt_burned", caller, "", amount);
}

LiquidationReport CollateralEngine::Liquidate(const Address& liquidator, const Address& user, const Amount& debt_to_cover) {
  LiquidationReport report;
  RunGuarded("liquidate", liquidator, [&](OperationJournal& journal) {
    report = liquidation_.Liquidate(journal, liquidator, user, debt_to_cover, clock_());
    for (const auto& leg : report.seized) {
      RequirePushable(registry_.Get(leg.asset), liquidator, leg.token_amount);
    }
    PullAndBurnSynthetic(journal, liquidator, report.debt_covered);
    size_t delivered = 0;
    for (const auto& leg : report.seized) {
      try {
        PushCollateral(registry_.Get(leg.asset), liquidator, leg.token_amount);
      } catch (const std::exception& e) {
        if (delivered > 0) {
          Logger::Critical("liquidation of " + user + ": " + leg.asset + " leg failed after " +
                           std::to_string(delivered) + " leg(s) were sent despite a clean preflight: " + e.what());
        }
        throw;
      }
      ++delivered;
    }
  });

  Logger::Info("Liquidated " + user + " by " + liquidator + ": covered $" + FixedPoint::Format(report.debt_covered) +
               ", seized $" + FixedPoint::Format(report.seized_usd) + " across " + std::to_string(report.seized.size()) +
               " asset(s), hf " + FixedPoint::Format(report.starting_health_factor) + " -> " +
               FixedPoint::Format(report.ending_health_factor));
  nlohmann::json legs = nlohmann::json::array();
  for (const auto& leg : report.seized) {
    legs.push_back({{"asset", leg.asset}, {"amount", FixedPoint::Format(leg.token_amount)},
                    {"usd", FixedPoint::Format(leg.usd_value)}});
  }
  StructuredLogger::Instance().LogEvent("liquidation", {
    {"engine", self_}, {"liquidator", liquidator}, {"user", user},
    {"debt_covered", FixedPoint::Format(report.debt_covered)},
    {"seizure_target_usd", FixedPoint::Format(report.seizure_target_usd)},
    {"seized_usd", FixedPoint::Format(report.seized_usd)}, {"seized", legs},
    {"starting_hf", FixedPoint::Format(report.starting_health_factor)},
    {"ending_hf", FixedPoint::Format(report.ending_health_factor)}});
  return report;
}

// ---- views ----

Amount CollateralEngine::GetUsdValue(const Address& asset, const Amount& amount) const {
  return PriceOracle::UsdValue(registry_.Get(asset).feed, amount);
}

Amount CollateralEngine::GetTokenAmountFromUsd(const Address& asset, const Amount& usd_amount) const {
  return PriceOracle::TokenAmountFromUsd(registry_.Get(asset).feed, usd_amount, clock_());
}

AccountInformation CollateralEngine::GetAccountInformation(const Address& user) const {
  AccountInformation info;
  info.total_debt = ledger_.DebtOf(user);
  info.collateral_value_usd = health_.CollateralValueUsd(user);
  return info;
}

Amount CollateralEngine::GetAccountCollateralValue(const Address& user) const {
  return health_.CollateralValueUsd(user);
}

Amount CollateralEngine::GetHealthFactor(const Address& user) const {
  return health_.Calculate(user);
}

Amount CollateralEngine::CalculateHealthFactor(const Amount& total_debt, const Amount& collateral_value_usd) {
  return HealthFactorCalculator::Calculate(total_debt, collateral_value_usd);
}

Amount CollateralEngine::GetCollateralBalanceOfUser(const Address& user, const Address& asset) const {
  return ledger_.CollateralOf(user, asset);
}

std::vector<Address> CollateralEngine::GetCollateralTokens() const {
  return registry_.AssetIds();
}

const Address& CollateralEngine::GetCollateralTokenPriceFeed(const Address& asset) const {
  return registry_.Get(asset).feed.address;
}

Amount CollateralEngine::GetTotalCollateral(const Address& asset) const {
  registry_.Get(asset);
  return ledger_.TotalCollateral(asset);
}
