#pragma once
#include "common/types.hpp"
#include "engine/collateral_ledger.hpp"
#include "engine/collateral_registry.hpp"
#include "engine/health_factor.hpp"
#include "engine/reentrancy_guard.hpp"
#include "liquidation/liquidation_engine.hpp"
#include "oracle/price_feed.hpp"
#include "protocols/token.hpp"
#include <functional>
#include <string>
#include <vector>

struct AccountInformation {
  Amount total_debt = 0;
  Amount collateral_value_usd = 0;
};

using Clock = std::function<Timestamp()>;
Timestamp SystemClockNow();

// Issues the synthetic token against deposited collateral and lets anyone
// liquidate positions whose health factor drops below 1.
//
// Every mutating call is guarded against re-entry and is all-or-nothing: on any
// failure the ledger and every token interaction already performed by that call
// are reversed before the exception leaves the engine. Ledger effects and health
// checks run before token interactions; pulls into the engine run before pushes
// out of it. Transfers out of the engine and mints are the last effects of a
// call and record no undo: once tokens reach a recipient they are never
// reclaimed. A liquidation checks every collateral leg with can_transfer before
// sending the first one.
class CollateralEngine {
public:
  // collateral_tokens and price_feeds are paired by index; the engine address is
  // the account the token capabilities act as.
  CollateralEngine(Address self,
                   std::vector<TokenCapability> collateral_tokens,
                   std::vector<PriceFeedHandle> price_feeds,
                   TokenCapability synthetic_token,
                   Clock clock = SystemClockNow);

  void DepositCollateral(const Address& caller, const Address& asset, const Amount& amount);
  void DepositCollateralAndMintDebt(const Address& caller, const Address& asset,
                                    const Amount& amount_collateral, const Amount& amount_to_mint);
  void RedeemCollateral(const Address& caller, const Address& asset, const Amount& amount);
  // Burns first, then redeems; the health check sees the combined result
  void RedeemCollateralForDebt(const Address& caller, const Address& asset,
                               const Amount& amount_collateral, const Amount& amount_to_burn);
  void MintDebt(const Address& caller, const Amount& amount);
  void BurnDebt(const Address& caller, const Amount& amount);
  LiquidationReport Liquidate(const Address& liquidator, const Address& user, const Amount& debt_to_cover);

  Amount GetUsdValue(const Address& asset, const Amount& amount) const;
  Amount GetTokenAmountFromUsd(const Address& asset, const Amount& usd_amount) const;
  AccountInformation GetAccountInformation(const Address& user) const;
  Amount GetAccountCollateralValue(const Address& user) const;
  Amount GetHealthFactor(const Address& user) const;
  static Amount CalculateHealthFactor(const Amount& total_debt, const Amount& collateral_value_usd);
  Amount GetCollateralBalanceOfUser(const Address& user, const Address& asset) const;
  std::vector<Address> GetCollateralTokens() const;
  const Address& GetCollateralTokenPriceFeed(const Address& asset) const;
  const Address& GetSyntheticToken() const { return synthetic_.address; }
  Amount GetTotalCollateral(const Address& asset) const;
  Amount GetTotalDebt() const { return ledger_.TotalDebt(); }
  std::vector<Address> GetUsers() const { return ledger_.Users(); }
  const Address& GetAddress() const { return self_; }
  Timestamp Now() const { return clock_(); }

private:
  void RunGuarded(const std::string& operation, const Address& caller,
                  const std::function<void(OperationJournal&)>& body);

  void DepositInternal(OperationJournal& journal, const Address& caller, const Address& asset, const Amount& amount);
  void RedeemInternal(OperationJournal& journal, const Address& from, const Address& asset, const Amount& amount);
  void MintInternal(OperationJournal& journal, const Address& caller, const Amount& amount);
  // Reduces on_behalf_of's debt and destroys `amount` synthetic pulled from payer
  void BurnInternal(OperationJournal& journal, const Address& on_behalf_of, const Address& payer, const Amount& amount);

  void PullCollateral(OperationJournal& journal, const CollateralAsset& asset, const Address& from, const Amount& amount);
  void RequirePushable(const CollateralAsset& asset, const Address& to, const Amount& amount) const;
  void PushCollateral(const CollateralAsset& asset, const Address& to, const Amount& amount);
  void PullAndBurnSynthetic(OperationJournal& journal, const Address& payer, const Amount& amount);

  void RevertIfHealthFactorIsBroken(const Address& user) const;
  void EmitEvent(const std::string& event, const Address& user, const Address& asset, const Amount& amount) const;

  Address self_;
  CollateralRegistry registry_;
  TokenCapability synthetic_;
  Clock clock_;
  CollateralLedger ledger_;
  HealthFactorCalculator health_;
  LiquidationEngine liquidation_;
  ReentrancyGuard guard_;
};
