#define BOOST_TEST_MODULE liquidation_tests
#include <boost/test/unit_test.hpp>

#include "liquidation/liquidation_engine.hpp"
#include "engine_fixture.hpp"

namespace {

// Alice holds 3 WETH + 0.5 WBTC against $5400; the keeper holds 10 WETH
// against $2700 and spends that DSC on liquidations.
struct CrashFixture : EngineFixture {
  CrashFixture() {
    OpenTwoAssetPosition(alice);
    Fund(weth, keeper, Units(10));
    engine->DepositCollateralAndMintDebt(keeper, weth.GetAddress(), Units(10), Units(2700));
    dsc.Approve(keeper, engine_addr, Units(2700));
  }

  // $3600 of WETH + $3200 of WBTC
  void Crash() {
    SetPrice(weth_feed, 1200);
    SetPrice(wbtc_feed, 6400);
  }
};

bool WithinSeizureTolerance(const Amount& seized, const Amount& target) {
  return seized <= target &&
         seized * EngineConstants::SEIZURE_TOLERANCE_DEN >= target * EngineConstants::SEIZURE_TOLERANCE_NUM;
}

}  // namespace

BOOST_AUTO_TEST_SUITE(liquidation_math)

BOOST_AUTO_TEST_CASE(repayment_is_capped_at_half_the_debt) {
  BOOST_TEST(LiquidationEngine::CapRepayment(Units(5000), Units(5400)) == Units(2700));
  BOOST_TEST(LiquidationEngine::CapRepayment(Units(100), Units(5400)) == Units(100));
  BOOST_TEST(LiquidationEngine::CapRepayment(Units(100), Amount(1)) == Amount(0));
}

BOOST_AUTO_TEST_CASE(seizure_target_adds_ten_percent) {
  BOOST_TEST(LiquidationEngine::SeizureTarget(Units(2700)) == Units(2970));
  BOOST_TEST(LiquidationEngine::SeizureTarget(Units(3000)) == Units(3300));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(liquidate, CrashFixture)

BOOST_AUTO_TEST_CASE(covering_2700_splits_seizure_across_both_assets) {
  Crash();
  BOOST_TEST(engine->GetHealthFactor(alice) == Amount(629629629629629629ULL));

  LiquidationReport report = engine->Liquidate(keeper, alice, Units(2700));

  BOOST_TEST(report.debt_covered == Units(2700));
  BOOST_TEST(report.seizure_target_usd == Units(2970));
  BOOST_TEST(WithinSeizureTolerance(report.seized_usd, Units(2970)));
  BOOST_REQUIRE_EQUAL(report.seized.size(), 2u);
  BOOST_TEST(report.seized[0].asset == weth.GetAddress());
  BOOST_TEST(report.seized[1].asset == wbtc.GetAddress());

  // WETH is 3600/6800 of the position, WBTC takes the residual
  BOOST_TEST(report.seized[0].token_amount == Amount(1310294117647058823ULL));
  BOOST_TEST(report.seized[1].token_amount == Amount(218382352941176470ULL));

  BOOST_TEST(engine->GetAccountInformation(alice).total_debt == Units(2700));
  BOOST_TEST(engine->GetCollateralBalanceOfUser(alice, weth.GetAddress()) == Units(3) - report.seized[0].token_amount);
  BOOST_TEST(engine->GetCollateralBalanceOfUser(alice, wbtc.GetAddress()) == Dec("0.5") - report.seized[1].token_amount);
  BOOST_TEST(weth.BalanceOf(keeper) == report.seized[0].token_amount);
  BOOST_TEST(wbtc.BalanceOf(keeper) == report.seized[1].token_amount);
  BOOST_TEST(dsc.BalanceOf(keeper) == Amount(0));
  BOOST_TEST(dsc.TotalSupply() == Units(5400));
  BOOST_TEST(engine->GetTotalDebt() == Units(5400));

  BOOST_TEST(report.ending_health_factor > report.starting_health_factor);
  BOOST_TEST(report.ending_health_factor == engine->GetHealthFactor(alice));
}

BOOST_AUTO_TEST_CASE(equal_holdings_are_seized_equally) {
  // bob opens a position across two equally valued assets
  SetPrice(weth_feed, 6000);
  SetPrice(wbtc_feed, 6000);
  Fund(weth, bob, Units(1));
  Fund(wbtc, bob, Units(1));
  engine->DepositCollateral(bob, weth.GetAddress(), Units(1));
  engine->DepositCollateralAndMintDebt(bob, wbtc.GetAddress(), Units(1), Units(6000));

  SetPrice(weth_feed, 3000);
  SetPrice(wbtc_feed, 3000);
  // Keeper re-collateralises at the new price before covering $3000
  Fund(weth, keeper, Units(10));
  engine->DepositCollateralAndMintDebt(keeper, weth.GetAddress(), Units(10), Units(300));
  dsc.Approve(keeper, engine_addr, Units(3000));

  LiquidationReport report = engine->Liquidate(keeper, bob, Units(3000));
  BOOST_TEST(report.seizure_target_usd == Units(3300));
  BOOST_REQUIRE_EQUAL(report.seized.size(), 2u);
  BOOST_TEST(report.seized[0].token_amount == Dec("0.55"));
  BOOST_TEST(report.seized[1].token_amount == Dec("0.55"));
  BOOST_TEST(report.seized_usd == Units(3300));
  BOOST_TEST(engine->GetAccountInformation(bob).total_debt == Units(3000));
}

BOOST_AUTO_TEST_CASE(single_asset_position_is_seized_from_that_asset) {
  Fund(weth, bob, Units(10));
  engine->DepositCollateralAndMintDebt(bob, weth.GetAddress(), Units(10), Units(5000));
  SetPrice(weth_feed, 900);
  SetPrice(wbtc_feed, 6400);

  LiquidationReport report = engine->Liquidate(keeper, bob, Units(1000));
  BOOST_REQUIRE_EQUAL(report.seized.size(), 1u);
  BOOST_TEST(report.seized[0].asset == weth.GetAddress());
  // $1100 at $900
  BOOST_TEST(report.seized[0].token_amount == Amount(1222222222222222222ULL));
}

BOOST_AUTO_TEST_CASE(healthy_position_cannot_be_liquidated) {
  BOOST_CHECK_EXCEPTION(engine->Liquidate(keeper, alice, Units(2700)), LiquidationError,
                        HasCode(ErrorCode::HealthFactorOk));
  BOOST_TEST(dsc.BalanceOf(keeper) == Units(2700));
}

BOOST_AUTO_TEST_CASE(zero_cover_is_rejected) {
  Crash();
  BOOST_CHECK_EXCEPTION(engine->Liquidate(keeper, alice, Amount(0)), ValidationError,
                        HasCode(ErrorCode::AmountMustBeMoreThanZero));
}

BOOST_AUTO_TEST_CASE(request_above_close_factor_is_capped) {
  Crash();
  dsc.Approve(keeper, engine_addr, Units(5000));
  LiquidationReport report = engine->Liquidate(keeper, alice, Units(5000));
  BOOST_TEST(report.requested_cover == Units(5000));
  BOOST_TEST(report.debt_covered == Units(2700));
  BOOST_TEST(dsc.BalanceOf(keeper) == Amount(0));
  BOOST_TEST(engine->GetAccountInformation(alice).total_debt == Units(2700));
}

BOOST_AUTO_TEST_CASE(collateral_short_of_target_blocks_liquidation) {
  SetPrice(weth_feed, 100);
  SetPrice(wbtc_feed, 200);
  BOOST_CHECK_EXCEPTION(engine->Liquidate(keeper, alice, Units(2700)), LiquidationError,
                        HasCode(ErrorCode::InsufficientCollateral));
  BOOST_TEST(engine->GetAccountInformation(alice).total_debt == Units(5400));
  BOOST_TEST(engine->GetCollateralBalanceOfUser(alice, weth.GetAddress()) == Units(3));
  BOOST_TEST(engine->GetCollateralBalanceOfUser(alice, wbtc.GetAddress()) == Dec("0.5"));
  BOOST_TEST(dsc.BalanceOf(keeper) == Units(2700));
}

BOOST_AUTO_TEST_CASE(stale_price_blocks_liquidation) {
  Crash();
  now += 4 * 60 * 60;
  BOOST_CHECK_EXCEPTION(engine->Liquidate(keeper, alice, Units(2700)), OracleError,
                        HasCode(ErrorCode::StalePrice));
  BOOST_TEST(engine->GetAccountInformation(alice).total_debt == Units(5400));
  BOOST_TEST(engine->GetCollateralBalanceOfUser(alice, weth.GetAddress()) == Units(3));
  BOOST_TEST(dsc.BalanceOf(keeper) == Units(2700));
}

BOOST_AUTO_TEST_CASE(liquidator_must_stay_healthy) {
  Fund(weth, bob, Units(1));
  engine->DepositCollateralAndMintDebt(bob, weth.GetAddress(), Units(1), Units(900));
  dsc.Approve(bob, engine_addr, Units(500));
  Crash();  // bob: $600 adjusted against $900

  BOOST_CHECK_EXCEPTION(engine->Liquidate(bob, alice, Units(500)), InvariantViolation,
                        HasCode(ErrorCode::BreaksHealthFactor));
  BOOST_TEST(engine->GetAccountInformation(alice).total_debt == Units(5400));
  BOOST_TEST(engine->GetCollateralBalanceOfUser(alice, weth.GetAddress()) == Units(3));
  BOOST_TEST(dsc.BalanceOf(bob) == Units(900));
  BOOST_TEST(weth.BalanceOf(bob) == Amount(0));
}

BOOST_AUTO_TEST_CASE(liquidator_without_synthetic_allowance_reverts) {
  Crash();
  dsc.Approve(keeper, engine_addr, Amount(0));
  BOOST_CHECK_EXCEPTION(engine->Liquidate(keeper, alice, Units(2700)), TransferError,
                        HasCode(ErrorCode::TransferFailed));
  BOOST_TEST(engine->GetAccountInformation(alice).total_debt == Units(5400));
  BOOST_TEST(engine->GetCollateralBalanceOfUser(alice, weth.GetAddress()) == Units(3));
  BOOST_TEST(engine->GetCollateralBalanceOfUser(alice, wbtc.GetAddress()) == Dec("0.5"));
}

BOOST_AUTO_TEST_CASE(failed_collateral_push_unwinds_everything) {
  Crash();
  // The keeper never lets the engine pull WETH back, so no leg may go out first
  BOOST_REQUIRE(weth.Allowance(keeper, engine_addr) == Amount(0));
  wbtc.SetFailTransfers(true);

  BOOST_CHECK_EXCEPTION(engine->Liquidate(keeper, alice, Units(2700)), TransferError,
                        HasCode(ErrorCode::TransferFailed));

  BOOST_TEST(engine->GetAccountInformation(alice).total_debt == Units(5400));
  BOOST_TEST(engine->GetCollateralBalanceOfUser(alice, weth.GetAddress()) == Units(3));
  BOOST_TEST(engine->GetCollateralBalanceOfUser(alice, wbtc.GetAddress()) == Dec("0.5"));
  BOOST_TEST(weth.BalanceOf(keeper) == Amount(0));
  BOOST_TEST(weth.BalanceOf(engine_addr) == Units(13));
  BOOST_TEST(weth.BalanceOf(engine_addr) == engine->GetTotalCollateral(weth.GetAddress()));
  BOOST_TEST(wbtc.BalanceOf(engine_addr) == engine->GetTotalCollateral(wbtc.GetAddress()));
  BOOST_TEST(dsc.BalanceOf(keeper) == Units(2700));
  BOOST_TEST(dsc.TotalSupply() == Units(8100));

  // The refused attempt left the keeper's DSC allowance intact
  wbtc.SetFailTransfers(false);
  BOOST_TEST(dsc.Allowance(keeper, engine_addr) == Units(2700));
  engine->Liquidate(keeper, alice, Units(2700));
  BOOST_TEST(weth.BalanceOf(keeper) == Dec("1.310294117647058823"));
  BOOST_TEST(weth.BalanceOf(engine_addr) == engine->GetTotalCollateral(weth.GetAddress()));
}

BOOST_AUTO_TEST_CASE(deeply_underwater_position_may_end_lower) {
  // $1800 + $1200 leaves barely enough for the $2970 target
  SetPrice(weth_feed, 600);
  SetPrice(wbtc_feed, 2400);
  LiquidationReport report = engine->Liquidate(keeper, alice, Units(2700));
  BOOST_TEST(report.debt_covered == Units(2700));
  BOOST_TEST(report.ending_health_factor < report.starting_health_factor);
  BOOST_TEST(engine->GetAccountInformation(alice).total_debt == Units(2700));
}

BOOST_AUTO_TEST_CASE(repeated_rounds_converge) {
  Crash();
  engine->Liquidate(keeper, alice, Units(2700));
  // Still below 1 after one round; a second keeper finishes the job
  BOOST_TEST(!HealthFactorCalculator::IsHealthy(engine->GetHealthFactor(alice)));

  Fund(weth, bob, Units(20));
  engine->DepositCollateralAndMintDebt(bob, weth.GetAddress(), Units(20), Units(1350));
  dsc.Approve(bob, engine_addr, Units(1350));
  LiquidationReport second = engine->Liquidate(bob, alice, Units(1350));
  BOOST_TEST(second.debt_covered == Units(1350));
  BOOST_TEST(engine->GetAccountInformation(alice).total_debt == Units(1350));
  BOOST_TEST(second.ending_health_factor > second.starting_health_factor);
}

BOOST_AUTO_TEST_SUITE_END()
