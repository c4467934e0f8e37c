#define BOOST_TEST_MODULE invariant_tests
#include <boost/test/unit_test.hpp>

#include "engine_fixture.hpp"
#include <map>
#include <random>

namespace {

struct Snapshot {
  std::map<std::string, Amount> values;
  bool operator==(const Snapshot& other) const { return values == other.values; }
};

// Drives the engine with a seeded random sequence of user actions and checks
// the accounting invariants after every step.
struct InvariantFixture : EngineFixture {
  std::mt19937 rng{20240601u};
  std::vector<Address> users{alice, bob, keeper};
  size_t failures = 0;
  size_t successes = 0;

  InvariantFixture() {
    for (const auto& u : users) {
      weth.Faucet(u, Units(1000));
      wbtc.Faucet(u, Units(100));
      ApproveAll(u);
    }
  }

  Amount RandomUnits(uint64_t max_whole) {
    std::uniform_int_distribution<uint64_t> whole(0, max_whole);
    std::uniform_int_distribution<uint64_t> frac(0, 99);
    return Units(whole(rng)) + Amount(frac(rng)) * FixedPoint::Pow10(16);
  }

  const Address& RandomUser() {
    std::uniform_int_distribution<size_t> pick(0, users.size() - 1);
    return users[pick(rng)];
  }

  InMemoryToken& RandomAsset() {
    std::uniform_int_distribution<int> pick(0, 1);
    return pick(rng) == 0 ? weth : wbtc;
  }

  Snapshot Take() const {
    Snapshot s;
    for (const auto& u : users) {
      s.values["debt:" + u] = engine->GetAccountInformation(u).total_debt;
      s.values["weth:" + u] = engine->GetCollateralBalanceOfUser(u, weth.GetAddress());
      s.values["wbtc:" + u] = engine->GetCollateralBalanceOfUser(u, wbtc.GetAddress());
      s.values["wallet-weth:" + u] = weth.BalanceOf(u);
      s.values["wallet-wbtc:" + u] = wbtc.BalanceOf(u);
      s.values["wallet-dsc:" + u] = dsc.BalanceOf(u);
    }
    s.values["supply"] = dsc.TotalSupply();
    s.values["custody-weth"] = weth.BalanceOf(engine_addr);
    s.values["custody-wbtc"] = wbtc.BalanceOf(engine_addr);
    return s;
  }

  void RunRandomAction() {
    const Address& user = RandomUser();
    InMemoryToken& asset = RandomAsset();
    const uint64_t scale = (&asset == &weth) ? 20 : 2;
    std::uniform_int_distribution<int> action(0, 6);
    Snapshot before = Take();
    try {
      switch (action(rng)) {
        case 0: engine->DepositCollateral(user, asset.GetAddress(), RandomUnits(scale)); break;
        case 1: engine->MintDebt(user, RandomUnits(20000)); break;
        case 2: engine->DepositCollateralAndMintDebt(user, asset.GetAddress(), RandomUnits(scale), RandomUnits(20000)); break;
        case 3: engine->RedeemCollateral(user, asset.GetAddress(), RandomUnits(scale)); break;
        case 4: engine->BurnDebt(user, RandomUnits(5000)); break;
        case 5: engine->RedeemCollateralForDebt(user, asset.GetAddress(), RandomUnits(scale), RandomUnits(5000)); break;
        default: engine->Liquidate(user, RandomUser(), RandomUnits(5000)); break;
      }
      ++successes;
    } catch (const EngineError&) {
      ++failures;
      BOOST_TEST_REQUIRE((Take() == before), "failed action changed state");
    }
  }

  void CheckConservation() const {
    Amount debt_sum = 0;
    Amount weth_sum = 0;
    Amount wbtc_sum = 0;
    for (const auto& u : users) {
      debt_sum += engine->GetAccountInformation(u).total_debt;
      weth_sum += engine->GetCollateralBalanceOfUser(u, weth.GetAddress());
      wbtc_sum += engine->GetCollateralBalanceOfUser(u, wbtc.GetAddress());
    }
    BOOST_TEST_REQUIRE(debt_sum == engine->GetTotalDebt());
    BOOST_TEST_REQUIRE(engine->GetTotalDebt() == dsc.TotalSupply());
    BOOST_TEST_REQUIRE(weth_sum == engine->GetTotalCollateral(weth.GetAddress()));
    BOOST_TEST_REQUIRE(wbtc_sum == engine->GetTotalCollateral(wbtc.GetAddress()));
    BOOST_TEST_REQUIRE(weth.BalanceOf(engine_addr) == engine->GetTotalCollateral(weth.GetAddress()));
    BOOST_TEST_REQUIRE(wbtc.BalanceOf(engine_addr) == engine->GetTotalCollateral(wbtc.GetAddress()));
    BOOST_TEST_REQUIRE(dsc.BalanceOf(engine_addr) == Amount(0));
  }

  void CheckFullyBacked() const {
    Amount value = 0;
    for (const auto& u : users) {
      BOOST_TEST_REQUIRE(HealthFactorCalculator::IsHealthy(engine->GetHealthFactor(u)));
      value += engine->GetAccountCollateralValue(u);
    }
    BOOST_TEST_REQUIRE(value >= dsc.TotalSupply());
  }
};

}  // namespace

BOOST_FIXTURE_TEST_SUITE(invariants, InvariantFixture)

BOOST_AUTO_TEST_CASE(stable_prices_keep_every_position_healthy) {
  for (int i = 0; i < 400; ++i) {
    RunRandomAction();
    CheckConservation();
    CheckFullyBacked();
  }
  BOOST_TEST(successes > 0u);
  BOOST_TEST(failures > 0u);
}

BOOST_AUTO_TEST_CASE(price_moves_and_liquidations_conserve_balances) {
  std::uniform_int_distribution<int> weth_price(600, 3000);
  std::uniform_int_distribution<int> wbtc_price(6000, 30000);
  for (int i = 0; i < 400; ++i) {
    if (i % 25 == 0) {
      SetPrice(weth_feed, weth_price(rng));
      SetPrice(wbtc_feed, wbtc_price(rng));
    }
    RunRandomAction();
    CheckConservation();
  }
  BOOST_TEST(successes > 0u);
}

BOOST_AUTO_TEST_SUITE_END()
