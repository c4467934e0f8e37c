#pragma once
#include "common/types.hpp"
#include "engine/collateral_engine.hpp"
#include "oracle/price_feed.hpp"
#include "protocols/in_memory_token.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

class CsvLogger;

struct StepOutcome {
  size_t index = 0;
  std::string action;
  bool ok = true;
  std::string error_code;  // ErrorCodeName, "InvalidStep" for malformed steps
  std::string message;
  bool expectation_met = true;
};

struct ScenarioResult {
  std::vector<StepOutcome> steps;
  nlohmann::json summary;
  bool expectations_met = true;
};

// Builds an engine over in-memory tokens and mock feeds from a JSON scenario
// and replays its steps in order.
//
// {
//   "engine": "0xengine", "start_time": 1700000000, "auto_approve": true,
//   "synthetic": {"symbol": "DSC", "address": "0xdsc"},
//   "assets": [{"symbol": "WETH", "address": "0xweth", "feed": "0xfeed1", "price": "2000"}],
//   "accounts": [{"name": "alice", "address": "0xa11ce", "balances": {"WETH": "10"}}],
//   "steps": [{"action": "deposit_and_mint", "account": "alice", "asset": "WETH",
//              "amount": "10", "mint": "5000"}, ...]
// }
//
// Actions: approve, deposit, mint, deposit_and_mint, redeem, redeem_for_debt,
// burn, liquidate, set_price, set_price_timestamp, advance_time, transfer,
// assert_health. Any step may carry "expect_error": "<ErrorCode name>".
class ScenarioRunner {
public:
  explicit ScenarioRunner(const nlohmann::json& scenario);
  ScenarioRunner(const ScenarioRunner&) = delete;
  ScenarioRunner& operator=(const ScenarioRunner&) = delete;

  // Throws std::runtime_error when the file is missing or not valid JSON
  static nlohmann::json LoadFile(const std::string& path);

  ScenarioResult Run();
  nlohmann::json Summary() const;

  void SetAuditLog(CsvLogger* audit) { audit_ = audit; }
  CollateralEngine& Engine() { return *engine_; }
  InMemoryToken& Token(const std::string& symbol);
  MockPriceFeed& Feed(const std::string& symbol);
  Address ResolveAccount(const std::string& name_or_address) const;
  Timestamp Now() const { return now_; }

private:
  StepOutcome RunStep(size_t index, const nlohmann::json& step);
  void ExecuteAction(const std::string& action, const nlohmann::json& step);
  void ExecuteLiquidation(const nlohmann::json& step);
  const std::string& AssetAddress(const std::string& symbol);
  void ApproveEngine(const std::string& symbol, const Address& owner, const Amount& amount);

  Timestamp now_ = 0;
  Address engine_address_;
  bool auto_approve_ = true;
  std::string synthetic_symbol_;
  std::vector<std::string> asset_symbols_;
  std::unordered_map<std::string, std::unique_ptr<InMemoryToken>> tokens_;
  std::unordered_map<std::string, std::unique_ptr<MockPriceFeed>> feeds_;
  std::vector<std::pair<std::string, Address>> accounts_;
  std::unique_ptr<CollateralEngine> engine_;
  CsvLogger* audit_ = nullptr;
  nlohmann::json steps_;
};
