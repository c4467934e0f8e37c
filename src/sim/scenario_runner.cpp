#include "sim/scenario_runner.hpp"
#include "telemetry/csv_logger.hpp"
#include "constants/engine.hpp"
#include "common/errors.hpp"
#include "common/fixed_point.hpp"
#include "common/logger.hpp"
#include <fstream>
#include <limits>
#include <stdexcept>

static std::string RequireString(const nlohmann::json& obj, const char* key) {
  if (!obj.contains(key) || !obj[key].is_string()) {
    throw std::invalid_argument(std::string("missing string field '") + key + "'");
  }
  return obj[key].get<std::string>();
}

static Amount RequireAmount(const nlohmann::json& obj, const char* key) {
  return FixedPoint::Parse(RequireString(obj, key), EngineConstants::PRECISION_DECIMALS);
}

// "2000.5" -> 200050000000 (FEED_DECIMALS); a leading '-' is kept
static int64_t ParseFeedPrice(const std::string& text) {
  bool negative = !text.empty() && text[0] == '-';
  Amount magnitude = FixedPoint::Parse(negative ? text.substr(1) : text, EngineConstants::FEED_DECIMALS);
  if (magnitude > Amount(static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))) throw std::invalid_argument("price out of range: " + text);
  int64_t v = static_cast<int64_t>(magnitude.convert_to<uint64_t>());
  return negative ? -v : v;
}

static std::string FormatHealthFactor(const Amount& hf) {
  if (hf == HealthFactorCalculator::Max()) return "max";
  return FixedPoint::Format(hf);
}

nlohmann::json ScenarioRunner::LoadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) throw std::runtime_error("cannot open scenario file: " + path);
  auto j = nlohmann::json::parse(in, nullptr, false);
  if (j.is_discarded()) throw std::runtime_error("scenario file is not valid JSON: " + path);
  return j;
}

ScenarioRunner::ScenarioRunner(const nlohmann::json& scenario) {
  if (!scenario.is_object()) throw std::invalid_argument("scenario must be a JSON object");
  engine_address_ = scenario.value("engine", std::string("0xengine"));
  now_ = scenario.value("start_time", static_cast<Timestamp>(1700000000));
  auto_approve_ = scenario.value("auto_approve", true);
  steps_ = scenario.value("steps", nlohmann::json::array());

  const nlohmann::json synthetic = scenario.value("synthetic", nlohmann::json{{"symbol", "DSC"}, {"address", "0xdsc"}});
  synthetic_symbol_ = RequireString(synthetic, "symbol");
  tokens_[synthetic_symbol_].reset(new InMemoryToken(synthetic_symbol_, RequireString(synthetic, "address"), engine_address_));

  std::vector<TokenCapability> collateral_tokens;
  std::vector<PriceFeedHandle> feeds;
  for (const auto& a : scenario.value("assets", nlohmann::json::array())) {
    std::string symbol = RequireString(a, "symbol");
    if (tokens_.count(symbol)) throw std::invalid_argument("duplicate token symbol: " + symbol);
    tokens_[symbol].reset(new InMemoryToken(symbol, RequireString(a, "address"), Address()));
    feeds_[symbol].reset(new MockPriceFeed(RequireString(a, "feed"), EngineConstants::FEED_DECIMALS,
                                           ParseFeedPrice(RequireString(a, "price")), now_));
    asset_symbols_.push_back(symbol);
    collateral_tokens.push_back(tokens_[symbol]->CapabilityFor(engine_address_));
    feeds.push_back(feeds_[symbol]->Handle());
  }

  for (const auto& acct : scenario.value("accounts", nlohmann::json::array())) {
    std::string name = RequireString(acct, "name");
    Address address = acct.value("address", name);
    accounts_.emplace_back(name, address);
    for (const auto& bal : acct.value("balances", nlohmann::json::object()).items()) {
      Token(bal.key()).Faucet(address, FixedPoint::Parse(bal.value().get<std::string>()));
    }
  }

  engine_.reset(new CollateralEngine(engine_address_, std::move(collateral_tokens), std::move(feeds),
                                     tokens_[synthetic_symbol_]->CapabilityFor(engine_address_),
                                     [this]() { return now_; }));
}

InMemoryToken& ScenarioRunner::Token(const std::string& symbol) {
  auto it = tokens_.find(symbol);
  if (it == tokens_.end()) throw std::invalid_argument("unknown token: " + symbol);
  return *it->second;
}

MockPriceFeed& ScenarioRunner::Feed(const std::string& symbol) {
  auto it = feeds_.find(symbol);
  if (it == feeds_.end()) throw std::invalid_argument("unknown price feed for: " + symbol);
  return *it->second;
}

Address ScenarioRunner::ResolveAccount(const std::string& name_or_address) const {
  for (const auto& kv : accounts_) {
    if (kv.first == name_or_address) return kv.second;
  }
  return name_or_address;
}

const std::string& ScenarioRunner::AssetAddress(const std::string& symbol) {
  return Token(symbol).GetAddress();
}

void ScenarioRunner::ApproveEngine(const std::string& symbol, const Address& owner, const Amount& amount) {
  if (!auto_approve_) return;
  InMemoryToken& token = Token(symbol);
  token.Approve(owner, engine_address_, token.Allowance(owner, engine_address_) + amount);
}

ScenarioResult ScenarioRunner::Run() {
  ScenarioResult result;
  for (size_t i = 0; i < steps_.size(); ++i) {
    StepOutcome outcome = RunStep(i, steps_[i]);
    if (!outcome.expectation_met) result.expectations_met = false;
    result.steps.push_back(outcome);
  }
  result.summary = Summary();
  nlohmann::json steps = nlohmann::json::array();
  for (const auto& s : result.steps) {
    nlohmann::json js = {{"index", s.index}, {"action", s.action}, {"ok", s.ok}, {"expectation_met", s.expectation_met}};
    if (!s.ok) {
      js["error"] = s.error_code;
      js["message"] = s.message;
    }
    steps.push_back(js);
  }
  result.summary["steps"] = steps;
  result.summary["expectations_met"] = result.expectations_met;
  return result;
}

StepOutcome ScenarioRunner::RunStep(size_t index, const nlohmann::json& step) {
  StepOutcome outcome;
  outcome.index = index;
  outcome.action = step.value("action", std::string());
  const std::string expected = step.value("expect_error", std::string());
  try {
    ExecuteAction(outcome.action, step);
  } catch (const EngineError& e) {
    outcome.ok = false;
    outcome.error_code = ErrorCodeName(e.Code());
    outcome.message = e.what();
  } catch (const std::invalid_argument& e) {
    outcome.ok = false;
    outcome.error_code = "InvalidStep";
    outcome.message = e.what();
  } catch (const nlohmann::json::exception& e) {
    outcome.ok = false;
    outcome.error_code = "InvalidStep";
    outcome.message = e.what();
  }
  if (expected.empty()) {
    outcome.expectation_met = outcome.ok;
  } else {
    outcome.expectation_met = !outcome.ok && outcome.error_code == expected;
  }
  if (!outcome.expectation_met) {
    Logger::Warning("Step " + std::to_string(index) + " (" + outcome.action + ") expected " +
                    (expected.empty() ? std::string("success") : expected) + ", got " +
                    (outcome.ok ? std::string("success") : outcome.message));
  }
  return outcome;
}

void ScenarioRunner::ExecuteAction(const std::string& action, const nlohmann::json& step) {
  if (action == "approve") {
    Address owner = ResolveAccount(RequireString(step, "account"));
    Address spender = step.contains("spender") ? ResolveAccount(RequireString(step, "spender")) : engine_address_;
    Token(RequireString(step, "token")).Approve(owner, spender, RequireAmount(step, "amount"));
  } else if (action == "transfer") {
    Address from = ResolveAccount(RequireString(step, "account"));
    Address to = ResolveAccount(RequireString(step, "to"));
    if (!Token(RequireString(step, "token")).Transfer(from, to, RequireAmount(step, "amount"))) {
      ThrowEngineError(ErrorCode::TransferFailed, "wallet transfer " + from + " -> " + to);
    }
  } else if (action == "deposit") {
    Address user = ResolveAccount(RequireString(step, "account"));
    std::string asset = RequireString(step, "asset");
    Amount amount = RequireAmount(step, "amount");
    ApproveEngine(asset, user, amount);
    engine_->DepositCollateral(user, AssetAddress(asset), amount);
  } else if (action == "mint") {
    engine_->MintDebt(ResolveAccount(RequireString(step, "account")), RequireAmount(step, "amount"));
  } else if (action == "deposit_and_mint") {
    Address user = ResolveAccount(RequireString(step, "account"));
    std::string asset = RequireString(step, "asset");
    Amount amount = RequireAmount(step, "amount");
    ApproveEngine(asset, user, amount);
    engine_->DepositCollateralAndMintDebt(user, AssetAddress(asset), amount, RequireAmount(step, "mint"));
  } else if (action == "redeem") {
    engine_->RedeemCollateral(ResolveAccount(RequireString(step, "account")),
                              AssetAddress(RequireString(step, "asset")), RequireAmount(step, "amount"));
  } else if (action == "redeem_for_debt") {
    Address user = ResolveAccount(RequireString(step, "account"));
    Amount burn = RequireAmount(step, "burn");
    ApproveEngine(synthetic_symbol_, user, burn);
    engine_->RedeemCollateralForDebt(user, AssetAddress(RequireString(step, "asset")), RequireAmount(step, "amount"), burn);
  } else if (action == "burn") {
    Address user = ResolveAccount(RequireString(step, "account"));
    Amount amount = RequireAmount(step, "amount");
    ApproveEngine(synthetic_symbol_, user, amount);
    engine_->BurnDebt(user, amount);
  } else if (action == "liquidate") {
    ExecuteLiquidation(step);
  } else if (action == "set_price") {
    Feed(RequireString(step, "asset")).UpdateAnswer(ParseFeedPrice(RequireString(step, "price")), now_);
  } else if (action == "set_price_timestamp") {
    // Re-publishes the current answer with an explicit update time
    MockPriceFeed& feed = Feed(RequireString(step, "asset"));
    PriceQuote q = feed.LatestQuote();
    Timestamp updated = step.value("updated_at", now_);
    feed.UpdateRoundData(q.round_id + 1, q.price, updated, updated);
  } else if (action == "advance_time") {
    now_ += step.value("seconds", static_cast<Timestamp>(0));
  } else if (action == "assert_health") {
    Address user = ResolveAccount(RequireString(step, "account"));
    Amount hf = engine_->GetHealthFactor(user);
    if (step.contains("min") && hf < RequireAmount(step, "min")) {
      ThrowEngineError(ErrorCode::BreaksHealthFactor, user + " health factor " + FormatHealthFactor(hf) + " below asserted minimum");
    }
    if (step.contains("max") && hf > RequireAmount(step, "max")) {
      ThrowEngineError(ErrorCode::HealthFactorOk, user + " health factor " + FormatHealthFactor(hf) + " above asserted maximum");
    }
  } else {
    throw std::invalid_argument("unknown action '" + action + "'");
  }
}

void ScenarioRunner::ExecuteLiquidation(const nlohmann::json& step) {
  Address liquidator = ResolveAccount(RequireString(step, "account"));
  Address user = ResolveAccount(RequireString(step, "user"));
  Amount amount = RequireAmount(step, "amount");
  ApproveEngine(synthetic_symbol_, liquidator, amount);
  try {
    LiquidationReport report = engine_->Liquidate(liquidator, user, amount);
    if (audit_) audit_->LogLiquidationSuccess(CsvLogger::FromReport(report, engine_address_));
  } catch (const EngineError& e) {
    if (audit_) {
      LiquidationRecord record;
      record.liquidator = liquidator;
      record.user = user;
      record.requested_cover = FixedPoint::Format(amount);
      record.engine_address = engine_address_;
      audit_->LogLiquidationFailure(record, ErrorCodeName(e.Code()));
    }
    throw;
  }
}

nlohmann::json ScenarioRunner::Summary() const {
  nlohmann::json accounts = nlohmann::json::array();
  for (const auto& kv : accounts_) {
    const Address& address = kv.second;
    AccountInformation info = engine_->GetAccountInformation(address);
    nlohmann::json collateral = nlohmann::json::object();
    nlohmann::json wallet = nlohmann::json::object();
    for (const auto& symbol : asset_symbols_) {
      const InMemoryToken& token = *tokens_.at(symbol);
      collateral[symbol] = FixedPoint::Format(engine_->GetCollateralBalanceOfUser(address, token.GetAddress()));
      wallet[symbol] = FixedPoint::Format(token.BalanceOf(address));
    }
    wallet[synthetic_symbol_] = FixedPoint::Format(tokens_.at(synthetic_symbol_)->BalanceOf(address));
    accounts.push_back({
      {"name", kv.first}, {"address", address},
      {"debt", FixedPoint::Format(info.total_debt)},
      {"collateral_value_usd", FixedPoint::Format(info.collateral_value_usd)},
      {"health_factor", FormatHealthFactor(engine_->GetHealthFactor(address))},
      {"collateral", collateral}, {"wallet", wallet}});
  }
  nlohmann::json custody = nlohmann::json::object();
  for (const auto& symbol : asset_symbols_) {
    const InMemoryToken& token = *tokens_.at(symbol);
    custody[symbol] = {{"ledger", FixedPoint::Format(engine_->GetTotalCollateral(token.GetAddress()))},
                       {"held", FixedPoint::Format(token.BalanceOf(engine_address_))}};
  }
  return {
    {"engine", engine_address_}, {"time", now_}, {"accounts", accounts},
    {"total_debt", FixedPoint::Format(engine_->GetTotalDebt())},
    {"synthetic_supply", FixedPoint::Format(tokens_.at(synthetic_symbol_)->TotalSupply())},
    {"custody", custody}};
}
