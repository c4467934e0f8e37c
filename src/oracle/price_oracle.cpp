#include "oracle/price_oracle.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "constants/engine.hpp"
#include <string>

static PriceQuote FetchQuote(const PriceFeedHandle& feed) {
  if (!feed.latest_quote) ThrowEngineError(ErrorCode::InvalidPrice, "feed " + feed.address + " is not connected");
  return feed.latest_quote();
}

bool PriceOracle::IsStale(const PriceQuote& quote, Timestamp now) {
  if (quote.updated_at == 0 || quote.answered_in_round < quote.round_id) return true;
  if (now < quote.updated_at) return false;  // feed clock ahead of ours
  return now - quote.updated_at > EngineConstants::STALENESS_TIMEOUT_SECONDS;
}

PriceQuote PriceOracle::CheckedLatestQuote(const PriceFeedHandle& feed, Timestamp now) {
  PriceQuote q = FetchQuote(feed);
  if (q.price <= 0) {
    Logger::Warning("Rejecting non-positive price " + std::to_string(q.price) + " from feed " + feed.address);
    ThrowEngineError(ErrorCode::InvalidPrice, "feed " + feed.address + " answered " + std::to_string(q.price));
  }
  if (IsStale(q, now)) {
    Logger::Warning("Rejecting stale quote from feed " + feed.address + " updated_at=" + std::to_string(q.updated_at) +
                    " now=" + std::to_string(now));
    ThrowEngineError(ErrorCode::StalePrice, "feed " + feed.address + " last updated at " + std::to_string(q.updated_at));
  }
  return q;
}

Amount PriceOracle::UsdValue(const PriceFeedHandle& feed, const Amount& amount) {
  PriceQuote q = FetchQuote(feed);
  // No staleness check on this path. A negative answer has no unsigned value.
  if (q.price < 0) ThrowEngineError(ErrorCode::InvalidPrice, "feed " + feed.address + " answered " + std::to_string(q.price));
  Amount price = Amount(static_cast<uint64_t>(q.price)) * EngineConstants::ADDITIONAL_FEED_PRECISION;
  return price * amount / EngineConstants::PRECISION;
}

Amount PriceOracle::TokenAmountFromUsd(const PriceFeedHandle& feed, const Amount& usd_amount, Timestamp now) {
  PriceQuote q = CheckedLatestQuote(feed, now);
  Amount price = Amount(static_cast<uint64_t>(q.price)) * EngineConstants::ADDITIONAL_FEED_PRECISION;
  return usd_amount * EngineConstants::PRECISION / price;
}
