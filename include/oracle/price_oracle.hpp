#pragma once
#include "common/types.hpp"
#include "oracle/price_feed.hpp"

// Converts between token amounts and USD value (both 18 decimals) using
// FEED_DECIMALS feed quotes.
//
// UsdValue deliberately skips the staleness check: it backs aggregate
// valuation (health factor) where a momentarily old quote is tolerated.
// TokenAmountFromUsd sizes liquidation seizures and rejects any quote that is
// non-positive or older than STALENESS_TIMEOUT_SECONDS.
class PriceOracle {
public:
  static Amount UsdValue(const PriceFeedHandle& feed, const Amount& amount);
  static Amount TokenAmountFromUsd(const PriceFeedHandle& feed, const Amount& usd_amount, Timestamp now);
  // Latest quote, or OracleError (InvalidPrice / StalePrice)
  static PriceQuote CheckedLatestQuote(const PriceFeedHandle& feed, Timestamp now);
  static bool IsStale(const PriceQuote& quote, Timestamp now);
};
