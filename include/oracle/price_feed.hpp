#pragma once
#include "common/types.hpp"
#include <functional>
#include <map>

// Latest round of an aggregator feed. price carries FEED_DECIMALS decimals.
struct PriceQuote {
  uint64_t round_id = 0;
  int64_t price = 0;
  Timestamp started_at = 0;
  Timestamp updated_at = 0;
  uint64_t answered_in_round = 0;
};

// Read-only handle to an external price feed.
struct PriceFeedHandle {
  Address address;
  std::function<PriceQuote()> latest_quote;
};

// In-process aggregator used by the simulator and tests. Each update opens a
// new round. Handles returned by Handle() reference this object and must not
// outlive it.
class MockPriceFeed {
public:
  MockPriceFeed(Address address, uint8_t decimals, int64_t initial_answer, Timestamp now);
  void UpdateAnswer(int64_t answer, Timestamp now);
  void UpdateRoundData(uint64_t round_id, int64_t answer, Timestamp started_at, Timestamp updated_at);
  PriceQuote LatestQuote() const;
  // Throws std::out_of_range for unknown rounds
  PriceQuote GetRoundData(uint64_t round_id) const;
  uint8_t Decimals() const { return decimals_; }
  const Address& GetAddress() const { return address_; }
  PriceFeedHandle Handle();
private:
  Address address_;
  uint8_t decimals_;
  uint64_t latest_round_ = 0;
  std::map<uint64_t, PriceQuote> rounds_;
};
