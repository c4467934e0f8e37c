#include "oracle/price_feed.hpp"
#include <stdexcept>
#include <string>

MockPriceFeed::MockPriceFeed(Address address, uint8_t decimals, int64_t initial_answer, Timestamp now)
  : address_(std::move(address)), decimals_(decimals) {
  UpdateAnswer(initial_answer, now);
}

void MockPriceFeed::UpdateAnswer(int64_t answer, Timestamp now) {
  UpdateRoundData(latest_round_ + 1, answer, now, now);
}

void MockPriceFeed::UpdateRoundData(uint64_t round_id, int64_t answer, Timestamp started_at, Timestamp updated_at) {
  PriceQuote q;
  q.round_id = round_id;
  q.price = answer;
  q.started_at = started_at;
  q.updated_at = updated_at;
  q.answered_in_round = round_id;
  rounds_[round_id] = q;
  latest_round_ = round_id;
}

PriceQuote MockPriceFeed::LatestQuote() const {
  return rounds_.at(latest_round_);
}

PriceQuote MockPriceFeed::GetRoundData(uint64_t round_id) const {
  auto it = rounds_.find(round_id);
  if (it == rounds_.end()) throw std::out_of_range("no data for round " + std::to_string(round_id));
  return it->second;
}

PriceFeedHandle MockPriceFeed::Handle() {
  return PriceFeedHandle{address_, [this]() { return LatestQuote(); }};
}
