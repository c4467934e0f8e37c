#pragma once
#include <cstdint>

namespace EngineConstants {
  // 18-decimal fixed-point scale used by the ledger
  inline constexpr unsigned PRECISION_DECIMALS = 18;
  inline constexpr uint64_t PRECISION = 1000000000000000000ULL;
  // Feeds quote USD with 8 decimals; multiply by this to reach 18
  inline constexpr unsigned FEED_DECIMALS = 8;
  inline constexpr uint64_t ADDITIONAL_FEED_PRECISION = 10000000000ULL;

  // 200% over-collateralized: only half of the collateral value counts
  inline constexpr uint64_t LIQUIDATION_THRESHOLD = 50;
  inline constexpr uint64_t LIQUIDATION_PRECISION = 100;
  inline constexpr uint64_t LIQUIDATION_BONUS = 10;   // percent on top of the repaid debt
  inline constexpr uint64_t CLOSE_FACTOR = 50;        // max percent of debt repaid per call
  inline constexpr uint64_t MIN_HEALTH_FACTOR = PRECISION;

  inline constexpr uint64_t STALENESS_TIMEOUT_SECONDS = 3 * 60 * 60;

  // Seizure must reach 99.99% of its USD target
  inline constexpr uint64_t SEIZURE_TOLERANCE_NUM = 9999;
  inline constexpr uint64_t SEIZURE_TOLERANCE_DEN = 10000;
}
