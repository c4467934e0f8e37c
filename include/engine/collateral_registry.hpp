#pragma once
#include "common/types.hpp"
#include "oracle/price_feed.hpp"
#include "protocols/token.hpp"
#include <unordered_map>
#include <vector>

struct CollateralAsset {
  Address asset;  // the collateral token's address
  PriceFeedHandle feed;
  TokenCapability token;
};

// Accepted collateral, fixed at construction. Iteration order is the
// configured order and is what liquidation walks.
class CollateralRegistry {
public:
  // Throws ValidationError on length mismatch, duplicates or empty addresses
  CollateralRegistry(std::vector<TokenCapability> tokens, std::vector<PriceFeedHandle> feeds);
  // Throws ValidationError(TokenNotAllowed) for unregistered assets
  const CollateralAsset& Get(const Address& asset) const;
  bool Contains(const Address& asset) const { return index_.count(asset) != 0; }
  const std::vector<CollateralAsset>& Assets() const { return assets_; }
  std::vector<Address> AssetIds() const;
  size_t Size() const { return assets_.size(); }
private:
  std::vector<CollateralAsset> assets_;
  std::unordered_map<Address, size_t> index_;
};
