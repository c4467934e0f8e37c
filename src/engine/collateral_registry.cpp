#include "engine/collateral_registry.hpp"
#include "common/errors.hpp"
#include <string>

CollateralRegistry::CollateralRegistry(std::vector<TokenCapability> tokens, std::vector<PriceFeedHandle> feeds) {
  if (tokens.size() != feeds.size()) {
    ThrowEngineError(ErrorCode::TokenAndPriceFeedLengthMismatch,
                     std::to_string(tokens.size()) + " tokens, " + std::to_string(feeds.size()) + " feeds");
  }
  assets_.reserve(tokens.size());
  for (size_t i = 0; i < tokens.size(); ++i) {
    if (tokens[i].address.empty() || feeds[i].address.empty()) {
      ThrowEngineError(ErrorCode::TokenNotAllowed, "empty address at collateral index " + std::to_string(i));
    }
    if (!index_.emplace(tokens[i].address, i).second) {
      ThrowEngineError(ErrorCode::DuplicateCollateralToken, tokens[i].address);
    }
    Address asset = tokens[i].address;
    assets_.push_back(CollateralAsset{asset, std::move(feeds[i]), std::move(tokens[i])});
  }
}

const CollateralAsset& CollateralRegistry::Get(const Address& asset) const {
  auto it = index_.find(asset);
  if (it == index_.end()) ThrowEngineError(ErrorCode::TokenNotAllowed, asset);
  return assets_[it->second];
}

std::vector<Address> CollateralRegistry::AssetIds() const {
  std::vector<Address> ids;
  ids.reserve(assets_.size());
  for (const auto& a : assets_) ids.push_back(a.asset);
  return ids;
}
