#pragma once
#include <mutex>
#include <string>
#include "oracle/price_oracle.hpp"

class RpcClient;

// AggregatorV3Interface reader: decimals() once, latestRoundData() per call.
class ChainlinkPriceFeed : public PriceOracle {
public:
  // max_age_s > 0 rejects rounds whose updatedAt is older than that
  ChainlinkPriceFeed(RpcClient& rpc, const std::string& feed_address, long long max_age_s = 0);
  Amount GetPrice() override;
  // Fetched lazily; throws ExternalFailure if the feed cannot be read
  int Decimals() const override;
private:
  RpcClient& rpc_;
  std::string feed_;
  long long max_age_s_;
  mutable std::mutex mutex_;
  mutable int decimals_ = -1;
};
