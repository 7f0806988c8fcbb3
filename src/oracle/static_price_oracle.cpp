#include "oracle/static_price_oracle.hpp"
#include "common/errors.hpp"

StaticPriceOracle::StaticPriceOracle(int decimals, const Amount& price)
  : decimals_(decimals), price_(price) {}

Amount StaticPriceOracle::GetPrice() {
  if (price_ == 0) throw ExternalFailure("no static price configured");
  return price_;
}
