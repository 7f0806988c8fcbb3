#pragma once
#include "oracle/price_oracle.hpp"

// Operator-supplied price (PRICE_OVERRIDE) for dry runs and local forks.
class StaticPriceOracle : public PriceOracle {
public:
  explicit StaticPriceOracle(int decimals, const Amount& price = 0);
  Amount GetPrice() override;
  int Decimals() const override { return decimals_; }
private:
  const int decimals_;
  const Amount price_;
};
