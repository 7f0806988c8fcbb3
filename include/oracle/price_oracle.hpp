#pragma once
#include "common/types.hpp"

// Source of the base-asset market price. Implementations throw ExternalFailure
// when no trustworthy price is available.
class PriceOracle {
public:
  virtual ~PriceOracle() = default;
  // Latest price in fixed-point units with Decimals() fractional digits
  virtual Amount GetPrice() = 0;
  virtual int Decimals() const = 0;
};
