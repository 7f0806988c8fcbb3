#pragma once
#include <string>
#include "common/types.hpp"

// Converts base-asset units into stable-asset units.
class ExchangeRouter {
public:
  virtual ~ExchangeRouter() = default;
  // Converts exactly amount_in on behalf of recipient and returns the stable
  // output. Throws ExternalFailure (insufficient liquidity, slippage, transport)
  // instead of returning a degraded result.
  virtual Amount Convert(const UserId& recipient, const Amount& amount_in) = 0;
};

// A fully built router call awaiting signing and submission.
struct SwapRequest {
  std::string router;
  std::string calldata;
  Amount value = 0;          // native value attached to the call
  Amount amount_out_min = 0;
  UserId recipient;
};

// Signs, submits and awaits a swap; returns the stable amount actually received.
// Wallet management lives behind this interface.
class SwapSubmitter {
public:
  virtual ~SwapSubmitter() = default;
  virtual Amount Submit(const SwapRequest& request) = 0;
};
