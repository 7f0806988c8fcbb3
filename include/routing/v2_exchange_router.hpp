#pragma once
#include <string>
#include <vector>
#include "routing/exchange_router.hpp"

class RpcClient;

struct V2RouterParams {
  std::string router;        // Uniswap V2-compatible router
  std::string wrapped_native; // WETH
  std::string stable;        // DAI
  unsigned int max_slippage_bps = 50;
  long long deadline_s = 180;
};

// Native -> stable swaps through a V2 router. Without a submitter the router
// runs in dry-run mode and reports the on-chain quote as the settled output.
class V2ExchangeRouter : public ExchangeRouter {
public:
  V2ExchangeRouter(RpcClient& rpc, const V2RouterParams& params, SwapSubmitter* submitter = nullptr);
  Amount Convert(const UserId& recipient, const Amount& amount_in) override;

  // getAmountsOut(amount_in, [wrapped_native, stable]) last element
  Amount Quote(const Amount& amount_in);

  static std::string BuildGetAmountsOutCall(const Amount& amount_in, const std::vector<std::string>& path);
  static std::string BuildSwapExactEthForTokensCall(const Amount& amount_out_min,
                                                    const std::vector<std::string>& path,
                                                    const std::string& to,
                                                    unsigned long long deadline);
  // amount * (10000 - bps) / 10000
  static Amount ApplySlippage(const Amount& quoted, unsigned int bps);
private:
  RpcClient& rpc_;
  V2RouterParams params_;
  SwapSubmitter* submitter_;
};
