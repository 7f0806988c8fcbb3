#include "routing/v2_exchange_router.hpp"
#include "node_connection/rpc_client.hpp"
#include "crypto/keccak.hpp"
#include "utils/abi.hpp"
#include "utils/hex.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <chrono>

V2ExchangeRouter::V2ExchangeRouter(RpcClient& rpc, const V2RouterParams& params, SwapSubmitter* submitter)
  : rpc_(rpc), params_(params), submitter_(submitter) {
  params_.router = NormalizeAddress(params.router);
  params_.wrapped_native = NormalizeAddress(params.wrapped_native);
  params_.stable = NormalizeAddress(params.stable);
  if (params_.max_slippage_bps > 10000) throw InvalidParameter("slippage above 100%");
}

std::string V2ExchangeRouter::BuildGetAmountsOutCall(const Amount& amount_in, const std::vector<std::string>& path) {
  static const std::string selector = Crypto::FunctionSelector("getAmountsOut(uint256,address[])");
  std::string out = selector;
  out += Abi::EncodeUint(amount_in);
  // path offset: two head slots
  out += Abi::EncodeUint(0x40);
  out += Abi::EncodeUint(path.size());
  for (const auto& p : path) out += Abi::EncodeAddress(p);
  return out;
}

std::string V2ExchangeRouter::BuildSwapExactEthForTokensCall(const Amount& amount_out_min,
                                                             const std::vector<std::string>& path,
                                                             const std::string& to,
                                                             unsigned long long deadline) {
  static const std::string selector = Crypto::FunctionSelector("swapExactETHForTokens(uint256,address[],address,uint256)");
  std::string out = selector;
  out += Abi::EncodeUint(amount_out_min);
  // path offset: four head slots
  out += Abi::EncodeUint(0x80);
  out += Abi::EncodeAddress(to);
  out += Abi::EncodeUint(deadline);
  out += Abi::EncodeUint(path.size());
  for (const auto& p : path) out += Abi::EncodeAddress(p);
  return out;
}

Amount V2ExchangeRouter::ApplySlippage(const Amount& quoted, unsigned int bps) {
  if (bps >= 10000) return 0;
  return quoted * (10000u - bps) / 10000u;
}

Amount V2ExchangeRouter::Quote(const Amount& amount_in) {
  const std::vector<std::string> path{ params_.wrapped_native, params_.stable };
  auto words = Abi::SplitWords(rpc_.EthCall(params_.router, BuildGetAmountsOutCall(amount_in, path)));
  // offset, length, amounts[0..n)
  if (words.size() < 2 + path.size()) throw ExternalFailure("getAmountsOut returned " + std::to_string(words.size()) + " words");
  return Abi::DecodeUint(words.back());
}

Amount V2ExchangeRouter::Convert(const UserId& recipient, const Amount& amount_in) {
  if (amount_in == 0) throw InvalidParameter("conversion amount must be positive");
  const Amount quoted = Quote(amount_in);
  if (quoted == 0) throw ExternalFailure("insufficient liquidity for " + amount_in.str() + " wei");
  const Amount out_min = ApplySlippage(quoted, params_.max_slippage_bps);
  if (!submitter_) {
    Logger::Info("Dry-run swap " + amount_in.str() + " wei -> " + quoted.str() + " for " + recipient);
    return quoted;
  }
  const auto deadline = static_cast<unsigned long long>(
    std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count() +
    params_.deadline_s);
  SwapRequest req;
  req.router = params_.router;
  req.calldata = BuildSwapExactEthForTokensCall(out_min, { params_.wrapped_native, params_.stable }, recipient, deadline);
  req.value = amount_in;
  req.amount_out_min = out_min;
  req.recipient = recipient;
  const Amount received = submitter_->Submit(req);
  if (received < out_min)
    throw ExternalFailure("slippage violation: received " + received.str() + " < min " + out_min.str());
  return received;
}
