#include "oracle/chainlink_price_feed.hpp"
#include "node_connection/rpc_client.hpp"
#include "crypto/keccak.hpp"
#include "utils/abi.hpp"
#include "utils/hex.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <chrono>

ChainlinkPriceFeed::ChainlinkPriceFeed(RpcClient& rpc, const std::string& feed_address, long long max_age_s)
  : rpc_(rpc), feed_(NormalizeAddress(feed_address)), max_age_s_(max_age_s) {}

int ChainlinkPriceFeed::Decimals() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (decimals_ >= 0) return decimals_;
  static const std::string selector = Crypto::FunctionSelector("decimals()");
  auto words = Abi::SplitWords(rpc_.EthCall(feed_, selector));
  if (words.empty()) throw ExternalFailure("decimals() returned no data from " + feed_);
  Amount d = Abi::DecodeUint(words[0]);
  if (d > 77) throw ExternalFailure("implausible feed decimals " + d.str());
  decimals_ = static_cast<int>(d);
  Logger::Info("Price feed " + feed_ + " reports " + std::to_string(decimals_) + " decimals");
  return decimals_;
}

Amount ChainlinkPriceFeed::GetPrice() {
  // (roundId, answer, startedAt, updatedAt, answeredInRound)
  static const std::string selector = Crypto::FunctionSelector("latestRoundData()");
  auto words = Abi::SplitWords(rpc_.EthCall(feed_, selector));
  if (words.size() < 5) throw ExternalFailure("latestRoundData() returned " + std::to_string(words.size()) + " words");
  if (Abi::IsNegative(words[1])) throw ExternalFailure("negative price answer from " + feed_);
  Amount answer = Abi::DecodeUint(words[1]);
  if (answer == 0) throw ExternalFailure("zero price answer from " + feed_);
  if (max_age_s_ > 0) {
    Amount updated_at = Abi::DecodeUint(words[3]);
    long long now = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
    if (updated_at + Amount(static_cast<unsigned long long>(max_age_s_)) < Amount(static_cast<unsigned long long>(now)))
      throw ExternalFailure("stale price round from " + feed_ + " (updatedAt " + updated_at.str() + ")");
  }
  return answer;
}
