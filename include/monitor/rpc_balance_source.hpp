#pragma once
#include <string>
#include "monitor/balance_source.hpp"

class RpcClient;

// Native balance of the user's own account (eth_getBalance at block_tag).
class RpcBalanceSource : public BalanceSource {
public:
  explicit RpcBalanceSource(RpcClient& rpc, const std::string& block_tag = "latest")
    : rpc_(rpc), block_tag_(block_tag) {}
  Amount BalanceOf(const UserId& user) override;
private:
  RpcClient& rpc_;
  std::string block_tag_;
};
