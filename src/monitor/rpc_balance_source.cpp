#include "monitor/rpc_balance_source.hpp"
#include "node_connection/rpc_client.hpp"
#include "common/fixed_point.hpp"
#include "common/errors.hpp"

Amount RpcBalanceSource::BalanceOf(const UserId& user) {
  const std::string hex = rpc_.EthGetBalance(user, block_tag_);
  try {
    return FixedPoint::ParseHexQuantity(hex);
  } catch (const InvalidParameter& e) {
    throw ExternalFailure("eth_getBalance(" + user + "): " + e.what());
  }
}
