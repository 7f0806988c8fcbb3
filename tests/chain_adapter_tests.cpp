#include <boost/test/unit_test.hpp>
#include <chrono>
#include "fakes.hpp"
#include "crypto/keccak.hpp"
#include "monitor/rpc_balance_source.hpp"
#include "node_connection/rpc_client.hpp"
#include "oracle/chainlink_price_feed.hpp"
#include "oracle/static_price_oracle.hpp"
#include "routing/v2_exchange_router.hpp"
#include "utils/abi.hpp"

using namespace fakes;
using nlohmann::json;

namespace {

const std::string kFeed   = "0x5f4ec3df9cbd43714fe2740f5e3616155c5b8419";
const std::string kRouter = "0x7a250d5630b4cf539739df2c5dacb4c659f2488d";
const std::string kWeth   = "0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2";
const std::string kDai    = "0x6b175474e89094c44da98b954eedeac495271d0f";

long long NowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string RoundData(const std::string& answer_word, long long updated_at) {
  return "0x" + Abi::EncodeUint(Amount(1)) + answer_word + Abi::EncodeUint(Amount(updated_at)) +
         Abi::EncodeUint(Amount(updated_at)) + Abi::EncodeUint(Amount(1));
}

class RecordingSubmitter : public SwapSubmitter {
public:
  Amount Submit(const SwapRequest& request) override {
    requests.push_back(request);
    return received;
  }
  Amount received = 0;
  std::vector<SwapRequest> requests;
};

}

BOOST_AUTO_TEST_SUITE(chain_adapter_tests)

BOOST_AUTO_TEST_CASE(rpc_client_sends_auth_and_surfaces_errors) {
  FakeHttpClient http([](const std::string& method, const json&) -> json {
    if (method == "eth_chainId") return "0x1";
    throw std::runtime_error("method not found");
  });
  RpcClient rpc(http, "http://node", std::string("x-api-key: secret"));
  BOOST_CHECK_EQUAL(rpc.EthChainId(), "0x1");
  BOOST_CHECK_EQUAL(http.last_url, "http://node");
  BOOST_CHECK_EQUAL(http.last_headers.at("x-api-key"), "secret");
  BOOST_CHECK_THROW(rpc.Call("eth_blockNumber", json::array()), ExternalFailure);
  http.status = 503;
  BOOST_CHECK_THROW(rpc.EthChainId(), ExternalFailure);
  BOOST_CHECK_NE(http.requests[0]["id"], http.requests[1]["id"]);
}

BOOST_AUTO_TEST_CASE(balance_source_reads_native_balance) {
  FakeHttpClient http([](const std::string& method, const json& params) -> json {
    BOOST_CHECK_EQUAL(method, "eth_getBalance");
    BOOST_CHECK_EQUAL(params[1].get<std::string>(), "latest");
    if (params[0].get<std::string>() == kAlice) return "0xde0b6b3a7640000";
    return "garbage";
  });
  RpcClient rpc(http, "http://node");
  RpcBalanceSource source(rpc);
  BOOST_CHECK_EQUAL(source.BalanceOf(kAlice), Ether("1"));
  BOOST_CHECK_THROW(source.BalanceOf(kBob), ExternalFailure);
}

BOOST_AUTO_TEST_CASE(chainlink_feed_decodes_round) {
  std::string answer = Abi::EncodeUint(Amount("185025000000"));
  long long updated = NowSeconds();
  FakeHttpClient http([&](const std::string& method, const json& params) -> json {
    BOOST_CHECK_EQUAL(method, "eth_call");
    BOOST_CHECK_EQUAL(params[0]["to"].get<std::string>(), kFeed);
    const std::string data = params[0]["data"].get<std::string>();
    if (data == Crypto::FunctionSelector("decimals()")) return "0x" + Abi::EncodeUint(Amount(8));
    return RoundData(answer, updated);
  });
  RpcClient rpc(http, "http://node");
  ChainlinkPriceFeed feed(rpc, "0x5F4eC3Df9cbd43714FE2740f5E3616155c5b8419", 3600);
  BOOST_CHECK_EQUAL(feed.Decimals(), 8);
  BOOST_CHECK_EQUAL(feed.Decimals(), 8);
  BOOST_CHECK_EQUAL(http.requests.size(), 1u);
  BOOST_CHECK_EQUAL(feed.GetPrice(), Amount("185025000000"));

  answer = std::string(64, 'f');
  BOOST_CHECK_THROW(feed.GetPrice(), ExternalFailure);
  answer = Abi::EncodeUint(Amount(0));
  BOOST_CHECK_THROW(feed.GetPrice(), ExternalFailure);
  answer = Abi::EncodeUint(Amount(100));
  updated = NowSeconds() - 7200;
  BOOST_CHECK_THROW(feed.GetPrice(), ExternalFailure);
}

BOOST_AUTO_TEST_CASE(static_oracle_requires_a_price) {
  StaticPriceOracle unset(8);
  BOOST_CHECK_EQUAL(unset.Decimals(), 8);
  BOOST_CHECK_THROW(unset.GetPrice(), ExternalFailure);
  StaticPriceOracle fixed(8, Amount(42));
  BOOST_CHECK_EQUAL(fixed.GetPrice(), Amount(42));
}

BOOST_AUTO_TEST_CASE(v2_router_quotes_and_submits) {
  Amount quote = Amount("500000000000000");
  FakeHttpClient http([&](const std::string&, const json& params) -> json {
    BOOST_CHECK_EQUAL(params[0]["to"].get<std::string>(), kRouter);
    const std::string data = params[0]["data"].get<std::string>();
    BOOST_CHECK_EQUAL(data.substr(0, 10), "0xd06ca61f");
    BOOST_CHECK(data.find(Abi::EncodeAddress(kWeth) + Abi::EncodeAddress(kDai)) != std::string::npos);
    return "0x" + Abi::EncodeUint(Amount(0x20)) + Abi::EncodeUint(Amount(2)) +
           data.substr(10, 64) + Abi::EncodeUint(quote);
  });
  RpcClient rpc(http, "http://node");
  V2RouterParams params;
  params.router = kRouter;
  params.wrapped_native = kWeth;
  params.stable = kDai;
  params.max_slippage_bps = 100;

  V2ExchangeRouter dry(rpc, params);
  BOOST_CHECK_EQUAL(dry.Convert(kAlice, Ether("0.4")), quote);
  BOOST_CHECK_THROW(dry.Convert(kAlice, Amount(0)), InvalidParameter);

  RecordingSubmitter submitter;
  V2ExchangeRouter live(rpc, params, &submitter);
  submitter.received = quote;
  BOOST_CHECK_EQUAL(live.Convert(kAlice, Ether("0.4")), quote);
  BOOST_REQUIRE_EQUAL(submitter.requests.size(), 1u);
  const auto& req = submitter.requests[0];
  BOOST_CHECK_EQUAL(req.value, Ether("0.4"));
  BOOST_CHECK_EQUAL(req.amount_out_min, quote * 99 / 100);
  BOOST_CHECK_EQUAL(req.calldata.substr(0, 10), "0x7ff36ab5");

  submitter.received = quote / 2;
  BOOST_CHECK_THROW(live.Convert(kAlice, Ether("0.4")), ExternalFailure);

  quote = 0;
  BOOST_CHECK_THROW(dry.Convert(kAlice, Ether("0.4")), ExternalFailure);
}

BOOST_AUTO_TEST_CASE(slippage_floor) {
  BOOST_CHECK_EQUAL(V2ExchangeRouter::ApplySlippage(Amount(10000), 50), Amount(9950));
  BOOST_CHECK_EQUAL(V2ExchangeRouter::ApplySlippage(Amount(10000), 10000), Amount(0));
}

BOOST_AUTO_TEST_SUITE_END()
