#pragma once
#include <functional>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/errors.hpp"
#include "common/fixed_point.hpp"
#include "common/types.hpp"
#include "monitor/balance_source.hpp"
#include "net/http_client.hpp"
#include "oracle/price_oracle.hpp"
#include "routing/exchange_router.hpp"

namespace fakes {

const UserId kAlice = "0x00000000000000000000000000000000000000a1";
const UserId kBob   = "0x00000000000000000000000000000000000000b2";
const UserId kCarol = "0x00000000000000000000000000000000000000c3";

inline Amount Ether(const std::string& s) { return FixedPoint::Parse(s, 18); }

class FakePriceOracle : public PriceOracle {
public:
  explicit FakePriceOracle(const Amount& p, int d = 8) : price(p), decimals(d) {}
  Amount GetPrice() override {
    ++calls;
    if (fail) throw ExternalFailure("oracle unavailable");
    return price;
  }
  int Decimals() const override { return decimals; }

  Amount price;
  int decimals;
  bool fail = false;
  int calls = 0;
};

class FakeExchangeRouter : public ExchangeRouter {
public:
  Amount Convert(const UserId& recipient, const Amount& amount_in) override {
    calls.emplace_back(recipient, amount_in);
    if (failing.count(recipient)) throw ExternalFailure("insufficient liquidity");
    return output;
  }

  Amount output = Amount("500000000000000");
  std::set<UserId> failing;
  std::vector<std::pair<UserId, Amount>> calls;
};

class FakeBalanceSource : public BalanceSource {
public:
  Amount BalanceOf(const UserId& user) override {
    ++calls;
    if (failing.count(user)) throw ExternalFailure("balance unavailable for " + user);
    auto it = balances.find(user);
    return it == balances.end() ? Amount(0) : it->second;
  }
  void Credit(const UserId& user, const Amount& amount) { balances[user] += amount; }
  void Debit(const UserId& user, const Amount& amount) { balances[user] -= amount; }

  std::map<UserId, Amount> balances;
  std::set<UserId> failing;
  int calls = 0;
};

// Answers JSON-RPC requests through a handler(method, params) -> result.
class FakeHttpClient : public HttpClient {
public:
  using Handler = std::function<nlohmann::json(const std::string&, const nlohmann::json&)>;
  explicit FakeHttpClient(Handler handler) : handler_(std::move(handler)) {}

  HttpResponse Post(const std::string& url,
                    const std::string& body,
                    const std::unordered_map<std::string, std::string>& headers,
                    int) override {
    last_url = url;
    last_headers = headers;
    requests.push_back(nlohmann::json::parse(body));
    HttpResponse resp;
    resp.status = status;
    if (status != 200) return resp;
    const auto& req = requests.back();
    nlohmann::json out = { {"jsonrpc", "2.0"}, {"id", req["id"]} };
    try {
      out["result"] = handler_(req["method"].get<std::string>(), req["params"]);
    } catch (const std::exception& e) {
      out["error"] = { {"code", -32000}, {"message", e.what()} };
    }
    resp.body = out.dump();
    return resp;
  }

  long status = 200;
  std::string last_url;
  std::unordered_map<std::string, std::string> last_headers;
  std::vector<nlohmann::json> requests;
private:
  Handler handler_;
};

}
