#pragma once
#include <string>
#include <optional>
#include <atomic>
#include <unordered_map>
#include <nlohmann/json.hpp>

class HttpClient;

// Thin Ethereum JSON-RPC client. Transport and protocol errors surface as ExternalFailure.
class RpcClient {
public:
  RpcClient(HttpClient& http,
            const std::string& endpoint_url,
            const std::optional<std::string>& auth_header = std::nullopt,
            int timeout_ms = 2000);
  // Sends one request and returns its "result" (see JsonRpcUtil::ExtractResult)
  std::string Call(const std::string& method, const nlohmann::json& params);

  std::string EthCall(const std::string& to, const std::string& data, const std::string& block = "latest");
  std::string EthGetBalance(const std::string& address, const std::string& block = "latest");
  std::string EthChainId();
private:
  HttpClient& http_;
  std::string endpoint_;
  int timeout_ms_;
  std::atomic<int> next_id_{1};
  std::unordered_map<std::string, std::string> default_headers_;
};
