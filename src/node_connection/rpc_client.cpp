#include "node_connection/rpc_client.hpp"
#include "net/http_client.hpp"
#include "common/logger.hpp"
#include "common/errors.hpp"
#include "utils/json_rpc.hpp"
#include <cctype>
#include <string>

static inline std::string Trim(const std::string& s) {
  size_t start = 0, end = s.size();
  while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(s[end-1]))) --end;
  return s.substr(start, end - start);
}

// "x-api-key: abc" becomes a named header; a bare value is sent as Authorization
static void ApplyAuthHeader(std::unordered_map<std::string, std::string>& headers,
                            const std::optional<std::string>& auth_header_opt) {
  if (!auth_header_opt || auth_header_opt->empty()) return;
  const std::string& raw = *auth_header_opt;
  auto pos = raw.find(':');
  if (pos != std::string::npos) {
    std::string name = Trim(raw.substr(0, pos));
    std::string value = Trim(raw.substr(pos + 1));
    if (!name.empty() && !value.empty()) {
      headers[name] = value;
      return;
    }
  }
  headers["Authorization"] = raw;
}

RpcClient::RpcClient(HttpClient& http,
                     const std::string& endpoint_url,
                     const std::optional<std::string>& auth_header,
                     int timeout_ms)
  : http_(http), endpoint_(endpoint_url), timeout_ms_(timeout_ms) {
  default_headers_["Content-Type"] = "application/json";
  ApplyAuthHeader(default_headers_, auth_header);
}

std::string RpcClient::Call(const std::string& method, const nlohmann::json& params) {
  const std::string payload = JsonRpcUtil::BuildRequest(method, params, next_id_++);
  auto resp = http_.Post(endpoint_, payload, default_headers_, timeout_ms_);
  if (!resp.error.empty()) throw ExternalFailure(method + ": " + resp.error);
  if (resp.status < 200 || resp.status >= 300) {
    Logger::Error(method + " HTTP status=" + std::to_string(resp.status));
    throw ExternalFailure(method + ": HTTP status " + std::to_string(resp.status));
  }
  return JsonRpcUtil::ExtractResult(resp.body);
}

std::string RpcClient::EthCall(const std::string& to, const std::string& data, const std::string& block) {
  nlohmann::json call = { {"to", to}, {"data", data} };
  return Call("eth_call", nlohmann::json::array({ call, block }));
}

std::string RpcClient::EthGetBalance(const std::string& address, const std::string& block) {
  return Call("eth_getBalance", nlohmann::json::array({ address, block }));
}

std::string RpcClient::EthChainId() {
  return Call("eth_chainId", nlohmann::json::array());
}
