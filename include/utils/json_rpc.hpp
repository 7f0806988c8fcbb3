#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace JsonRpcUtil {
  // {"jsonrpc":"2.0","method":...,"params":[...],"id":id}
  std::string BuildRequest(const std::string& method, const nlohmann::json& params, int id = 1);
  // Returns the "result" field as string (raw strings unquoted, other values dumped).
  // Throws ExternalFailure on a JSON-RPC error object, a missing result or invalid JSON.
  std::string ExtractResult(const std::string& json_body);
}
