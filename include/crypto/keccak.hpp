#pragma once
#include <string>

namespace Crypto {
  // Returns 0x-prefixed hex keccak256 hash of the input interpreted as raw bytes
  std::string Keccak256Raw(const std::string& raw);
  // 0x-prefixed 4-byte selector of a canonical Solidity signature, e.g.
  // FunctionSelector("latestRoundData()") == "0xfeaf968c"
  std::string FunctionSelector(const std::string& signature);
}
