#pragma once
#include <string>
#include <vector>
#include "common/types.hpp"

// Minimal Solidity ABI word codec for static calls: every value is one
// 32-byte word rendered as 64 lower-case hex digits (no 0x).
namespace Abi {
  std::string EncodeUint(const Amount& v);
  std::string EncodeAddress(const std::string& address);
  // Splits an eth_call result ("0x" + n*64 hex) into words; throws ExternalFailure on a ragged result
  std::vector<std::string> SplitWords(const std::string& result);
  Amount DecodeUint(const std::string& word);
  // True when the word, read as int256, is negative
  bool IsNegative(const std::string& word);
}
