#include "utils/abi.hpp"
#include "utils/hex.hpp"
#include "common/fixed_point.hpp"
#include "common/errors.hpp"
#include <cctype>

namespace Abi {

static std::string Pad64(const std::string& hexNo0x) {
  if (hexNo0x.size() >= 64) return hexNo0x.substr(hexNo0x.size() - 64);
  return std::string(64 - hexNo0x.size(), '0') + hexNo0x;
}

std::string EncodeUint(const Amount& v) {
  static const char* hex = "0123456789abcdef";
  std::string digits;
  Amount rest = v;
  while (rest != 0) {
    digits.insert(digits.begin(), hex[static_cast<unsigned>(rest & 0xF)]);
    rest >>= 4;
  }
  return Pad64(digits);
}

std::string EncodeAddress(const std::string& address) {
  return Pad64(Strip0x(NormalizeAddress(address)));
}

std::vector<std::string> SplitWords(const std::string& result) {
  const std::string body = Strip0x(result);
  if (body.size() % 64 != 0) throw ExternalFailure("ABI result is not word aligned (" + std::to_string(body.size()) + " hex digits)");
  std::vector<std::string> words;
  words.reserve(body.size() / 64);
  for (size_t i = 0; i < body.size(); i += 64) words.push_back(body.substr(i, 64));
  return words;
}

Amount DecodeUint(const std::string& word) {
  try {
    return FixedPoint::ParseHexQuantity(word);
  } catch (const InvalidParameter& e) {
    throw ExternalFailure(std::string("bad ABI word: ") + e.what());
  }
}

bool IsNegative(const std::string& word) {
  if (word.size() != 64) return false;
  const char c = static_cast<char>(std::tolower(static_cast<unsigned char>(word[0])));
  return c == '8' || c == '9' || (c >= 'a' && c <= 'f');
}

}
