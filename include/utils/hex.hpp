#pragma once
#include <string>
#include <algorithm>
#include <cctype>
#include "common/errors.hpp"

inline std::string Strip0x(const std::string& s) {
  if (s.rfind("0x", 0) == 0 || s.rfind("0X", 0) == 0) return s.substr(2);
  return s;
}

inline std::string ToLowerHex(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

inline bool IsHexAddress(const std::string& s) {
  const std::string body = Strip0x(s);
  if (body.size() != 40 || body.size() == s.size()) return false;
  return std::all_of(body.begin(), body.end(), [](unsigned char c){ return std::isxdigit(c) != 0; });
}

// Canonical account identity: 0x + 40 lower-case hex digits.
inline std::string NormalizeAddress(const std::string& s) {
  if (!IsHexAddress(s)) throw InvalidParameter("not a 20-byte hex address: " + s);
  return "0x" + ToLowerHex(Strip0x(s));
}
