#include "common/fixed_point.hpp"
#include "common/errors.hpp"
#include <cctype>
#include <limits>

namespace {
  constexpr int kMaxDecimals = 77;

  void CheckDecimals(int decimals) {
    if (decimals < 0 || decimals > kMaxDecimals)
      throw InvalidParameter("decimals out of range: " + std::to_string(decimals));
  }

  std::string Trim(const std::string& s) {
    size_t start = 0, end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
  }

  // acc * factor + addend, rejecting anything above 2^256 - 1
  Amount CheckedMulAdd(const Amount& acc, const Amount& factor, const Amount& addend, const std::string& text) {
    const Amount max = std::numeric_limits<Amount>::max();
    if (factor != 0 && acc > (max - addend) / factor)
      throw InvalidParameter("value exceeds 256 bits: " + text);
    return acc * factor + addend;
  }

  int HexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + c - 'a';
    if (c >= 'A' && c <= 'F') return 10 + c - 'A';
    return -1;
  }
}

namespace FixedPoint {

Amount Pow10(int decimals) {
  CheckDecimals(decimals);
  Amount out = 1;
  for (int i = 0; i < decimals; ++i) out *= 10;
  return out;
}

Amount Parse(const std::string& text, int decimals) {
  CheckDecimals(decimals);
  const std::string s = Trim(text);
  if (s.empty()) throw InvalidParameter("empty decimal value");
  auto dot = s.find('.');
  std::string whole = dot == std::string::npos ? s : s.substr(0, dot);
  std::string frac = dot == std::string::npos ? std::string() : s.substr(dot + 1);
  if (whole.empty() && frac.empty()) throw InvalidParameter("malformed decimal value: " + text);
  for (char c : whole + frac) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      throw InvalidParameter("malformed decimal value: " + text);
  }
  // trailing zeros never carry precision
  while (!frac.empty() && frac.back() == '0') frac.pop_back();
  if (static_cast<int>(frac.size()) > decimals)
    throw InvalidParameter("too many fractional digits for " + std::to_string(decimals) + " decimals: " + text);

  Amount units = 0;
  for (char c : whole) units = CheckedMulAdd(units, 10, static_cast<unsigned>(c - '0'), text);
  // at most 77 fractional digits, always below 2^256
  Amount frac_units = 0;
  for (char c : frac) frac_units = frac_units * 10 + static_cast<unsigned>(c - '0');
  frac_units *= Pow10(decimals - static_cast<int>(frac.size()));
  return CheckedMulAdd(units, Pow10(decimals), frac_units, text);
}

std::string Format(const Amount& units, int decimals) {
  CheckDecimals(decimals);
  const Amount scale = Pow10(decimals);
  std::string whole = Amount(units / scale).str();
  if (decimals == 0) return whole;
  std::string frac = Amount(units % scale).str();
  if (frac == "0") return whole;
  frac = std::string(decimals - frac.size(), '0') + frac;
  while (!frac.empty() && frac.back() == '0') frac.pop_back();
  return whole + "." + frac;
}

Amount Rescale(const Amount& value, int from_decimals, int to_decimals) {
  CheckDecimals(from_decimals);
  CheckDecimals(to_decimals);
  if (from_decimals == to_decimals) return value;
  if (to_decimals > from_decimals)
    return CheckedMulAdd(value, Pow10(to_decimals - from_decimals), 0, value.str());
  return value / Pow10(from_decimals - to_decimals);
}

Amount ParseHexQuantity(const std::string& hex) {
  std::string s = Trim(hex);
  if (s.rfind("0x", 0) == 0 || s.rfind("0X", 0) == 0) s = s.substr(2);
  size_t first = s.find_first_not_of('0');
  if (first == std::string::npos) return 0;
  s = s.substr(first);
  if (s.size() > 64) throw InvalidParameter("hex quantity exceeds 256 bits");
  Amount out = 0;
  for (char c : s) {
    int d = HexDigit(c);
    if (d < 0) throw InvalidParameter("malformed hex quantity: " + hex);
    out = (out << 4) | static_cast<unsigned>(d);
  }
  return out;
}

}
