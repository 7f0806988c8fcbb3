#pragma once
#include <string>
#include "common/types.hpp"

namespace FixedPoint {
  // 10^decimals; decimals must be in [0, 77]
  Amount Pow10(int decimals);
  // "1850.25" at 8 decimals -> 185025000000. Throws InvalidParameter on malformed
  // input, a sign, more fractional digits than decimals, or a result above 2^256 - 1.
  Amount Parse(const std::string& text, int decimals);
  // Inverse of Parse; trailing fractional zeros are dropped ("0.4", "3", "0").
  std::string Format(const Amount& units, int decimals);
  // Moves a fixed-point value between scales, truncating when scaling down.
  // Throws InvalidParameter when scaling up leaves 256 bits.
  Amount Rescale(const Amount& value, int from_decimals, int to_decimals);
  // JSON-RPC quantity ("0x1bc16d674ec80000") or raw hex word.
  Amount ParseHexQuantity(const std::string& hex);
}
