#pragma once
#include <string>
#include <boost/multiprecision/cpp_int.hpp>

// Wei, token units and fixed-point prices all live in 256 bits; native
// balances routinely exceed 2^64 wei.
using Amount = boost::multiprecision::uint256_t;

// Lower-case 0x-prefixed 20-byte hex address.
using UserId = std::string;
