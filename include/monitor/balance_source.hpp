#pragma once
#include "common/types.hpp"

// The balance whose growth counts as reward for a user.
class BalanceSource {
public:
  virtual ~BalanceSource() = default;
  virtual Amount BalanceOf(const UserId& user) = 0;
};
