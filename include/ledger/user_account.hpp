#pragma once
#include "common/types.hpp"

struct UserAccount {
  UserId user;
  Amount deposit_total = 0;
  // monitored balance as of the last accrual pass (or registration)
  Amount last_observed_balance = 0;
  // base-asset units accrued but not yet converted
  Amount pending_to_convert = 0;
  // stable-asset units credited by conversions
  Amount converted_balance = 0;
  // oracle fixed-point scale; 0 means no order
  Amount target_price = 0;
  int conversion_percentage = 0;

  bool HasOrder() const { return target_price != 0; }

  bool operator==(const UserAccount& o) const {
    return user == o.user && deposit_total == o.deposit_total &&
           last_observed_balance == o.last_observed_balance &&
           pending_to_convert == o.pending_to_convert &&
           converted_balance == o.converted_balance &&
           target_price == o.target_price &&
           conversion_percentage == o.conversion_percentage;
  }
  bool operator!=(const UserAccount& o) const { return !(*this == o); }
};
