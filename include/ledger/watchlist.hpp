#pragma once
#include <string>
#include <vector>
#include <unordered_set>
#include "common/types.hpp"

// Append-only, insertion-ordered set of monitored users. Not synchronized;
// UserLedger guards it.
class Watchlist {
public:
  // Appends user unless already present; returns true when appended
  bool Add(const UserId& user);
  // Throws std::out_of_range past the end
  const UserId& At(size_t index) const;
  size_t Size() const { return order_.size(); }
  const std::vector<UserId>& Entries() const { return order_; }
private:
  std::vector<UserId> order_;
  std::unordered_set<UserId> members_;
};
