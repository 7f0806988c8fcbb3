#include "ledger/watchlist.hpp"
#include <stdexcept>

bool Watchlist::Add(const UserId& user) {
  if (!members_.insert(user).second) return false;
  order_.push_back(user);
  return true;
}

const UserId& Watchlist::At(size_t index) const {
  if (index >= order_.size())
    throw std::out_of_range("watchlist index " + std::to_string(index) + " >= size " + std::to_string(order_.size()));
  return order_[index];
}
