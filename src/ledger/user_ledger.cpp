#include "ledger/user_ledger.hpp"
#include "common/errors.hpp"
#include "utils/hex.hpp"

bool UserLedger::Deposit(const UserId& user, const Amount& amount, const Amount& observed_balance) {
  const UserId id = NormalizeAddress(user);
  if (amount == 0) throw InvalidParameter("deposit amount must be positive");
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = accounts_.find(id);
  if (it != accounts_.end()) {
    it->second.deposit_total += amount;
    return false;
  }
  UserAccount acc;
  acc.user = id;
  acc.deposit_total = amount;
  acc.last_observed_balance = observed_balance;
  accounts_.emplace(id, acc);
  watchlist_.Add(id);
  return true;
}

void UserLedger::ConfigureOrder(const UserId& user, const Amount& target_price, int percentage) {
  const UserId id = NormalizeAddress(user);
  if (percentage < 0 || percentage > 100)
    throw InvalidParameter("conversion percentage must be within [0, 100], got " + std::to_string(percentage));
  if (target_price == 0) throw InvalidParameter("target price must be positive");
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = accounts_.find(id);
  if (it == accounts_.end() || it->second.deposit_total == 0)
    throw PreconditionViolation("user " + id + " has not deposited");
  it->second.target_price = target_price;
  it->second.conversion_percentage = percentage;
}

UserAccount& UserLedger::Existing(const UserId& user) {
  auto it = accounts_.find(user);
  if (it == accounts_.end()) throw PreconditionViolation("unknown user " + user);
  return it->second;
}

void UserLedger::RecordAccrual(const UserId& user, const Amount& observed_balance, const Amount& accrued) {
  const UserId id = NormalizeAddress(user);
  std::lock_guard<std::mutex> lock(mutex_);
  UserAccount& acc = Existing(id);
  acc.pending_to_convert += accrued;
  acc.last_observed_balance = observed_balance;
}

void UserLedger::RecordConversion(const UserId& user, const Amount& amount_in, const Amount& amount_out) {
  const UserId id = NormalizeAddress(user);
  std::lock_guard<std::mutex> lock(mutex_);
  UserAccount& acc = Existing(id);
  if (acc.pending_to_convert != amount_in)
    throw PreconditionViolation("pending balance of " + id + " changed during conversion");
  acc.pending_to_convert = 0;
  acc.converted_balance += amount_out;
}

std::optional<UserAccount> UserLedger::Find(const UserId& user) const {
  if (!IsHexAddress(user)) return std::nullopt;
  const UserId id = NormalizeAddress(user);
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = accounts_.find(id);
  if (it == accounts_.end()) return std::nullopt;
  return it->second;
}

Amount UserLedger::DepositBalance(const UserId& user) const {
  auto acc = Find(user);
  return acc ? acc->deposit_total : Amount(0);
}

UserId UserLedger::WatchlistAt(size_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return watchlist_.At(index);
}

size_t UserLedger::WatchlistSize() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return watchlist_.Size();
}

std::vector<UserId> UserLedger::Users() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return watchlist_.Entries();
}

std::vector<UserAccount> UserLedger::Accounts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<UserAccount> out;
  out.reserve(watchlist_.Size());
  for (const auto& u : watchlist_.Entries()) out.push_back(accounts_.at(u));
  return out;
}

void UserLedger::Restore(const std::vector<UserAccount>& accounts) {
  std::unordered_map<UserId, UserAccount> restored;
  Watchlist order;
  for (const auto& a : accounts) {
    UserAccount acc = a;
    acc.user = NormalizeAddress(a.user);
    if (acc.deposit_total == 0) throw InvalidParameter("account " + acc.user + " has no deposit");
    if (acc.conversion_percentage < 0 || acc.conversion_percentage > 100)
      throw InvalidParameter("account " + acc.user + " has an invalid conversion percentage");
    if (!order.Add(acc.user)) throw InvalidParameter("duplicate account " + acc.user);
    restored.emplace(acc.user, acc);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  accounts_.swap(restored);
  watchlist_ = order;
}
