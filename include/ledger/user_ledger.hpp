#pragma once
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>
#include "common/types.hpp"
#include "ledger/user_account.hpp"
#include "ledger/watchlist.hpp"

// Per-user accounts plus the watchlist of registered users.
//
// Field ownership: Deposit/ConfigureOrder write deposit_total, target_price and
// conversion_percentage; RecordAccrual writes last_observed_balance and adds to
// pending_to_convert; RecordConversion zeroes pending_to_convert and adds to
// converted_balance. User ids are normalized on every entry point.
class UserLedger {
public:
  // Registers the user on first deposit (snapshotting observed_balance) and adds
  // amount to deposit_total. Returns true when the user was newly registered.
  // Throws InvalidParameter for a zero amount or malformed user id.
  bool Deposit(const UserId& user, const Amount& amount, const Amount& observed_balance);

  // Replaces the user's order. target_price is in oracle scale and must be non-zero.
  // Throws PreconditionViolation without a prior deposit, InvalidParameter for
  // percentage outside [0, 100].
  void ConfigureOrder(const UserId& user, const Amount& target_price, int percentage);

  void RecordAccrual(const UserId& user, const Amount& observed_balance, const Amount& accrued);
  // amount_in must equal the pending balance being converted
  void RecordConversion(const UserId& user, const Amount& amount_in, const Amount& amount_out);

  std::optional<UserAccount> Find(const UserId& user) const;
  Amount DepositBalance(const UserId& user) const;
  UserId WatchlistAt(size_t index) const;
  size_t WatchlistSize() const;
  // Watchlist order
  std::vector<UserId> Users() const;
  std::vector<UserAccount> Accounts() const;

  // Replaces all state with accounts given in watchlist order (persistence)
  void Restore(const std::vector<UserAccount>& accounts);

private:
  UserAccount& Existing(const UserId& user);

  mutable std::mutex mutex_;
  std::unordered_map<UserId, UserAccount> accounts_;
  Watchlist watchlist_;
};
