#pragma once
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include "common/types.hpp"
#include "ledger/user_account.hpp"
#include "engine/accrual_engine.hpp"
#include "engine/conversion_engine.hpp"
#include "automation/upkeep.hpp"

class UserLedger;
class PriceOracle;
class ExchangeRouter;
class BalanceSource;
class ConversionJournal;

// Entry points of the harvester. Every call runs as one indivisible step
// relative to the others.
class StakingMonitor {
public:
  StakingMonitor(UserLedger& ledger,
                 PriceOracle& oracle,
                 ExchangeRouter& router,
                 BalanceSource& balances,
                 std::chrono::seconds accrual_interval = std::chrono::seconds(180),
                 ConversionJournal* journal = nullptr);

  // Returns true when the user was newly added to the watchlist
  bool Deposit(const UserId& user, const Amount& amount);
  // target_price in the oracle's fixed-point scale
  void ConfigureOrder(const UserId& user, const Amount& target_price, int percentage);
  // target_price given at price_decimals, normalized to the oracle scale
  void ConfigureOrderScaled(const UserId& user, const Amount& target_price, int price_decimals, int percentage);
  // target_price as a decimal string, e.g. "1850.25"
  void ConfigureOrderDecimal(const UserId& user, const std::string& target_price, int percentage);

  AccrualReport RunAccrual();
  std::optional<AccrualReport> RunAccrualIfDue(std::chrono::system_clock::time_point now);
  UpkeepCheck CheckNeeded();
  ConversionReport PerformAction(const std::string& perform_data = std::string());
  // Alias of PerformAction for direct invocation
  ConversionReport CheckConditionsAndPerformSwap() { return PerformAction(); }

  Amount GetPrice();
  int PriceDecimals() const;
  std::optional<UserAccount> Account(const UserId& user) const;
  Amount DepositBalance(const UserId& user) const;
  UserId WatchlistAt(size_t index) const;
  size_t WatchlistSize() const;

private:
  mutable std::mutex step_mutex_;
  UserLedger& ledger_;
  PriceOracle& oracle_;
  BalanceSource& balances_;
  AccrualEngine accrual_;
  ConversionEngine conversion_;
  UpkeepAutomation automation_;
};
