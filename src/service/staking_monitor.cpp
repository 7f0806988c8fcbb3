#include "service/staking_monitor.hpp"
#include "ledger/user_ledger.hpp"
#include "oracle/price_oracle.hpp"
#include "monitor/balance_source.hpp"
#include "common/errors.hpp"
#include "common/fixed_point.hpp"
#include "common/logger.hpp"
#include "telemetry/structured_logger.hpp"
#include "utils/hex.hpp"

StakingMonitor::StakingMonitor(UserLedger& ledger,
                               PriceOracle& oracle,
                               ExchangeRouter& router,
                               BalanceSource& balances,
                               std::chrono::seconds accrual_interval,
                               ConversionJournal* journal)
  : ledger_(ledger), oracle_(oracle), balances_(balances),
    accrual_(ledger, balances),
    conversion_(ledger, oracle, router, journal),
    automation_(ledger, oracle, accrual_, conversion_, accrual_interval) {}

bool StakingMonitor::Deposit(const UserId& user, const Amount& amount) {
  std::lock_guard<std::mutex> lock(step_mutex_);
  const UserId id = NormalizeAddress(user);
  if (amount == 0) throw InvalidParameter("deposit amount must be positive");
  // snapshot is only taken on registration
  Amount observed = 0;
  const bool known = ledger_.Find(id).has_value();
  if (!known) observed = balances_.BalanceOf(id);
  const bool registered = ledger_.Deposit(id, amount, observed);
  if (registered) Logger::Info("Registered " + id + " at observed balance " + observed.str());
  StructuredLogger::Instance().LogEvent("deposit", { {"user", id}, {"amount", amount.str()},
                                                     {"registered", registered},
                                                     {"deposit_total", ledger_.DepositBalance(id).str()} });
  return registered;
}

void StakingMonitor::ConfigureOrder(const UserId& user, const Amount& target_price, int percentage) {
  std::lock_guard<std::mutex> lock(step_mutex_);
  ledger_.ConfigureOrder(user, target_price, percentage);
  Logger::Info("Order set for " + user + ": target " + target_price.str() + ", " + std::to_string(percentage) + "%");
  StructuredLogger::Instance().LogEvent("order_set", { {"user", NormalizeAddress(user)},
                                                       {"target_price", target_price.str()},
                                                       {"percentage", percentage} });
}

void StakingMonitor::ConfigureOrderScaled(const UserId& user, const Amount& target_price, int price_decimals, int percentage) {
  ConfigureOrder(user, FixedPoint::Rescale(target_price, price_decimals, PriceDecimals()), percentage);
}

void StakingMonitor::ConfigureOrderDecimal(const UserId& user, const std::string& target_price, int percentage) {
  ConfigureOrder(user, FixedPoint::Parse(target_price, PriceDecimals()), percentage);
}

AccrualReport StakingMonitor::RunAccrual() {
  std::lock_guard<std::mutex> lock(step_mutex_);
  return automation_.RunAccrual(UpkeepAutomation::Clock::now());
}

std::optional<AccrualReport> StakingMonitor::RunAccrualIfDue(std::chrono::system_clock::time_point now) {
  std::lock_guard<std::mutex> lock(step_mutex_);
  return automation_.RunAccrualIfDue(now);
}

UpkeepCheck StakingMonitor::CheckNeeded() {
  std::lock_guard<std::mutex> lock(step_mutex_);
  return automation_.CheckNeeded();
}

ConversionReport StakingMonitor::PerformAction(const std::string& perform_data) {
  std::lock_guard<std::mutex> lock(step_mutex_);
  return automation_.PerformAction(perform_data);
}

Amount StakingMonitor::GetPrice() {
  std::lock_guard<std::mutex> lock(step_mutex_);
  return oracle_.GetPrice();
}

int StakingMonitor::PriceDecimals() const {
  return oracle_.Decimals();
}

std::optional<UserAccount> StakingMonitor::Account(const UserId& user) const {
  std::lock_guard<std::mutex> lock(step_mutex_);
  return ledger_.Find(user);
}

Amount StakingMonitor::DepositBalance(const UserId& user) const {
  std::lock_guard<std::mutex> lock(step_mutex_);
  return ledger_.DepositBalance(user);
}

UserId StakingMonitor::WatchlistAt(size_t index) const {
  std::lock_guard<std::mutex> lock(step_mutex_);
  return ledger_.WatchlistAt(index);
}

size_t StakingMonitor::WatchlistSize() const {
  std::lock_guard<std::mutex> lock(step_mutex_);
  return ledger_.WatchlistSize();
}
