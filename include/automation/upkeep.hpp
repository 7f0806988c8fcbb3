#pragma once
#include <chrono>
#include <optional>
#include <string>
#include "engine/accrual_engine.hpp"
#include "engine/conversion_engine.hpp"

class UserLedger;
class PriceOracle;

struct UpkeepCheck {
  bool needed = false;
  // JSON: {"price": "...", "users": [...]} or {"error": "..."}
  std::string perform_data;
};

// Check/perform pair for an external scheduler, plus the interval gate for
// the periodic accrual pass.
class UpkeepAutomation {
public:
  using Clock = std::chrono::system_clock;

  UpkeepAutomation(UserLedger& ledger, PriceOracle& oracle, AccrualEngine& accrual,
                   ConversionEngine& conversion, std::chrono::seconds accrual_interval);

  // Read-only: true when some watched user's target is set and the current
  // price strictly exceeds it. Oracle failures report needed=false.
  UpkeepCheck CheckNeeded() const;
  // perform_data is advisory only; every user is re-validated
  ConversionReport PerformAction(const std::string& perform_data);

  bool AccrualDue(Clock::time_point now) const;
  std::optional<AccrualReport> RunAccrualIfDue(Clock::time_point now);
  AccrualReport RunAccrual(Clock::time_point now);

private:
  UserLedger& ledger_;
  PriceOracle& oracle_;
  AccrualEngine& accrual_;
  ConversionEngine& conversion_;
  std::chrono::seconds accrual_interval_;
  Clock::time_point last_accrual_;
};
