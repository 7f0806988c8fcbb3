#pragma once
#include <string>
#include <vector>
#include "common/types.hpp"

class UserLedger;
class BalanceSource;

enum class AccrualStatus {
  Accrued,   // pending_to_convert increased
  NoGrowth,  // nothing added (zero/negative delta or 0%); snapshot still advanced
  Failed     // balance unavailable; account untouched
};

const char* ToString(AccrualStatus s);

struct AccrualOutcome {
  UserId user;
  AccrualStatus status = AccrualStatus::NoGrowth;
  Amount observed_balance = 0;
  Amount delta = 0;      // positive growth only
  Amount accrued = 0;
  std::string error;
};

struct AccrualReport {
  std::vector<AccrualOutcome> outcomes;
  size_t Count(AccrualStatus s) const;
  size_t Failures() const { return Count(AccrualStatus::Failed); }
  // No pending balance changed and nothing failed
  bool NoOp() const { return Count(AccrualStatus::Accrued) == 0 && Failures() == 0; }
  Amount TotalAccrued() const;
};

// Periodic maintenance pass: measures each watched user's reward growth since
// the previous pass and moves conversion_percentage of it into
// pending_to_convert (truncating division per pass).
class AccrualEngine {
public:
  AccrualEngine(UserLedger& ledger, BalanceSource& balances) : ledger_(ledger), balances_(balances) {}
  AccrualReport Run();
  // floor(delta * percentage / 100)
  static Amount AccruedPortion(const Amount& delta, int percentage);
private:
  AccrualOutcome AccrueOne(const UserId& user);
  UserLedger& ledger_;
  BalanceSource& balances_;
};
