#include "engine/accrual_engine.hpp"
#include "ledger/user_ledger.hpp"
#include "monitor/balance_source.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "telemetry/structured_logger.hpp"

const char* ToString(AccrualStatus s) {
  switch (s) {
    case AccrualStatus::Accrued: return "accrued";
    case AccrualStatus::NoGrowth: return "no_growth";
    case AccrualStatus::Failed: return "failed";
  }
  return "unknown";
}

size_t AccrualReport::Count(AccrualStatus s) const {
  size_t n = 0;
  for (const auto& o : outcomes) if (o.status == s) ++n;
  return n;
}

Amount AccrualReport::TotalAccrued() const {
  Amount total = 0;
  for (const auto& o : outcomes) total += o.accrued;
  return total;
}

Amount AccrualEngine::AccruedPortion(const Amount& delta, int percentage) {
  if (percentage <= 0) return 0;
  // split so the product never leaves 256 bits
  const unsigned p = static_cast<unsigned>(percentage);
  return delta / 100u * p + delta % 100u * p / 100u;
}

AccrualOutcome AccrualEngine::AccrueOne(const UserId& user) {
  AccrualOutcome out;
  out.user = user;
  auto account = ledger_.Find(user);
  if (!account) throw PreconditionViolation("watched user without account: " + user);
  out.observed_balance = balances_.BalanceOf(user);
  // shrinking balances contribute nothing but still move the snapshot
  if (out.observed_balance > account->last_observed_balance)
    out.delta = out.observed_balance - account->last_observed_balance;
  out.accrued = AccruedPortion(out.delta, account->conversion_percentage);
  ledger_.RecordAccrual(user, out.observed_balance, out.accrued);
  out.status = out.accrued > 0 ? AccrualStatus::Accrued : AccrualStatus::NoGrowth;
  return out;
}

AccrualReport AccrualEngine::Run() {
  AccrualReport report;
  const auto users = ledger_.Users();
  report.outcomes.reserve(users.size());
  for (const auto& user : users) {
    try {
      report.outcomes.push_back(AccrueOne(user));
    } catch (const std::exception& e) {
      AccrualOutcome failed;
      failed.user = user;
      failed.status = AccrualStatus::Failed;
      failed.error = e.what();
      Logger::Warning("Accrual failed for " + user + ": " + e.what());
      report.outcomes.push_back(failed);
    }
  }
  for (const auto& o : report.outcomes) {
    if (o.status == AccrualStatus::NoGrowth) continue;
    StructuredLogger::Instance().LogEvent("accrual", {
      {"user", o.user}, {"status", ToString(o.status)}, {"observed_balance", o.observed_balance.str()},
      {"delta", o.delta.str()}, {"accrued", o.accrued.str()}, {"error", o.error} });
  }
  Logger::Info("Accrual pass over " + std::to_string(users.size()) + " users: " +
               std::to_string(report.Count(AccrualStatus::Accrued)) + " accrued, " +
               std::to_string(report.Failures()) + " failed");
  return report;
}
