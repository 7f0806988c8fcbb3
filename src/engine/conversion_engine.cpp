#include "engine/conversion_engine.hpp"
#include "ledger/user_ledger.hpp"
#include "oracle/price_oracle.hpp"
#include "routing/exchange_router.hpp"
#include "telemetry/conversion_journal.hpp"
#include "telemetry/structured_logger.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

const char* ToString(ConversionStatus s) {
  switch (s) {
    case ConversionStatus::Converted: return "converted";
    case ConversionStatus::NoOrder: return "no_order";
    case ConversionStatus::NothingPending: return "nothing_pending";
    case ConversionStatus::BelowTarget: return "below_target";
    case ConversionStatus::Failed: return "failed";
  }
  return "unknown";
}

size_t ConversionReport::Count(ConversionStatus s) const {
  size_t n = 0;
  for (const auto& o : outcomes) if (o.status == s) ++n;
  return n;
}

void ConversionEngine::ConvertOne(ConversionOutcome& out) {
  const UserId& user = out.user;
  auto account = ledger_.Find(user);
  if (!account) throw PreconditionViolation("watched user without account: " + user);
  if (!account->HasOrder()) {
    out.status = ConversionStatus::NoOrder;
    return;
  }
  if (account->pending_to_convert == 0) {
    out.status = ConversionStatus::NothingPending;
    return;
  }
  out.price = oracle_.GetPrice();
  if (!ThresholdExceeded(out.price, account->target_price)) {
    out.status = ConversionStatus::BelowTarget;
    return;
  }
  out.amount_in = account->pending_to_convert;
  out.amount_out = router_.Convert(user, out.amount_in);
  ledger_.RecordConversion(user, out.amount_in, out.amount_out);
  out.status = ConversionStatus::Converted;
}

void ConversionEngine::Journal(const ConversionOutcome& o) {
  if (o.status != ConversionStatus::Converted && o.status != ConversionStatus::Failed) return;
  auto account = ledger_.Find(o.user);
  const std::string total = account ? account->converted_balance.str() : std::string();
  StructuredLogger::Instance().LogEvent(
    o.status == ConversionStatus::Converted ? "conversion" : "conversion_failed",
    { {"user", o.user}, {"price", o.price.str()}, {"amount_in", o.amount_in.str()},
      {"amount_out", o.amount_out.str()}, {"converted_total", total}, {"error", o.error} });
  if (!journal_) return;
  ConversionRecord r;
  r.user = o.user;
  r.status = o.status == ConversionStatus::Converted ? "CONVERTED" : "FAILED";
  r.price = o.price.str();
  r.amount_in = o.amount_in.str();
  r.amount_out = o.amount_out.str();
  r.converted_total = total;
  r.error = o.error;
  journal_->Record(r);
}

ConversionReport ConversionEngine::Run() {
  ConversionReport report;
  const auto users = ledger_.Users();
  report.outcomes.reserve(users.size());
  for (const auto& user : users) {
    ConversionOutcome outcome;
    outcome.user = user;
    try {
      ConvertOne(outcome);
    } catch (const std::exception& e) {
      // pending_to_convert stays as it was for the next attempt
      outcome.status = ConversionStatus::Failed;
      outcome.amount_out = 0;
      outcome.error = e.what();
      Logger::Error("Conversion failed for " + user + ": " + e.what());
    }
    if (outcome.status == ConversionStatus::Converted) {
      Logger::Info("Converted " + outcome.amount_in.str() + " wei for " + user + " -> " +
                   outcome.amount_out.str() + " at price " + outcome.price.str());
    }
    Journal(outcome);
    report.outcomes.push_back(outcome);
  }
  Logger::Info("Conversion pass over " + std::to_string(users.size()) + " users: " +
               std::to_string(report.Conversions()) + " converted, " +
               std::to_string(report.Failures()) + " failed");
  return report;
}
