#include "automation/upkeep.hpp"
#include "ledger/user_ledger.hpp"
#include "oracle/price_oracle.hpp"
#include "telemetry/structured_logger.hpp"
#include "common/logger.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

UpkeepAutomation::UpkeepAutomation(UserLedger& ledger, PriceOracle& oracle, AccrualEngine& accrual,
                                   ConversionEngine& conversion, std::chrono::seconds accrual_interval)
  : ledger_(ledger), oracle_(oracle), accrual_(accrual), conversion_(conversion),
    accrual_interval_(accrual_interval), last_accrual_(Clock::now()) {}

UpkeepCheck UpkeepAutomation::CheckNeeded() const {
  UpkeepCheck check;
  Amount price = 0;
  try {
    price = oracle_.GetPrice();
  } catch (const std::exception& e) {
    Logger::Warning(std::string("Upkeep check could not read price: ") + e.what());
    check.perform_data = json{ {"error", e.what()} }.dump();
    return check;
  }
  json users = json::array();
  for (const auto& account : ledger_.Accounts()) {
    if (ConversionEngine::ThresholdExceeded(price, account.target_price)) users.push_back(account.user);
  }
  check.needed = !users.empty();
  check.perform_data = json{ {"price", price.str()}, {"users", users} }.dump();
  StructuredLogger::Instance().LogEvent("upkeep_check", { {"needed", check.needed}, {"price", price.str()},
                                                          {"eligible", users.size()} });
  return check;
}

ConversionReport UpkeepAutomation::PerformAction(const std::string& perform_data) {
  if (!perform_data.empty()) {
    auto hint = json::parse(perform_data, nullptr, false);
    if (hint.is_discarded()) {
      Logger::Warning("Ignoring malformed perform data");
    } else if (hint.contains("users") && hint["users"].is_array()) {
      Logger::Debug("Perform requested for " + std::to_string(hint["users"].size()) + " hinted users");
    }
  }
  return conversion_.Run();
}

bool UpkeepAutomation::AccrualDue(Clock::time_point now) const {
  return now - last_accrual_ >= accrual_interval_;
}

std::optional<AccrualReport> UpkeepAutomation::RunAccrualIfDue(Clock::time_point now) {
  if (!AccrualDue(now)) return std::nullopt;
  return RunAccrual(now);
}

AccrualReport UpkeepAutomation::RunAccrual(Clock::time_point now) {
  auto report = accrual_.Run();
  last_accrual_ = now;
  return report;
}
