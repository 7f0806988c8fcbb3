#pragma once
#include <string>
#include <vector>
#include "common/types.hpp"

class UserLedger;
class PriceOracle;
class ExchangeRouter;
class ConversionJournal;

enum class ConversionStatus {
  Converted,       // pending swapped and credited
  NoOrder,         // no target price configured
  NothingPending,  // order set but nothing accrued
  BelowTarget,     // price <= target
  Failed           // oracle or router failure; account untouched
};

const char* ToString(ConversionStatus s);

struct ConversionOutcome {
  UserId user;
  ConversionStatus status = ConversionStatus::NoOrder;
  Amount price = 0;
  Amount amount_in = 0;
  Amount amount_out = 0;
  std::string error;
};

struct ConversionReport {
  std::vector<ConversionOutcome> outcomes;
  size_t Count(ConversionStatus s) const;
  size_t Failures() const { return Count(ConversionStatus::Failed); }
  size_t Conversions() const { return Count(ConversionStatus::Converted); }
  // Nothing converted and nothing failed
  bool NoOp() const { return Conversions() == 0 && Failures() == 0; }
};

// Triggerable pass: for every watched user with an order whose target the
// current price strictly exceeds, converts the whole pending balance and
// credits the router's output. One user's failure never stops the pass.
class ConversionEngine {
public:
  ConversionEngine(UserLedger& ledger, PriceOracle& oracle, ExchangeRouter& router,
                   ConversionJournal* journal = nullptr)
    : ledger_(ledger), oracle_(oracle), router_(router), journal_(journal) {}
  ConversionReport Run();
  static bool ThresholdExceeded(const Amount& price, const Amount& target_price) {
    return target_price != 0 && price > target_price;
  }
private:
  void ConvertOne(ConversionOutcome& out);
  void Journal(const ConversionOutcome& o);
  UserLedger& ledger_;
  PriceOracle& oracle_;
  ExchangeRouter& router_;
  ConversionJournal* journal_;
};
