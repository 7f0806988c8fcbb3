#include "ledger/ledger_store.hpp"
#include "ledger/user_ledger.hpp"
#include "common/errors.hpp"
#include "common/fixed_point.hpp"
#include "common/logger.hpp"
#include <cstdio>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {
  constexpr int kFormatVersion = 1;

  Amount ReadAmount(const json& obj, const char* key) {
    if (!obj.contains(key) || !obj[key].is_string())
      throw std::runtime_error(std::string("ledger entry missing string field ") + key);
    const std::string s = obj[key].get<std::string>();
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos)
      throw std::runtime_error(std::string("ledger field ") + key + " is not an unsigned integer: " + s);
    try {
      return FixedPoint::Parse(s, 0);
    } catch (const InvalidParameter& e) {
      throw std::runtime_error(std::string("ledger field ") + key + ": " + e.what());
    }
  }
}

namespace LedgerStore {

json ToJson(const UserLedger& ledger) {
  json users = json::array();
  for (const auto& a : ledger.Accounts()) {
    users.push_back({
      {"user", a.user},
      {"deposit_total", a.deposit_total.str()},
      {"last_observed_balance", a.last_observed_balance.str()},
      {"pending_to_convert", a.pending_to_convert.str()},
      {"converted_balance", a.converted_balance.str()},
      {"target_price", a.target_price.str()},
      {"conversion_percentage", a.conversion_percentage},
    });
  }
  return json{ {"version", kFormatVersion}, {"users", users} };
}

void FromJson(const json& doc, UserLedger& ledger) {
  if (!doc.is_object() || !doc.contains("version") || !doc["version"].is_number_integer() ||
      doc["version"].get<int>() != kFormatVersion)
    throw std::runtime_error("unsupported ledger format");
  if (!doc.contains("users") || !doc["users"].is_array())
    throw std::runtime_error("ledger document has no users array");
  std::vector<UserAccount> accounts;
  for (const auto& u : doc["users"]) {
    if (!u.is_object() || !u.contains("user") || !u["user"].is_string())
      throw std::runtime_error("ledger entry without user");
    if (!u.contains("conversion_percentage") || !u["conversion_percentage"].is_number_integer())
      throw std::runtime_error("ledger entry without conversion_percentage");
    UserAccount a;
    a.user = u["user"].get<std::string>();
    a.deposit_total = ReadAmount(u, "deposit_total");
    a.last_observed_balance = ReadAmount(u, "last_observed_balance");
    a.pending_to_convert = ReadAmount(u, "pending_to_convert");
    a.converted_balance = ReadAmount(u, "converted_balance");
    a.target_price = ReadAmount(u, "target_price");
    a.conversion_percentage = u["conversion_percentage"].get<int>();
    accounts.push_back(a);
  }
  try {
    ledger.Restore(accounts);
  } catch (const MonitorError& e) {
    throw std::runtime_error(std::string("invalid ledger document: ") + e.what());
  }
}

void Save(const UserLedger& ledger, const std::string& path) {
  const std::string tmp = path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::out | std::ios::trunc);
    if (!out.is_open()) throw std::runtime_error("cannot write ledger file " + tmp);
    out << ToJson(ledger).dump(2) << '\n';
    out.flush();
    if (!out) throw std::runtime_error("failed writing ledger file " + tmp);
  }
  if (std::rename(tmp.c_str(), path.c_str()) != 0)
    throw std::runtime_error("cannot replace ledger file " + path);
}

bool Load(const std::string& path, UserLedger& ledger) {
  std::ifstream in(path);
  if (!in.is_open()) {
    Logger::Info("No ledger file at " + path + ", starting empty");
    ledger.Restore({});
    return false;
  }
  auto doc = json::parse(in, nullptr, false);
  if (doc.is_discarded()) throw std::runtime_error("ledger file " + path + " is not valid JSON");
  FromJson(doc, ledger);
  Logger::Info("Loaded " + std::to_string(ledger.WatchlistSize()) + " accounts from " + path);
  return true;
}

}
