#include <boost/test/unit_test.hpp>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>
#include "fakes.hpp"
#include "common/config_manager.hpp"
#include "config/monitor_config.hpp"
#include "ledger/ledger_store.hpp"
#include "ledger/user_ledger.hpp"

using namespace fakes;
namespace fs = std::filesystem;

namespace {

std::string TempPath(const std::string& name) {
  return (fs::temp_directory_path() / name).string();
}

struct ConfigReset {
  ConfigReset() { ConfigManager::Clear(); }
  ~ConfigReset() { ConfigManager::Clear(); }
};

}

BOOST_AUTO_TEST_SUITE(ledger_store_tests)

BOOST_AUTO_TEST_CASE(save_and_load_preserve_accounts_and_order) {
  UserLedger ledger;
  ledger.Deposit(kBob, Ether("2"), Ether("10"));
  ledger.Deposit(kAlice, Ether("0.01"), Ether("99.99"));
  ledger.ConfigureOrder(kAlice, Amount("185025000000"), 40);
  ledger.RecordAccrual(kAlice, Ether("100.99"), Ether("0.4"));
  ledger.RecordConversion(kAlice, Ether("0.4"), Amount("500000000000000"));

  const std::string path = TempPath("staking_monitor_ledger_test.json");
  LedgerStore::Save(ledger, path);
  UserLedger restored;
  BOOST_CHECK(LedgerStore::Load(path, restored));
  BOOST_CHECK(restored.Accounts() == ledger.Accounts());
  BOOST_CHECK_EQUAL(restored.WatchlistAt(0), kBob);
  BOOST_CHECK(!fs::exists(path + ".tmp"));
  fs::remove(path);
}

BOOST_AUTO_TEST_CASE(missing_file_starts_empty) {
  UserLedger ledger;
  ledger.Deposit(kAlice, Amount(1), Amount(0));
  BOOST_CHECK(!LedgerStore::Load(TempPath("staking_monitor_no_such_ledger.json"), ledger));
  BOOST_CHECK_EQUAL(ledger.WatchlistSize(), 0u);
}

BOOST_AUTO_TEST_CASE(malformed_documents_are_rejected) {
  UserLedger ledger;
  ledger.Deposit(kAlice, Amount(1), Amount(0));
  auto good = LedgerStore::ToJson(ledger);

  BOOST_CHECK_THROW(LedgerStore::FromJson(nlohmann::json::array(), ledger), std::runtime_error);
  auto doc = good;
  doc["version"] = 2;
  BOOST_CHECK_THROW(LedgerStore::FromJson(doc, ledger), std::runtime_error);
  doc = good;
  doc["version"] = "1";
  BOOST_CHECK_THROW(LedgerStore::FromJson(doc, ledger), std::runtime_error);
  doc = good;
  doc["users"][0]["pending_to_convert"] = "-5";
  BOOST_CHECK_THROW(LedgerStore::FromJson(doc, ledger), std::runtime_error);
  doc = good;
  doc["users"][0]["conversion_percentage"] = 150;
  BOOST_CHECK_THROW(LedgerStore::FromJson(doc, ledger), std::runtime_error);
  doc = good;
  doc["users"].push_back(good["users"][0]);
  BOOST_CHECK_THROW(LedgerStore::FromJson(doc, ledger), std::runtime_error);

  // failed loads leave the ledger as it was
  BOOST_CHECK_EQUAL(ledger.WatchlistSize(), 1u);
  BOOST_CHECK_EQUAL(ledger.DepositBalance(kAlice), Amount(1));
}

BOOST_AUTO_TEST_CASE(amounts_beyond_256_bits_are_rejected) {
  UserLedger ledger;
  ledger.Deposit(kAlice, Amount(1), Amount(0));
  auto doc = LedgerStore::ToJson(ledger);

  doc["users"][0]["converted_balance"] = std::string(78, '9');
  BOOST_CHECK_THROW(LedgerStore::FromJson(doc, ledger), std::runtime_error);
  doc["users"][0]["converted_balance"] =
    "115792089237316195423570985008687907853269984665640564039457584007913129639936";
  BOOST_CHECK_THROW(LedgerStore::FromJson(doc, ledger), std::runtime_error);
  BOOST_CHECK_EQUAL(ledger.Find(kAlice)->converted_balance, Amount(0));

  doc["users"][0]["converted_balance"] =
    "115792089237316195423570985008687907853269984665640564039457584007913129639935";
  LedgerStore::FromJson(doc, ledger);
  BOOST_CHECK_EQUAL(ledger.Find(kAlice)->converted_balance, std::numeric_limits<Amount>::max());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(config_tests, ConfigReset)

BOOST_AUTO_TEST_CASE(env_file_parsing) {
  const std::string path = TempPath("staking_monitor_test.env");
  {
    std::ofstream out(path);
    out << "# comment\n"
        << "SMT_PLAIN=value\n"
        << "export SMT_EXPORTED = 42\n"
        << "SMT_QUOTED=\"with spaces\"\n"
        << "SMT_BOOL=yes\n"
        << "not a pair\n";
  }
  ConfigManager::Initialize(path);
  BOOST_CHECK_EQUAL(ConfigManager::Get("SMT_PLAIN").value_or(""), "value");
  BOOST_CHECK_EQUAL(ConfigManager::GetIntOr("SMT_EXPORTED", 0), 42);
  BOOST_CHECK_EQUAL(ConfigManager::Get("SMT_QUOTED").value_or(""), "with spaces");
  BOOST_CHECK(ConfigManager::GetBoolOr("SMT_BOOL", false));
  BOOST_CHECK_EQUAL(ConfigManager::GetIntOr("SMT_PLAIN", 7), 7);
  BOOST_CHECK(!ConfigManager::Get("SMT_MISSING"));
  BOOST_CHECK_THROW(ConfigManager::GetOrThrow("SMT_MISSING"), std::runtime_error);
  fs::remove(path);
}

BOOST_AUTO_TEST_CASE(monitor_config_requires_a_price_source) {
  ConfigManager::Set("RPC_URL", "http://localhost:8545");
  ConfigManager::Set("ROUTER_ADDRESS", "0x7a250d5630b4cf539739df2c5dacb4c659f2488d");
  ConfigManager::Set("WETH_ADDRESS", "0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2");
  ConfigManager::Set("STABLE_ADDRESS", "0x6b175474e89094c44da98b954eedeac495271d0f");
  BOOST_CHECK_THROW(LoadMonitorConfig(), std::runtime_error);

  ConfigManager::Set("PRICE_OVERRIDE", "1850.25");
  ConfigManager::Set("ACCRUAL_INTERVAL_S", "60");
  auto cfg = LoadMonitorConfig();
  BOOST_CHECK_EQUAL(cfg.price_override, "1850.25");
  BOOST_CHECK_EQUAL(cfg.accrual_interval_s, 60);
  BOOST_CHECK_EQUAL(cfg.price_decimals, 8);
  BOOST_CHECK_EQUAL(cfg.max_slippage_bps, 50u);
  BOOST_CHECK(!cfg.auth_header);
  BOOST_CHECK_EQUAL(cfg.chain_id, 0u);

  ConfigManager::Set("CHAIN_ID", "1");
  BOOST_CHECK_EQUAL(LoadMonitorConfig().chain_id, 1u);
  ConfigManager::Set("CHAIN_ID", "-1");
  BOOST_CHECK_THROW(LoadMonitorConfig(), std::runtime_error);
  ConfigManager::Set("CHAIN_ID", "1");

  ConfigManager::Set("MAX_SLIPPAGE_BPS", "20000");
  BOOST_CHECK_THROW(LoadMonitorConfig(), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
