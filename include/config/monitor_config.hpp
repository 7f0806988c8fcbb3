#pragma once
#include <string>
#include <optional>

struct MonitorConfig {
  std::string rpc_url;
  std::optional<std::string> auth_header;
  int rpc_timeout_ms = 2000;
  // 0 skips the startup eth_chainId check
  unsigned long long chain_id = 0;

  // empty feed address means PRICE_OVERRIDE drives a static oracle
  std::string price_feed_address;
  std::string price_override;
  int price_decimals = 8;
  long long price_max_age_s = 0;

  std::string router_address;
  std::string weth_address;
  std::string stable_address;
  unsigned int max_slippage_bps = 50;
  long long swap_deadline_s = 180;

  int accrual_interval_s = 180;
  int poll_interval_ms = 15000;

  std::string ledger_path = "ledger.json";
  std::string journal_path = "conversions.csv";
};

// Reads MonitorConfig from ConfigManager; throws std::runtime_error for
// missing required keys or out-of-range values.
MonitorConfig LoadMonitorConfig();
