#include "config/monitor_config.hpp"
#include "common/config_manager.hpp"
#include <stdexcept>

MonitorConfig LoadMonitorConfig() {
  MonitorConfig cfg;
  cfg.rpc_url = ConfigManager::GetOrThrow("RPC_URL");
  if (auto a = ConfigManager::Get("RPC_AUTH_HEADER"); a && !a->empty()) cfg.auth_header = *a;
  cfg.rpc_timeout_ms = ConfigManager::GetIntOr("RPC_TIMEOUT_MS", cfg.rpc_timeout_ms);
  const int chain_id = ConfigManager::GetIntOr("CHAIN_ID", 0);
  if (chain_id < 0) throw std::runtime_error("CHAIN_ID must not be negative");
  cfg.chain_id = static_cast<unsigned long long>(chain_id);

  cfg.price_feed_address = ConfigManager::Get("PRICE_FEED_ADDRESS").value_or("");
  cfg.price_override = ConfigManager::Get("PRICE_OVERRIDE").value_or("");
  cfg.price_decimals = ConfigManager::GetIntOr("PRICE_DECIMALS", cfg.price_decimals);
  cfg.price_max_age_s = ConfigManager::GetIntOr("PRICE_MAX_AGE_S", 0);
  if (cfg.price_feed_address.empty() && cfg.price_override.empty())
    throw std::runtime_error("Either PRICE_FEED_ADDRESS or PRICE_OVERRIDE must be set");

  cfg.router_address = ConfigManager::GetOrThrow("ROUTER_ADDRESS");
  cfg.weth_address = ConfigManager::GetOrThrow("WETH_ADDRESS");
  cfg.stable_address = ConfigManager::GetOrThrow("STABLE_ADDRESS");
  const int slippage = ConfigManager::GetIntOr("MAX_SLIPPAGE_BPS", 50);
  if (slippage < 0 || slippage > 10000) throw std::runtime_error("MAX_SLIPPAGE_BPS must be within [0, 10000]");
  cfg.max_slippage_bps = static_cast<unsigned int>(slippage);
  cfg.swap_deadline_s = ConfigManager::GetIntOr("SWAP_DEADLINE_S", 180);

  cfg.accrual_interval_s = ConfigManager::GetIntOr("ACCRUAL_INTERVAL_S", cfg.accrual_interval_s);
  cfg.poll_interval_ms = ConfigManager::GetIntOr("POLL_INTERVAL_MS", cfg.poll_interval_ms);
  if (cfg.accrual_interval_s < 0) throw std::runtime_error("ACCRUAL_INTERVAL_S must not be negative");
  if (cfg.poll_interval_ms <= 0) throw std::runtime_error("POLL_INTERVAL_MS must be positive");

  cfg.ledger_path = ConfigManager::Get("LEDGER_PATH").value_or(cfg.ledger_path);
  cfg.journal_path = ConfigManager::Get("JOURNAL_PATH").value_or(cfg.journal_path);
  return cfg;
}
