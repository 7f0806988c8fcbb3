#include "common/logger.hpp"
#include "common/config_manager.hpp"
#include "common/fixed_point.hpp"
#include "common/errors.hpp"
#include "config/monitor_config.hpp"
#include "net/http_client.hpp"
#include "node_connection/rpc_client.hpp"
#include "oracle/chainlink_price_feed.hpp"
#include "oracle/static_price_oracle.hpp"
#include "monitor/rpc_balance_source.hpp"
#include "routing/v2_exchange_router.hpp"
#include "ledger/user_ledger.hpp"
#include "ledger/ledger_store.hpp"
#include "service/staking_monitor.hpp"
#include "automation/upkeep_scheduler.hpp"
#include "telemetry/structured_logger.hpp"
#include "telemetry/conversion_journal.hpp"
#include <atomic>
#include <csignal>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {
  constexpr int kEtherDecimals = 18;

  std::atomic<bool> g_stop{false};
  void OnSignal(int) { g_stop.store(true); }

  void PrintUsage() {
    std::cerr << "usage: staking_monitor <command> [args]\n"
              << "  deposit <user> <amount-ether>\n"
              << "  set-order <user> <target-price> <percentage>\n"
              << "  accrue | perform | check\n"
              << "  status [user]\n"
              << "  run\n";
  }

  int ParsePercentage(const std::string& s) {
    size_t used = 0;
    int v = std::stoi(s, &used);
    if (used != s.size()) throw InvalidParameter("percentage must be an integer: " + s);
    return v;
  }

  void PrintAccount(const UserAccount& a, int price_decimals) {
    std::cout << a.user << "\n"
              << "  deposit_total          " << FixedPoint::Format(a.deposit_total, kEtherDecimals) << "\n"
              << "  last_observed_balance  " << FixedPoint::Format(a.last_observed_balance, kEtherDecimals) << "\n"
              << "  pending_to_convert     " << FixedPoint::Format(a.pending_to_convert, kEtherDecimals) << "\n"
              << "  converted_balance      " << a.converted_balance.str() << "\n"
              << "  target_price           " << (a.HasOrder() ? FixedPoint::Format(a.target_price, price_decimals) : "-") << "\n"
              << "  conversion_percentage  " << a.conversion_percentage << "\n";
  }

  void PrintAccrual(const AccrualReport& r) {
    for (const auto& o : r.outcomes) {
      std::cout << o.user << " " << ToString(o.status) << " accrued=" << FixedPoint::Format(o.accrued, kEtherDecimals);
      if (!o.error.empty()) std::cout << " error=" << o.error;
      std::cout << "\n";
    }
    if (r.NoOp()) std::cout << "accrual: nothing to do\n";
  }

  void PrintConversion(const ConversionReport& r) {
    for (const auto& o : r.outcomes) {
      std::cout << o.user << " " << ToString(o.status);
      if (o.status == ConversionStatus::Converted)
        std::cout << " in=" << FixedPoint::Format(o.amount_in, kEtherDecimals) << " out=" << o.amount_out.str();
      if (!o.error.empty()) std::cout << " error=" << o.error;
      std::cout << "\n";
    }
    if (r.NoOp()) std::cout << "perform: nothing to do\n";
  }
}

int main(int argc, char** argv) {
  if (argc < 2) { PrintUsage(); return 1; }
  const std::string command = argv[1];
  std::vector<std::string> args(argv + 2, argv + argc);

  try {
    ConfigManager::Initialize(ConfigManager::Get("ENV_FILE").value_or(".env"));
    Logger::Initialize(ConfigManager::Get("LOG_PATH").value_or("staking_monitor.log"),
                       ParseLogLevel(ConfigManager::Get("LOG_LEVEL").value_or("info")),
                       ConfigManager::GetBoolOr("LOG_CONSOLE", false));
    StructuredLogger::Instance().Initialize(ConfigManager::Get("METRICS_PATH").value_or("metrics.jsonl"));
    Logger::Info("staking_monitor " + command);

    const MonitorConfig cfg = LoadMonitorConfig();

    HttpClientTuning tuning;
    std::unique_ptr<HttpClient> http(CreateCurlHttpClient(tuning));
    RpcClient rpc(*http, cfg.rpc_url, cfg.auth_header, cfg.rpc_timeout_ms);
    if (cfg.chain_id != 0) {
      const Amount actual = FixedPoint::ParseHexQuantity(rpc.EthChainId());
      if (actual != cfg.chain_id)
        throw ExternalFailure("RPC_URL serves chain " + actual.str() + ", expected " + std::to_string(cfg.chain_id));
      Logger::Info("Connected to chain " + actual.str());
    }

    std::unique_ptr<PriceOracle> oracle;
    if (!cfg.price_feed_address.empty()) {
      oracle.reset(new ChainlinkPriceFeed(rpc, cfg.price_feed_address, cfg.price_max_age_s));
    } else {
      oracle.reset(new StaticPriceOracle(cfg.price_decimals, FixedPoint::Parse(cfg.price_override, cfg.price_decimals)));
      Logger::Info("Using static price " + cfg.price_override);
    }
    RpcBalanceSource balances(rpc);
    V2RouterParams router_params;
    router_params.router = cfg.router_address;
    router_params.wrapped_native = cfg.weth_address;
    router_params.stable = cfg.stable_address;
    router_params.max_slippage_bps = cfg.max_slippage_bps;
    router_params.deadline_s = cfg.swap_deadline_s;
    // No SwapSubmitter: conversions settle at the router's on-chain quote
    V2ExchangeRouter router(rpc, router_params);
    ConversionJournal journal(cfg.journal_path);

    UserLedger ledger;
    LedgerStore::Load(cfg.ledger_path, ledger);
    StakingMonitor monitor(ledger, *oracle, router, balances, std::chrono::seconds(cfg.accrual_interval_s), &journal);
    auto save = [&]{ LedgerStore::Save(ledger, cfg.ledger_path); };

    int rc = 0;
    if (command == "deposit" && args.size() == 2) {
      bool registered = monitor.Deposit(args[0], FixedPoint::Parse(args[1], kEtherDecimals));
      save();
      std::cout << (registered ? "registered " : "deposited ") << args[0]
                << " total=" << FixedPoint::Format(monitor.DepositBalance(args[0]), kEtherDecimals) << "\n";
    } else if (command == "set-order" && args.size() == 3) {
      monitor.ConfigureOrderDecimal(args[0], args[1], ParsePercentage(args[2]));
      save();
      std::cout << "order set for " << args[0] << "\n";
    } else if (command == "accrue" && args.empty()) {
      PrintAccrual(monitor.RunAccrual());
      save();
    } else if (command == "perform" && args.empty()) {
      auto report = monitor.PerformAction();
      save();
      PrintConversion(report);
      if (report.Failures() > 0) rc = 1;
    } else if (command == "check" && args.empty()) {
      auto check = monitor.CheckNeeded();
      std::cout << (check.needed ? "needed " : "not-needed ") << check.perform_data << "\n";
    } else if (command == "status" && args.size() <= 1) {
      const int decimals = monitor.PriceDecimals();
      std::cout << "price " << FixedPoint::Format(monitor.GetPrice(), decimals) << "\n";
      if (args.size() == 1) {
        auto acc = monitor.Account(args[0]);
        if (!acc) { std::cerr << "unknown user " << args[0] << "\n"; rc = 1; }
        else PrintAccount(*acc, decimals);
      } else {
        for (size_t i = 0; i < monitor.WatchlistSize(); ++i) {
          if (auto acc = monitor.Account(monitor.WatchlistAt(i))) PrintAccount(*acc, decimals);
        }
      }
    } else if (command == "run" && args.empty()) {
      std::signal(SIGINT, OnSignal);
      std::signal(SIGTERM, OnSignal);
      UpkeepScheduler scheduler(monitor, std::chrono::milliseconds(cfg.poll_interval_ms), [&]{
        try {
          save();
        } catch (const std::exception& e) {
          Logger::Error(std::string("Saving ledger failed: ") + e.what());
        }
      });
      scheduler.Start();
      while (!g_stop.load()) std::this_thread::sleep_for(std::chrono::milliseconds(200));
      scheduler.Stop();
      save();
    } else {
      PrintUsage();
      rc = 1;
    }

    journal.Flush();
    Logger::Shutdown();
    StructuredLogger::Instance().Shutdown();
    return rc;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << std::endl;
    Logger::Critical(std::string("Fatal: ") + e.what());
    Logger::Shutdown();
    StructuredLogger::Instance().Shutdown();
    return 1;
  }
}
