#include "automation/upkeep_scheduler.hpp"
#include "service/staking_monitor.hpp"
#include "common/logger.hpp"

void UpkeepScheduler::Start() {
  if (running_.exchange(true)) return;
  worker_ = std::thread([this]{ Run(); });
  Logger::Info("Upkeep scheduler started, poll every " + std::to_string(poll_interval_.count()) + " ms");
}

void UpkeepScheduler::Stop() {
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    running_.store(false);
  }
  wake_.notify_all();
  if (!worker_.joinable()) return;
  worker_.join();
  Logger::Info("Upkeep scheduler stopped after " + std::to_string(Ticks()) + " ticks");
}

void UpkeepScheduler::Tick() {
  ticks_.fetch_add(1, std::memory_order_relaxed);
  bool changed = false;
  if (auto accrual = monitor_.RunAccrualIfDue(std::chrono::system_clock::now())) {
    changed = true;
    if (accrual->Failures() > 0)
      Logger::Warning(std::to_string(accrual->Failures()) + " accrual failures, retrying next interval");
  }
  auto check = monitor_.CheckNeeded();
  if (check.needed) {
    auto report = monitor_.PerformAction(check.perform_data);
    changed = changed || !report.NoOp();
    if (report.Failures() > 0)
      Logger::Warning(std::to_string(report.Failures()) + " conversions failed, retrying next poll");
  }
  if (changed && on_state_changed_) on_state_changed_();
}

void UpkeepScheduler::Run() {
  while (running_.load(std::memory_order_relaxed)) {
    try {
      Tick();
    } catch (const std::exception& e) {
      Logger::Error(std::string("Upkeep tick failed: ") + e.what());
    }
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wake_.wait_for(lock, poll_interval_, [this]{ return !running_.load(std::memory_order_relaxed); });
  }
}
