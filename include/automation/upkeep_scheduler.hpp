#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

class StakingMonitor;

// Polling driver standing in for an external keeper network: every poll it runs
// the accrual pass when due, then performs conversions when the check says so.
class UpkeepScheduler {
public:
  // Called after a step that may have mutated the ledger
  using OnStateChangedFn = std::function<void()>;

  UpkeepScheduler(StakingMonitor& monitor, std::chrono::milliseconds poll_interval,
                  OnStateChangedFn on_state_changed = nullptr)
    : monitor_(monitor), poll_interval_(poll_interval), on_state_changed_(std::move(on_state_changed)) {}
  ~UpkeepScheduler() { Stop(); }

  void Start();
  void Stop();
  // One poll; exposed for tests and the single-shot CLI commands
  void Tick();
  unsigned long long Ticks() const { return ticks_.load(std::memory_order_relaxed); }

private:
  void Run();

  StakingMonitor& monitor_;
  std::chrono::milliseconds poll_interval_;
  OnStateChangedFn on_state_changed_;
  std::atomic<bool> running_{false};
  std::atomic<unsigned long long> ticks_{0};
  std::mutex wait_mutex_;
  std::condition_variable wake_;
  std::thread worker_;
};
