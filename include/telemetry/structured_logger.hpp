#pragma once
#include <string>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <queue>
#include <nlohmann/json.hpp>

// Append-only JSONL event stream written by a background thread.
class StructuredLogger {
public:
  static StructuredLogger& Instance();
  // Stamps "event" and "ts_ms" onto fields and enqueues one line
  void LogEvent(const std::string& event, nlohmann::json fields = nlohmann::json::object());
  // Enqueue a pre-built JSON line (one object, no trailing newline needed)
  void LogJsonLine(const std::string& json_line);
  void Initialize(const std::string& file_path);
  // Drains the queue and stops the worker; later events are dropped
  void Shutdown();
private:
  StructuredLogger() = default;
  ~StructuredLogger();
  void Worker();
  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<std::string> queue_;
  std::thread worker_;
  bool running_ = false;
  std::string file_path_;
};
