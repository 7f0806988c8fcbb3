#pragma once
#include <chrono>
#include <condition_variable>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

enum class LogLevel { DEBUG, INFO, WARNING, ERROR, CRITICAL };

// "debug", "info", "warn"/"warning", "error", "critical"; unknown names map to fallback
LogLevel ParseLogLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

struct LogEntry {
  std::chrono::system_clock::time_point timestamp;
  LogLevel level;
  std::string message;
  std::string file;
  int line;
  std::thread::id thread_id;
};

// Process-wide asynchronous logger. A background thread drains queued entries
// in batches to the log file and, optionally, the console. Calls before
// Initialize (or after Shutdown) are dropped, which keeps unit tests quiet.
class Logger {
public:
  static void Initialize(const std::string& path, LogLevel min_level = LogLevel::INFO, bool console = false);
  // Writes everything still queued, then stops the worker
  static void Shutdown();

  static void Log(LogLevel level, const std::string& message, const std::string& file = __FILE__, int line = __LINE__);
  static void Debug(const std::string& m, const std::string& f = __FILE__, int l = __LINE__);
  static void Info(const std::string& m, const std::string& f = __FILE__, int l = __LINE__);
  static void Warning(const std::string& m, const std::string& f = __FILE__, int l = __LINE__);
  static void Error(const std::string& m, const std::string& f = __FILE__, int l = __LINE__);
  static void Critical(const std::string& m, const std::string& f = __FILE__, int l = __LINE__);

  ~Logger();

private:
  Logger(LogLevel min_level, bool console) : min_level_(min_level), console_(console) {}
  void Drain();
  void Write(const std::vector<LogEntry>& batch);
  static std::string Format(const LogEntry& e);
  static const char* LevelName(LogLevel l);

  static std::unique_ptr<Logger> instance_;
  static std::mutex instance_mutex_;

  const LogLevel min_level_;
  const bool console_;
  std::ofstream sink_;
  std::mutex queue_mutex_;
  std::condition_variable wake_;
  std::vector<LogEntry> pending_;
  bool stopping_ = false;
  std::thread drainer_;
};
