#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <sstream>

std::unique_ptr<Logger> Logger::instance_;
std::mutex Logger::instance_mutex_;

namespace {
  std::string LocalTime(const std::chrono::system_clock::time_point& tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03d", buf, static_cast<int>(ms));
    return out;
  }

  std::string BaseName(const std::string& path) {
    auto pos = path.find_last_of("/\\");
    return pos == std::string::npos ? path : path.substr(pos + 1);
  }
}

LogLevel ParseLogLevel(const std::string& name, LogLevel fallback) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  if (s == "debug") return LogLevel::DEBUG;
  if (s == "info") return LogLevel::INFO;
  if (s == "warn" || s == "warning") return LogLevel::WARNING;
  if (s == "error") return LogLevel::ERROR;
  if (s == "critical" || s == "crit") return LogLevel::CRITICAL;
  return fallback;
}

void Logger::Initialize(const std::string& path, LogLevel min_level, bool console) {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  if (instance_) return;
  std::unique_ptr<Logger> logger(new Logger(min_level, console));
  if (!path.empty()) {
    logger->sink_.open(path, std::ios::out | std::ios::app);
    if (!logger->sink_.is_open()) std::cerr << "Failed to open log file: " << path << std::endl;
  }
  logger->drainer_ = std::thread(&Logger::Drain, logger.get());
  instance_ = std::move(logger);
}

void Logger::Shutdown() {
  std::unique_ptr<Logger> logger;
  {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    logger = std::move(instance_);
  }
  // destructor joins the drainer after the final batch
}

Logger::~Logger() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    stopping_ = true;
  }
  wake_.notify_all();
  if (drainer_.joinable()) drainer_.join();
  if (sink_.is_open()) sink_.close();
}

void Logger::Drain() {
  std::vector<LogEntry> batch;
  while (true) {
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      wake_.wait(lock, [this]{ return !pending_.empty() || stopping_; });
      if (pending_.empty() && stopping_) return;
      batch.swap(pending_);
    }
    Write(batch);
    batch.clear();
  }
}

const char* Logger::LevelName(LogLevel l) {
  switch (l) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARNING: return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::CRITICAL: return "CRIT";
  }
  return "UNK";
}

std::string Logger::Format(const LogEntry& e) {
  std::ostringstream oss;
  oss << LocalTime(e.timestamp) << " [" << LevelName(e.level) << "] (" << e.thread_id << ") "
      << BaseName(e.file) << ":" << e.line << " - " << e.message << '\n';
  return oss.str();
}

void Logger::Write(const std::vector<LogEntry>& batch) {
  for (const auto& e : batch) {
    const std::string line = Format(e);
    if (sink_.is_open()) sink_ << line;
    if (console_) (e.level >= LogLevel::WARNING ? std::cerr : std::clog) << line;
  }
  if (sink_.is_open()) sink_.flush();
}

void Logger::Log(LogLevel level, const std::string& message, const std::string& file, int line) {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  if (!instance_ || level < instance_->min_level_) return;
  {
    std::lock_guard<std::mutex> qlock(instance_->queue_mutex_);
    instance_->pending_.push_back(LogEntry{std::chrono::system_clock::now(), level, message, file, line,
                                           std::this_thread::get_id()});
  }
  instance_->wake_.notify_one();
}

void Logger::Debug(const std::string& m, const std::string& f, int l) { Log(LogLevel::DEBUG, m, f, l); }
void Logger::Info(const std::string& m, const std::string& f, int l) { Log(LogLevel::INFO, m, f, l); }
void Logger::Warning(const std::string& m, const std::string& f, int l) { Log(LogLevel::WARNING, m, f, l); }
void Logger::Error(const std::string& m, const std::string& f, int l) { Log(LogLevel::ERROR, m, f, l); }
void Logger::Critical(const std::string& m, const std::string& f, int l) { Log(LogLevel::CRITICAL, m, f, l); }
