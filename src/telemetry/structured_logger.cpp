#include "telemetry/structured_logger.hpp"
#include <fstream>
#include <chrono>

StructuredLogger& StructuredLogger::Instance() {
  static StructuredLogger inst;
  return inst;
}

StructuredLogger::~StructuredLogger() { Shutdown(); }

void StructuredLogger::Initialize(const std::string& file_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) return;
  file_path_ = file_path;
  running_ = true;
  worker_ = std::thread(&StructuredLogger::Worker, this);
}

void StructuredLogger::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

void StructuredLogger::LogEvent(const std::string& event, nlohmann::json fields) {
  if (!fields.is_object()) fields = nlohmann::json{ {"value", fields} };
  fields["event"] = event;
  fields["ts_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  LogJsonLine(fields.dump());
}

void StructuredLogger::LogJsonLine(const std::string& json_line) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;
    queue_.push(json_line);
  }
  cv_.notify_one();
}

void StructuredLogger::Worker() {
  std::ofstream out(file_path_, std::ios::app | std::ios::out);
  std::string batch;
  batch.reserve(8192);
  std::unique_lock<std::mutex> lock(mutex_);
  for (;;) {
    cv_.wait_for(lock, std::chrono::milliseconds(80), [&]{ return !queue_.empty() || !running_; });
    while (!queue_.empty() && batch.size() <= 4096) {
      batch.append(queue_.front());
      batch.push_back('\n');
      queue_.pop();
    }
    const bool done = !running_ && queue_.empty();
    lock.unlock();
    if (!batch.empty() && out.is_open()) {
      out << batch;
      out.flush();
    }
    batch.clear();
    if (done) break;
    lock.lock();
  }
}
