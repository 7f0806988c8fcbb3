#pragma once
#include <string>
#include <fstream>
#include <mutex>
#include <chrono>
#include <vector>

struct ConversionRecord {
  std::string user;
  std::string status;      // CONVERTED / FAILED
  std::string price;       // decimal, oracle scale applied
  std::string amount_in;   // base asset, decimal
  std::string amount_out;  // stable asset, decimal
  std::string converted_total;
  std::string error;
};

// Buffered CSV journal of conversion attempts.
class ConversionJournal {
public:
  explicit ConversionJournal(const std::string& filename);
  ~ConversionJournal();

  void Record(const ConversionRecord& record);
  void Flush();

private:
  std::ofstream file_;
  std::mutex mutex_;
  std::string filename_;

  std::vector<std::string> write_buffer_;
  static constexpr size_t BUFFER_SIZE = 32;
  std::chrono::steady_clock::time_point last_flush_;
  static constexpr auto FLUSH_INTERVAL = std::chrono::seconds(5);

  void WriteHeader();
  void FlushBuffer();
  static std::string Quote(const std::string& field);
  static std::string CurrentTimestamp();
};
