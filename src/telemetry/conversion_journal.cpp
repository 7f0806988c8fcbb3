#include "telemetry/conversion_journal.hpp"
#include "common/logger.hpp"
#include <iomanip>
#include <sstream>
#include <ctime>

ConversionJournal::ConversionJournal(const std::string& filename)
  : filename_(filename), last_flush_(std::chrono::steady_clock::now()) {
  write_buffer_.reserve(BUFFER_SIZE);
  bool has_header = false;
  {
    std::ifstream check(filename);
    std::string first_line;
    if (check.good() && std::getline(check, first_line))
      has_header = first_line.rfind("Timestamp,User,", 0) == 0;
  }
  file_.open(filename, std::ios::app);
  if (!file_.is_open()) {
    Logger::Error("Failed to open conversion journal: " + filename);
    return;
  }
  if (!has_header) WriteHeader();
}

ConversionJournal::~ConversionJournal() {
  Flush();
}

void ConversionJournal::WriteHeader() {
  file_ << "Timestamp,User,Status,Price,Amount_In,Amount_Out,Converted_Total,Error\n";
  file_.flush();
}

std::string ConversionJournal::Quote(const std::string& field) {
  std::string out = "\"";
  for (char c : field) {
    if (c == '"') out += '"';
    out += c;
  }
  return out + "\"";
}

void ConversionJournal::Record(const ConversionRecord& r) {
  std::ostringstream oss;
  oss << Quote(CurrentTimestamp()) << ','
      << Quote(r.user) << ','
      << Quote(r.status) << ','
      << r.price << ','
      << r.amount_in << ','
      << r.amount_out << ','
      << r.converted_total << ','
      << Quote(r.error) << '\n';
  std::lock_guard<std::mutex> lock(mutex_);
  write_buffer_.push_back(oss.str());
  // failures go out immediately
  if (r.status != "CONVERTED" || write_buffer_.size() >= BUFFER_SIZE ||
      std::chrono::steady_clock::now() - last_flush_ >= FLUSH_INTERVAL) {
    FlushBuffer();
  }
}

void ConversionJournal::FlushBuffer() {
  if (write_buffer_.empty()) return;
  if (file_.is_open()) {
    for (const auto& line : write_buffer_) file_ << line;
    file_.flush();
  }
  write_buffer_.clear();
  last_flush_ = std::chrono::steady_clock::now();
}

void ConversionJournal::Flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  FlushBuffer();
}

std::string ConversionJournal::CurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
  std::tm tm_buf;
#if defined(_WIN32)
  gmtime_s(&tm_buf, &t);
#else
  gmtime_r(&t, &tm_buf);
#endif
  std::stringstream ss;
  ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << " UTC";
  return ss.str();
}
