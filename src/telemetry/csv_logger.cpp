#include "telemetry/csv_logger.hpp"
#include "liquidation/liquidation_engine.hpp"
#include "common/fixed_point.hpp"
#include "common/logger.hpp"
#include <iomanip>
#include <sstream>
#include <ctime>

CsvLogger::CsvLogger(const std::string& filename) : filename_(filename), last_flush_(std::chrono::steady_clock::now()) {
  write_buffer_.reserve(BUFFER_SIZE);
  std::ifstream check_file(filename);
  bool file_exists = check_file.good();
  bool has_headers = false;
  if (file_exists) {
    std::string first_line;
    if (std::getline(check_file, first_line)) {
      has_headers = (first_line.find("Timestamp") != std::string::npos &&
                     first_line.find("Liquidator") != std::string::npos);
    }
    check_file.close();
  }

  file_.open(filename, std::ios::app);
  if (!file_.is_open()) {
    Logger::Error("Failed to open liquidation audit file: " + filename);
    return;
  }
  if (!file_exists || !has_headers) {
    WriteHeader();
    file_.flush();
  }
}

CsvLogger::~CsvLogger() {
  if (file_.is_open()) {
    Flush();
    file_.close();
  }
}

LiquidationRecord CsvLogger::FromReport(const LiquidationReport& report, const std::string& engine_address) {
  LiquidationRecord r;
  r.liquidator = report.liquidator;
  r.user = report.user;
  r.requested_cover = FixedPoint::Format(report.requested_cover);
  r.debt_covered = FixedPoint::Format(report.debt_covered);
  r.seizure_target_usd = FixedPoint::Format(report.seizure_target_usd);
  r.seized_usd = FixedPoint::Format(report.seized_usd);
  for (size_t i = 0; i < report.seized.size(); ++i) {
    if (i) r.seized_assets += ";";
    r.seized_assets += report.seized[i].asset + ":" + FixedPoint::Format(report.seized[i].token_amount);
  }
  r.starting_health_factor = FixedPoint::Format(report.starting_health_factor);
  r.ending_health_factor = FixedPoint::Format(report.ending_health_factor);
  r.engine_address = engine_address;
  return r;
}

void CsvLogger::WriteHeader() {
  std::lock_guard<std::mutex> lock(mutex_);
  file_ << "Timestamp,Liquidator,User,Requested_Cover,Debt_Covered,Seizure_Target_USD,"
        << "Seized_USD,Seized_Assets,Starting_HF,Ending_HF,Execution_Status,Engine" << std::endl;
}

std::string CsvLogger::Quote(const std::string& field) {
  std::string out = "\"";
  for (char c : field) {
    if (c == '"') out += "\"\"";
    else out += c;
  }
  out += "\"";
  return out;
}

void CsvLogger::WriteRecord(const LiquidationRecord& record) {
  std::ostringstream oss;
  oss << Quote(record.timestamp) << ","
      << Quote(record.liquidator) << ","
      << Quote(record.user) << ","
      << record.requested_cover << ","
      << record.debt_covered << ","
      << record.seizure_target_usd << ","
      << record.seized_usd << ","
      << Quote(record.seized_assets) << ","
      << record.starting_health_factor << ","
      << record.ending_health_factor << ","
      << Quote(record.execution_status) << ","
      << Quote(record.engine_address) << "\n";
  WriteToBuffer(oss.str());
}

void CsvLogger::LogLiquidationSuccess(const LiquidationRecord& record) {
  LiquidationRecord success_record = record;
  success_record.execution_status = "SUCCESS";
  success_record.timestamp = GetCurrentTimestamp();
  WriteRecord(success_record);
}

void CsvLogger::LogLiquidationFailure(const LiquidationRecord& record, const std::string& reason) {
  LiquidationRecord failure_record = record;
  failure_record.execution_status = "FAILED: " + reason;
  failure_record.timestamp = GetCurrentTimestamp();
  WriteRecord(failure_record);
}

void CsvLogger::WriteToBuffer(const std::string& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  write_buffer_.push_back(record);
  if (write_buffer_.size() >= BUFFER_SIZE ||
      std::chrono::steady_clock::now() - last_flush_ >= FLUSH_INTERVAL) {
    FlushBuffer();
  }
}

void CsvLogger::FlushBuffer() {
  if (write_buffer_.empty() || !file_.is_open()) return;
  for (const auto& record : write_buffer_) {
    file_ << record;
  }
  file_.flush();
  write_buffer_.clear();
  last_flush_ = std::chrono::steady_clock::now();
}

void CsvLogger::Flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  FlushBuffer();
}

std::string CsvLogger::GetCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
  std::tm tm_buf;
  gmtime_r(&time_t, &tm_buf);
  std::stringstream ss;
  ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  ss << " UTC";
  return ss.str();
}
