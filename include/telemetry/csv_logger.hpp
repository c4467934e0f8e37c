#pragma once
#include <string>
#include <fstream>
#include <mutex>
#include <chrono>
#include <vector>

struct LiquidationReport;

struct LiquidationRecord {
  std::string timestamp;
  std::string liquidator;
  std::string user;
  std::string requested_cover;
  std::string debt_covered;
  std::string seizure_target_usd;
  std::string seized_usd;
  std::string seized_assets;  // "asset:amount;asset:amount"
  std::string starting_health_factor;
  std::string ending_health_factor;
  std::string execution_status;
  std::string engine_address;
};

// Liquidation audit trail, one CSV row per attempt.
class CsvLogger {
public:
  explicit CsvLogger(const std::string& filename);
  ~CsvLogger();

  static LiquidationRecord FromReport(const LiquidationReport& report, const std::string& engine_address);

  void LogLiquidationSuccess(const LiquidationRecord& record);
  void LogLiquidationFailure(const LiquidationRecord& record, const std::string& reason);

  void Flush();
  bool IsOpen() const { return file_.is_open(); }

private:
  std::ofstream file_;
  std::mutex mutex_;
  std::string filename_;

  std::vector<std::string> write_buffer_;
  static constexpr size_t BUFFER_SIZE = 100;
  std::chrono::steady_clock::time_point last_flush_;
  static constexpr auto FLUSH_INTERVAL = std::chrono::seconds(5);

  void WriteHeader();
  void WriteRecord(const LiquidationRecord& record);
  void WriteToBuffer(const std::string& record);
  void FlushBuffer();
  static std::string Quote(const std::string& field);
  std::string GetCurrentTimestamp();
};
