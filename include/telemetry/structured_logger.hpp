#pragma once
#include <string>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <queue>
#include <nlohmann/json.hpp>

// Append-only JSON-lines event journal written by a background thread.
// Events logged before Initialize() are dropped.
class StructuredLogger {
public:
  static StructuredLogger& Instance();
  // Enqueue a pre-built JSON line (one object, no trailing newline needed)
  void LogJsonLine(const std::string& json_line);
  // Stamps "event" and "ts_ms" onto the payload and enqueues it
  void LogEvent(const std::string& event, nlohmann::json payload);
  // Graceful shutdown; drains the queue
  void Shutdown();
  void Initialize(const std::string& file_path);
  bool IsRunning();
private:
  StructuredLogger();
  ~StructuredLogger();
  void Worker();
  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<std::string> queue_;
  std::thread worker_;
  bool running_ = false;
  std::string file_path_;
};
