#include "common/logger.hpp"
#include "common/config_manager.hpp"
#include "sim/scenario_runner.hpp"
#include "telemetry/csv_logger.hpp"
#include "telemetry/structured_logger.hpp"
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>

static void ShutdownLogging() {
  StructuredLogger::Instance().Shutdown();
  Logger::Shutdown();
}

int main(int argc, char** argv) {
  try {
    ConfigManager::Initialize(".env");

    Logger::Initialize(ConfigManager::GetStringOr("LOG_FILE", "dsc_engine.log"),
                       Logger::ParseLevel(ConfigManager::GetStringOr("LOG_LEVEL", "INFO")),
                       ConfigManager::GetBoolOr("LOG_TO_STDERR", false));
    const std::string metrics_file = ConfigManager::GetStringOr("METRICS_FILE", "metrics.jsonl");
    if (!metrics_file.empty()) {
      StructuredLogger::Instance().Initialize(metrics_file);
    }
    Logger::Info("dsc_sim starting up");

    std::string scenario_path;
    if (argc > 1) {
      scenario_path = argv[1];
    } else {
      scenario_path = ConfigManager::GetOrThrow("SCENARIO_FILE");
    }
    Logger::Info("Loading scenario " + scenario_path);
    nlohmann::json scenario = ScenarioRunner::LoadFile(scenario_path);

    // Environment overrides only fill what the scenario leaves open
    if (auto engine = ConfigManager::Get("ENGINE_ADDRESS")) {
      if (!scenario.contains("engine")) scenario["engine"] = *engine;
    }
    if (!scenario.contains("start_time")) {
      if (ConfigManager::Get("SIM_START_TIME")) {
        scenario["start_time"] = ConfigManager::GetUint64Or("SIM_START_TIME", 0);
      }
    }

    ScenarioRunner runner(scenario);
    std::unique_ptr<CsvLogger> audit;
    const std::string csv_path = ConfigManager::GetStringOr("LIQUIDATION_CSV", "liquidations.csv");
    if (!csv_path.empty()) {
      audit.reset(new CsvLogger(csv_path));
      runner.SetAuditLog(audit.get());
    }

    ScenarioResult result = runner.Run();
    std::cout << result.summary.dump(2) << std::endl;

    Logger::Info(std::string("Scenario finished, expectations ") + (result.expectations_met ? "met" : "NOT met"));
    if (audit) audit->Flush();
    ShutdownLogging();
    return result.expectations_met ? 0 : 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    Logger::Critical(std::string("Fatal error: ") + e.what());
    ShutdownLogging();
    return 2;
  }
}
