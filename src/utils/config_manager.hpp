#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config_types.hpp"

namespace arbgate {

class ConfigManager {
public:
    // Missing sections and keys keep their defaults. Environment overrides
    // (ARBGATE_MODE, ARBGATE_CAPITAL_USD, ARBGATE_LOG_LEVEL) are applied
    // after parsing.
    bool load(const std::string& file_path);
    bool load_from_string(const std::string& json_text);

    void load_env_overrides();

    AppConfig& get_app_config();
    LoggingConfig& get_logging_config();
    ScannerConfig& get_scanner_config();
    std::vector<VenueConfig>& get_venue_configs();
    FeeConfig& get_fee_config();
    OrchestratorConfig& get_orchestrator_config();
    RiskOracleConfig& get_risk_oracle_config();
    ExecutionConfig& get_execution_config();
    KillSwitchConfig& get_kill_switch_config();
    TelemetryConfig& get_telemetry_config();

    const AppConfig& get_app_config() const { return app_config_; }
    const LoggingConfig& get_logging_config() const { return logging_config_; }
    const ScannerConfig& get_scanner_config() const { return scanner_config_; }
    const std::vector<VenueConfig>& get_venue_configs() const { return venue_configs_; }
    const FeeConfig& get_fee_config() const { return fee_config_; }
    const OrchestratorConfig& get_orchestrator_config() const { return orchestrator_config_; }
    const RiskOracleConfig& get_risk_oracle_config() const { return risk_oracle_config_; }
    const ExecutionConfig& get_execution_config() const { return execution_config_; }
    const KillSwitchConfig& get_kill_switch_config() const { return kill_switch_config_; }
    const TelemetryConfig& get_telemetry_config() const { return telemetry_config_; }

private:
    bool parse(const nlohmann::json& data);

    AppConfig app_config_;
    LoggingConfig logging_config_;
    ScannerConfig scanner_config_;
    std::vector<VenueConfig> venue_configs_;
    FeeConfig fee_config_;
    OrchestratorConfig orchestrator_config_;
    RiskOracleConfig risk_oracle_config_;
    ExecutionConfig execution_config_;
    KillSwitchConfig kill_switch_config_;
    TelemetryConfig telemetry_config_;
};

} // namespace arbgate
