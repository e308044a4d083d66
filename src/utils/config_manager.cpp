#include "config_manager.hpp"
#include <cmath>
#include <fstream>
#include "logger.hpp"
#include "../core/exceptions.hpp"

namespace arbgate {

bool ConfigManager::load(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        ARBGATE_LOG_ERROR("Failed to open config file: {}", file_path);
        return false;
    }

    nlohmann::json data;
    try {
        file >> data;
    } catch (const nlohmann::json::exception& e) {
        ARBGATE_LOG_ERROR("Error parsing config file {}: {}", file_path, e.what());
        return false;
    }

    if (!parse(data)) {
        return false;
    }
    load_env_overrides();
    ARBGATE_LOG_INFO("Configuration loaded from {}", file_path);
    return true;
}

bool ConfigManager::load_from_string(const std::string& json_text) {
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::exception& e) {
        ARBGATE_LOG_ERROR("Error parsing config: {}", e.what());
        return false;
    }

    if (!parse(data)) {
        return false;
    }
    load_env_overrides();
    return true;
}

bool ConfigManager::parse(const nlohmann::json& data) {
    if (!data.is_object()) {
        ARBGATE_LOG_ERROR("Config root must be a JSON object");
        return false;
    }

    try {
        if (data.contains("app")) {
            data["app"].get_to(app_config_);
        }
        if (data.contains("logging")) {
            data["logging"].get_to(logging_config_);
        }
        if (data.contains("scanner")) {
            data["scanner"].get_to(scanner_config_);
        }
        if (data.contains("venues")) {
            const auto& venues = data["venues"];
            if (!venues.is_array()) {
                ARBGATE_LOG_ERROR("Config 'venues' must be an array");
                return false;
            }
            venue_configs_.clear();
            for (const auto& venue : venues) {
                venue_configs_.push_back(venue.get<VenueConfig>());
            }
        }
        if (data.contains("evaluator")) {
            data["evaluator"].get_to(fee_config_);
        }
        if (data.contains("orchestrator")) {
            data["orchestrator"].get_to(orchestrator_config_);
        }
        if (data.contains("risk_oracle")) {
            data["risk_oracle"].get_to(risk_oracle_config_);
        }
        if (data.contains("execution")) {
            data["execution"].get_to(execution_config_);
        }
        if (data.contains("kill_switch")) {
            data["kill_switch"].get_to(kill_switch_config_);
        }
        if (data.contains("telemetry")) {
            data["telemetry"].get_to(telemetry_config_);
        }
    } catch (const nlohmann::json::exception& e) {
        ARBGATE_LOG_ERROR("Invalid config value: {}", e.what());
        return false;
    } catch (const ConfigurationError& e) {
        ARBGATE_LOG_ERROR("{}", e.what());
        return false;
    }
    return true;
}

void ConfigManager::load_env_overrides() {
    const std::string mode = get_env_var("ARBGATE_MODE");
    if (!mode.empty()) {
        if (auto parsed = parse_trading_mode(mode)) {
            orchestrator_config_.mode = *parsed;
            ARBGATE_LOG_INFO("ARBGATE_MODE override: {}", to_string(*parsed));
        } else {
            ARBGATE_LOG_WARN("Ignoring invalid ARBGATE_MODE '{}'", mode);
        }
    }

    const std::string capital = get_env_var("ARBGATE_CAPITAL_USD");
    if (!capital.empty()) {
        try {
            size_t consumed = 0;
            const double value = std::stod(capital, &consumed);
            if (consumed != capital.size() || !std::isfinite(value)) {
                ARBGATE_LOG_WARN("Ignoring invalid ARBGATE_CAPITAL_USD '{}'", capital);
            } else {
                orchestrator_config_.capital_usd = value;
                ARBGATE_LOG_INFO("ARBGATE_CAPITAL_USD override: {}", value);
            }
        } catch (const std::logic_error& e) {
            ARBGATE_LOG_WARN("Ignoring invalid ARBGATE_CAPITAL_USD '{}': {}", capital, e.what());
        }
    }

    const std::string level = get_env_var("ARBGATE_LOG_LEVEL");
    if (!level.empty()) {
        app_config_.log_level = level;
    }
}

AppConfig& ConfigManager::get_app_config() {
    return app_config_;
}

LoggingConfig& ConfigManager::get_logging_config() {
    return logging_config_;
}

ScannerConfig& ConfigManager::get_scanner_config() {
    return scanner_config_;
}

std::vector<VenueConfig>& ConfigManager::get_venue_configs() {
    return venue_configs_;
}

FeeConfig& ConfigManager::get_fee_config() {
    return fee_config_;
}

OrchestratorConfig& ConfigManager::get_orchestrator_config() {
    return orchestrator_config_;
}

RiskOracleConfig& ConfigManager::get_risk_oracle_config() {
    return risk_oracle_config_;
}

ExecutionConfig& ConfigManager::get_execution_config() {
    return execution_config_;
}

KillSwitchConfig& ConfigManager::get_kill_switch_config() {
    return kill_switch_config_;
}

TelemetryConfig& ConfigManager::get_telemetry_config() {
    return telemetry_config_;
}

} // namespace arbgate
