#include "config_validator.hpp"
#include <cmath>
#include <set>
#include "logger.hpp"

namespace arbgate {

namespace {

constexpr double kMaxConfidence = 99.9;

template<typename T>
std::string str(T value) {
    return std::to_string(value);
}

} // namespace

ConfigValidator::ValidationResult ConfigValidator::validate(const ConfigManager& config) {
    errors_.clear();

    validate_app(config.get_app_config(), config.get_logging_config(), config.get_telemetry_config());
    validate_scanner(config.get_scanner_config());
    validate_venues(config.get_venue_configs());
    validate_fees(config.get_fee_config());
    validate_orchestrator(config.get_orchestrator_config(), config.get_fee_config());
    validate_risk_oracle(config.get_risk_oracle_config());
    validate_execution(config.get_execution_config());

    if (errors_.empty()) {
        return ValidationResult::success(true);
    }

    std::string summary = std::to_string(errors_.size()) + " configuration error(s):";
    for (const auto& issue : errors_) {
        ARBGATE_LOG_ERROR("Config {}: {} (value: {})", issue.field, issue.message, issue.value);
        summary += " " + issue.field + ": " + issue.message + ";";
    }
    return ValidationResult::error(summary);
}

void ConfigValidator::validate_app(const AppConfig& app, const LoggingConfig& logging,
                                   const TelemetryConfig& telemetry) {
    if (app.status_interval_sec <= 0) {
        add_error("app.status_interval_sec", "must be positive", str(app.status_interval_sec));
    }
    if (logging.file_output && logging.file_path.empty()) {
        add_error("logging.file_path", "required when file output is enabled");
    }
    if (logging.max_file_size_mb <= 0) {
        add_error("logging.max_file_size_mb", "must be positive", str(logging.max_file_size_mb));
    }
    if (logging.max_backup_files < 0) {
        add_error("logging.max_backup_files", "must not be negative", str(logging.max_backup_files));
    }
    if (telemetry.enabled && telemetry.buffer_size == 0) {
        add_error("telemetry.buffer_size", "must be positive", str(telemetry.buffer_size));
    }
}

void ConfigValidator::validate_scanner(const ScannerConfig& config) {
    if (config.symbols.empty()) {
        add_error("scanner.symbols", "at least one symbol is required");
    }
    for (const auto& symbol : config.symbols) {
        if (symbol.empty()) {
            add_error("scanner.symbols", "symbol must not be empty");
        }
    }
    if (config.scan_interval_ms <= 0) {
        add_error("scanner.scan_interval_ms", "must be positive", str(config.scan_interval_ms));
    }
    if (!(config.min_spread_percent >= 0.0)) {
        add_error("scanner.min_spread_percent", "must not be negative", str(config.min_spread_percent));
    }
    if (config.cache_ttl_ms <= 0) {
        add_error("scanner.cache_ttl_ms", "must be positive", str(config.cache_ttl_ms));
    }
}

void ConfigValidator::validate_venues(const std::vector<VenueConfig>& venues) {
    std::set<std::string> names;
    size_t enabled = 0;

    for (size_t i = 0; i < venues.size(); ++i) {
        const VenueConfig& venue = venues[i];
        const std::string prefix = "venues[" + std::to_string(i) + "]";

        if (venue.name.empty()) {
            add_error(prefix + ".name", "must not be empty");
        } else if (!names.insert(venue.name).second) {
            add_error(prefix + ".name", "duplicate venue name", venue.name);
        }
        if (venue.type != "simulated" && venue.type != "rest") {
            add_error(prefix + ".type", "must be 'simulated' or 'rest'", venue.type);
        }
        if (venue.type == "rest" && venue.url_template.empty()) {
            add_error(prefix + ".url_template", "required for rest venues");
        }
        if (venue.timeout_ms <= 0) {
            add_error(prefix + ".timeout_ms", "must be positive", str(venue.timeout_ms));
        }
        if (venue.type == "rest" && venue.connect_timeout_ms <= 0) {
            add_error(prefix + ".connect_timeout_ms", "must be positive", str(venue.connect_timeout_ms));
        }
        if (!(venue.variance_percent >= 0.0)) {
            add_error(prefix + ".variance_percent", "must not be negative", str(venue.variance_percent));
        }
        for (const auto& [symbol, price] : venue.base_prices) {
            if (!(price > 0.0)) {
                add_error(prefix + ".base_prices." + symbol, "must be positive", str(price));
            }
        }
        if (venue.enabled) {
            ++enabled;
        }
    }

    if (enabled < 2) {
        add_error("venues", "at least two enabled venues are required", str(enabled));
    }
}

void ConfigValidator::validate_fees(const FeeConfig& config) {
    if (!(config.capital_allocation > 0.0)) {
        add_error("evaluator.capital_allocation", "must be positive", str(config.capital_allocation));
    }
    check_rate("evaluator.taker_fee_rate", config.taker_fee_rate);
    check_rate("evaluator.max_slippage_rate", config.max_slippage_rate);
    if (!(config.network_fee >= 0.0)) {
        add_error("evaluator.network_fee", "must not be negative", str(config.network_fee));
    }
    if (!(config.min_profit_threshold >= 0.0)) {
        add_error("evaluator.min_profit_threshold", "must not be negative", str(config.min_profit_threshold));
    }
    if (!(config.min_confidence >= 0.0 && config.min_confidence <= kMaxConfidence)) {
        add_error("evaluator.min_confidence", "must be within [0, 99.9]", str(config.min_confidence));
    }
}

void ConfigValidator::validate_orchestrator(const OrchestratorConfig& config, const FeeConfig& fees) {
    if (!std::isfinite(config.capital_usd) || config.capital_usd < fees.capital_allocation) {
        add_error("orchestrator.capital_usd", "must be at least the capital allocation per trade",
                  str(config.capital_usd));
    }
    if (config.max_trades_per_hour <= 0) {
        add_error("orchestrator.max_trades_per_hour", "must be positive", str(config.max_trades_per_hour));
    }
    if (!(config.daily_loss_limit >= 0.0)) {
        add_error("orchestrator.daily_loss_limit", "must not be negative", str(config.daily_loss_limit));
    }
    if (config.risk_window_ms < 0) {
        add_error("orchestrator.risk_window_ms", "must not be negative", str(config.risk_window_ms));
    }
    if (config.max_queue_size == 0) {
        add_error("orchestrator.max_queue_size", "must be positive");
    }
    if (config.max_trade_history == 0) {
        add_error("orchestrator.max_trade_history", "must be positive");
    }
}

void ConfigValidator::validate_risk_oracle(const RiskOracleConfig& config) {
    if (!(config.max_risk_percent > 0.0)) {
        add_error("risk_oracle.max_risk_percent", "must be positive", str(config.max_risk_percent));
    }
    if (config.max_samples < 2) {
        add_error("risk_oracle.max_samples", "must be at least 2", str(config.max_samples));
    }
    if (config.min_samples > config.max_samples) {
        add_error("risk_oracle.min_samples", "must not exceed max_samples", str(config.min_samples));
    }
    if (!(config.band_sigmas > 0.0)) {
        add_error("risk_oracle.band_sigmas", "must be positive", str(config.band_sigmas));
    }
}

void ConfigValidator::validate_execution(const ExecutionConfig& config) {
    check_rate("execution.adverse_slippage_rate", config.adverse_slippage_rate);
    if (config.fail_every_n < 0) {
        add_error("execution.fail_every_n", "must not be negative", str(config.fail_every_n));
    }
}

void ConfigValidator::check_rate(const std::string& field, double value) {
    if (!(value >= 0.0 && value < 1.0)) {
        add_error(field, "must be a fraction within [0, 1)", str(value));
    }
}

void ConfigValidator::add_error(const std::string& field, const std::string& message, const std::string& value) {
    errors_.push_back(ValidationIssue{field, message, value});
}

} // namespace arbgate
