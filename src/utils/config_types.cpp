#include "config_types.hpp"
#include "../core/exceptions.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace arbgate {

std::string get_env_var(const std::string& key) {
    const char* val = std::getenv(key.c_str());
    return val == nullptr ? std::string("") : std::string(val);
}

std::string to_string(TradingMode mode) {
    switch (mode) {
        case TradingMode::SIMULATION: return "simulation";
        case TradingMode::PAPER: return "paper";
        case TradingMode::LIVE: return "live";
    }
    return "simulation";
}

std::optional<TradingMode> parse_trading_mode(const std::string& value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "simulation") return TradingMode::SIMULATION;
    if (lower == "paper") return TradingMode::PAPER;
    if (lower == "live") return TradingMode::LIVE;
    return std::nullopt;
}

void to_json(nlohmann::json& j, const TradingMode& mode) {
    j = to_string(mode);
}

void from_json(const nlohmann::json& j, TradingMode& mode) {
    auto parsed = parse_trading_mode(j.get<std::string>());
    if (!parsed) {
        throw ConfigurationError("unknown trading mode '" + j.get<std::string>() + "'");
    }
    mode = *parsed;
}

void to_json(nlohmann::json& j, const AppConfig& config) {
    j = nlohmann::json{{"name", config.name},
                       {"log_level", config.log_level},
                       {"status_interval_sec", config.status_interval_sec}};
}

void from_json(const nlohmann::json& j, AppConfig& config) {
    AppConfig defaults;
    config.name = j.value("name", defaults.name);
    config.log_level = j.value("log_level", defaults.log_level);
    config.status_interval_sec = j.value("status_interval_sec", defaults.status_interval_sec);
}

void to_json(nlohmann::json& j, const LoggingConfig& config) {
    j = nlohmann::json{{"file_path", config.file_path},
                       {"max_file_size_mb", config.max_file_size_mb},
                       {"max_backup_files", config.max_backup_files},
                       {"console_output", config.console_output},
                       {"file_output", config.file_output}};
}

void from_json(const nlohmann::json& j, LoggingConfig& config) {
    LoggingConfig defaults;
    config.file_path = j.value("file_path", defaults.file_path);
    config.max_file_size_mb = j.value("max_file_size_mb", defaults.max_file_size_mb);
    config.max_backup_files = j.value("max_backup_files", defaults.max_backup_files);
    config.console_output = j.value("console_output", defaults.console_output);
    config.file_output = j.value("file_output", defaults.file_output);
}

void to_json(nlohmann::json& j, const VenueConfig& config) {
    j = nlohmann::json{{"name", config.name},
                       {"type", config.type},
                       {"enabled", config.enabled},
                       {"timeout_ms", config.timeout_ms},
                       {"url_template", config.url_template},
                       {"price_pointer", config.price_pointer},
                       {"user_agent", config.user_agent},
                       {"connect_timeout_ms", config.connect_timeout_ms},
                       {"verify_ssl", config.verify_ssl},
                       {"variance_percent", config.variance_percent},
                       {"seed", config.seed},
                       {"base_prices", config.base_prices}};
}

void from_json(const nlohmann::json& j, VenueConfig& config) {
    VenueConfig defaults;
    config.name = j.value("name", defaults.name);
    config.type = j.value("type", defaults.type);
    config.enabled = j.value("enabled", defaults.enabled);
    config.timeout_ms = j.value("timeout_ms", defaults.timeout_ms);
    config.url_template = j.value("url_template", defaults.url_template);
    config.price_pointer = j.value("price_pointer", defaults.price_pointer);
    config.user_agent = j.value("user_agent", defaults.user_agent);
    config.connect_timeout_ms = j.value("connect_timeout_ms", defaults.connect_timeout_ms);
    config.verify_ssl = j.value("verify_ssl", defaults.verify_ssl);
    config.variance_percent = j.value("variance_percent", defaults.variance_percent);
    config.seed = j.value("seed", defaults.seed);
    config.base_prices = j.value("base_prices", defaults.base_prices);
}

void to_json(nlohmann::json& j, const ScannerConfig& config) {
    j = nlohmann::json{{"symbols", config.symbols},
                       {"scan_interval_ms", config.scan_interval_ms},
                       {"min_spread_percent", config.min_spread_percent},
                       {"cache_ttl_ms", config.cache_ttl_ms}};
}

void from_json(const nlohmann::json& j, ScannerConfig& config) {
    ScannerConfig defaults;
    config.symbols = j.value("symbols", defaults.symbols);
    config.scan_interval_ms = j.value("scan_interval_ms", defaults.scan_interval_ms);
    config.min_spread_percent = j.value("min_spread_percent", defaults.min_spread_percent);
    config.cache_ttl_ms = j.value("cache_ttl_ms", defaults.cache_ttl_ms);
}

void to_json(nlohmann::json& j, const FeeConfig& config) {
    j = nlohmann::json{{"capital_allocation", config.capital_allocation},
                       {"taker_fee_rate", config.taker_fee_rate},
                       {"max_slippage_rate", config.max_slippage_rate},
                       {"network_fee", config.network_fee},
                       {"min_profit_threshold", config.min_profit_threshold},
                       {"min_confidence", config.min_confidence}};
}

void from_json(const nlohmann::json& j, FeeConfig& config) {
    FeeConfig defaults;
    config.capital_allocation = j.value("capital_allocation", defaults.capital_allocation);
    config.taker_fee_rate = j.value("taker_fee_rate", defaults.taker_fee_rate);
    config.max_slippage_rate = j.value("max_slippage_rate", defaults.max_slippage_rate);
    config.network_fee = j.value("network_fee", defaults.network_fee);
    config.min_profit_threshold = j.value("min_profit_threshold", defaults.min_profit_threshold);
    config.min_confidence = j.value("min_confidence", defaults.min_confidence);
}

void to_json(nlohmann::json& j, const OrchestratorConfig& config) {
    j = nlohmann::json{{"mode", config.mode},
                       {"capital_usd", config.capital_usd},
                       {"max_trades_per_hour", config.max_trades_per_hour},
                       {"daily_loss_limit", config.daily_loss_limit},
                       {"enable_risk_oracle", config.enable_risk_oracle},
                       {"risk_window_ms", config.risk_window_ms},
                       {"max_queue_size", config.max_queue_size},
                       {"max_trade_history", config.max_trade_history}};
}

void from_json(const nlohmann::json& j, OrchestratorConfig& config) {
    OrchestratorConfig defaults;
    config.mode = j.value("mode", defaults.mode);
    config.capital_usd = j.value("capital_usd", defaults.capital_usd);
    config.max_trades_per_hour = j.value("max_trades_per_hour", defaults.max_trades_per_hour);
    config.daily_loss_limit = j.value("daily_loss_limit", defaults.daily_loss_limit);
    config.enable_risk_oracle = j.value("enable_risk_oracle", defaults.enable_risk_oracle);
    config.risk_window_ms = j.value("risk_window_ms", defaults.risk_window_ms);
    config.max_queue_size = j.value("max_queue_size", defaults.max_queue_size);
    config.max_trade_history = j.value("max_trade_history", defaults.max_trade_history);
}

void to_json(nlohmann::json& j, const RiskOracleConfig& config) {
    j = nlohmann::json{{"max_risk_percent", config.max_risk_percent},
                       {"min_samples", config.min_samples},
                       {"max_samples", config.max_samples},
                       {"band_sigmas", config.band_sigmas}};
}

void from_json(const nlohmann::json& j, RiskOracleConfig& config) {
    RiskOracleConfig defaults;
    config.max_risk_percent = j.value("max_risk_percent", defaults.max_risk_percent);
    config.min_samples = j.value("min_samples", defaults.min_samples);
    config.max_samples = j.value("max_samples", defaults.max_samples);
    config.band_sigmas = j.value("band_sigmas", defaults.band_sigmas);
}

void to_json(nlohmann::json& j, const ExecutionConfig& config) {
    j = nlohmann::json{{"adverse_slippage_rate", config.adverse_slippage_rate},
                       {"fail_every_n", config.fail_every_n}};
}

void from_json(const nlohmann::json& j, ExecutionConfig& config) {
    ExecutionConfig defaults;
    config.adverse_slippage_rate = j.value("adverse_slippage_rate", defaults.adverse_slippage_rate);
    config.fail_every_n = j.value("fail_every_n", defaults.fail_every_n);
}

void to_json(nlohmann::json& j, const KillSwitchConfig& config) {
    j = nlohmann::json{{"enabled", config.enabled},
                       {"trigger_on_daily_loss", config.trigger_on_daily_loss},
                       {"max_safety_events", config.max_safety_events}};
}

void from_json(const nlohmann::json& j, KillSwitchConfig& config) {
    KillSwitchConfig defaults;
    config.enabled = j.value("enabled", defaults.enabled);
    config.trigger_on_daily_loss = j.value("trigger_on_daily_loss", defaults.trigger_on_daily_loss);
    config.max_safety_events = j.value("max_safety_events", defaults.max_safety_events);
}

void to_json(nlohmann::json& j, const TelemetryConfig& config) {
    j = nlohmann::json{{"enabled", config.enabled},
                       {"file_path", config.file_path},
                       {"buffer_size", config.buffer_size}};
}

void from_json(const nlohmann::json& j, TelemetryConfig& config) {
    TelemetryConfig defaults;
    config.enabled = j.value("enabled", defaults.enabled);
    config.file_path = j.value("file_path", defaults.file_path);
    config.buffer_size = j.value("buffer_size", defaults.buffer_size);
}

} // namespace arbgate
