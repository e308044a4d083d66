#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace arbgate {

std::string get_env_var(const std::string& key);

enum class TradingMode {
    SIMULATION,
    PAPER,
    LIVE
};

std::string to_string(TradingMode mode);
std::optional<TradingMode> parse_trading_mode(const std::string& value);

struct AppConfig {
    std::string name = "arbgate";
    std::string log_level = "INFO";
    int status_interval_sec = 30;
};

struct LoggingConfig {
    std::string file_path = "logs/arbgate.log";
    int max_file_size_mb = 10;
    int max_backup_files = 3;
    bool console_output = true;
    bool file_output = true;
};

// One price venue. type is "simulated" or "rest".
struct VenueConfig {
    std::string name;
    std::string type = "simulated";
    bool enabled = true;
    int timeout_ms = 5000;

    // rest: url_template may contain {symbol}; the price is read at price_pointer
    std::string url_template;
    std::string price_pointer = "/price";
    std::string user_agent = "ArbGate/1.0";
    int connect_timeout_ms = 2000;
    bool verify_ssl = true;

    // simulated
    double variance_percent = 1.0;
    uint32_t seed = 0;
    std::map<std::string, double> base_prices;
};

struct ScannerConfig {
    std::vector<std::string> symbols = {"BTC", "ETH", "SOL", "XRP", "ADA", "DOGE", "MATIC", "AVAX"};
    int scan_interval_ms = 100;
    double min_spread_percent = 0.5;
    int cache_ttl_ms = 5000;
};

// Pricing inputs of the opportunity evaluator. Rates are fractions
// (0.001 == 0.1%); thresholds are percentages.
struct FeeConfig {
    double capital_allocation = 1000.0;
    double taker_fee_rate = 0.001;
    double max_slippage_rate = 0.001;     // assumed adverse move per leg
    double network_fee = 1.5;             // flat, quote currency
    double min_profit_threshold = 0.5;    // net profit %
    double min_confidence = 90.0;
};

struct OrchestratorConfig {
    TradingMode mode = TradingMode::SIMULATION;
    double capital_usd = 10000.0;
    int max_trades_per_hour = 50;
    double daily_loss_limit = 500.0;
    bool enable_risk_oracle = true;
    int risk_window_ms = 5000;
    size_t max_queue_size = 100;
    size_t max_trade_history = 1000;
};

struct RiskOracleConfig {
    double max_risk_percent = 15.0;
    size_t min_samples = 5;
    size_t max_samples = 300;
    double band_sigmas = 2.0;
};

struct ExecutionConfig {
    double adverse_slippage_rate = 0.0;
    int fail_every_n = 0;   // 0 disables failure injection
};

struct KillSwitchConfig {
    bool enabled = true;
    bool trigger_on_daily_loss = true;
    int max_safety_events = 3;
};

struct TelemetryConfig {
    bool enabled = true;
    std::string file_path = "logs/telemetry.jsonl";
    size_t buffer_size = 1000;
};

void to_json(nlohmann::json& j, const TradingMode& mode);
void from_json(const nlohmann::json& j, TradingMode& mode);

void to_json(nlohmann::json& j, const AppConfig& config);
void from_json(const nlohmann::json& j, AppConfig& config);
void to_json(nlohmann::json& j, const LoggingConfig& config);
void from_json(const nlohmann::json& j, LoggingConfig& config);
void to_json(nlohmann::json& j, const VenueConfig& config);
void from_json(const nlohmann::json& j, VenueConfig& config);
void to_json(nlohmann::json& j, const ScannerConfig& config);
void from_json(const nlohmann::json& j, ScannerConfig& config);
void to_json(nlohmann::json& j, const FeeConfig& config);
void from_json(const nlohmann::json& j, FeeConfig& config);
void to_json(nlohmann::json& j, const OrchestratorConfig& config);
void from_json(const nlohmann::json& j, OrchestratorConfig& config);
void to_json(nlohmann::json& j, const RiskOracleConfig& config);
void from_json(const nlohmann::json& j, RiskOracleConfig& config);
void to_json(nlohmann::json& j, const ExecutionConfig& config);
void from_json(const nlohmann::json& j, ExecutionConfig& config);
void to_json(nlohmann::json& j, const KillSwitchConfig& config);
void from_json(const nlohmann::json& j, KillSwitchConfig& config);
void to_json(nlohmann::json& j, const TelemetryConfig& config);
void from_json(const nlohmann::json& j, TelemetryConfig& config);

} // namespace arbgate
