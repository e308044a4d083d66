#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include "core/app_state.hpp"
#include "core/clock.hpp"
#include "core/event_bus.hpp"
#include "core/exceptions.hpp"
#include "core/kill_switch.hpp"
#include "core/orchestrator.hpp"
#include "core/paper_execution_engine.hpp"
#include "core/price_aggregator.hpp"
#include "core/volatility_risk_oracle.hpp"
#include "exchange/exchange_factory.hpp"
#include "monitoring/telemetry_writer.hpp"
#include "network/rest_client.hpp"
#include "utils/config_manager.hpp"
#include "utils/config_validator.hpp"
#include "utils/logger.hpp"

namespace {

arbgate::AppState app_state;

// Signal handler for graceful shutdown
void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        app_state.shutdown();
    }
}

int run(const std::string& config_path) {
    using namespace arbgate;

    ConfigManager config_manager;
    if (!config_manager.load(config_path)) {
        ARBGATE_LOG_ERROR("Failed to load configuration from {}. Exiting.", config_path);
        return 1;
    }

    const AppConfig& app_config = config_manager.get_app_config();
    const LoggingConfig& logging = config_manager.get_logging_config();
    utils::Logger::initialize(logging.file_output ? logging.file_path : "",
                              utils::parse_log_level(app_config.log_level),
                              static_cast<size_t>(logging.max_file_size_mb) * 1024 * 1024,
                              static_cast<size_t>(logging.max_backup_files),
                              logging.console_output);
    ARBGATE_LOG_INFO("Starting {} with {}", app_config.name, config_path);

    ConfigValidator validator;
    auto validation = validator.validate(config_manager);
    if (validation.is_error()) {
        ARBGATE_LOG_ERROR("Invalid configuration: {}", validation.error());
        return 1;
    }

    const OrchestratorConfig& orchestrator_config = config_manager.get_orchestrator_config();
    if (orchestrator_config.mode == TradingMode::LIVE) {
        ARBGATE_LOG_CRITICAL("Live mode needs a venue execution engine and none is available in this build. "
                             "Use simulation or paper mode.");
        return 1;
    }

    RestClient::GlobalInit();

    SystemClock clock;
    EventBus bus;

    std::unique_ptr<TelemetryWriter> telemetry;
    if (config_manager.get_telemetry_config().enabled) {
        telemetry = std::make_unique<TelemetryWriter>(config_manager.get_telemetry_config(), clock);
        bus.subscribe(telemetry.get());
    }

    PriceAggregator aggregator(config_manager.get_scanner_config(), clock);
    try {
        for (const auto& venue : config_manager.get_venue_configs()) {
            if (!venue.enabled) {
                continue;
            }
            aggregator.add_venue(ExchangeFactory::create_source(venue, clock),
                                 std::chrono::milliseconds(venue.timeout_ms));
        }
    } catch (const ConfigurationError& e) {
        ARBGATE_LOG_ERROR("{}", e.what());
        RestClient::GlobalCleanup();
        return 1;
    }

    VolatilityRiskOracle oracle(config_manager.get_risk_oracle_config());
    aggregator.set_quote_observer([&oracle](const PriceQuote& quote) { oracle.observe(quote); });

    PaperExecutionEngine paper_engine(config_manager.get_fee_config(),
                                      config_manager.get_execution_config(), clock);
    ExecutionEngine* engine = orchestrator_config.mode == TradingMode::PAPER ? &paper_engine : nullptr;

    Orchestrator orchestrator(orchestrator_config, config_manager.get_fee_config(), clock,
                              engine, &oracle, &bus, &aggregator);

    KillSwitch kill_switch(config_manager.get_kill_switch_config(), [&orchestrator](const std::string& reason) {
        orchestrator.stop();
        app_state.shutdown("kill switch: " + reason);
    });
    bus.subscribe(&kill_switch);

    if (!orchestrator.start()) {
        ARBGATE_LOG_ERROR("Orchestrator failed to start. Exiting.");
        RestClient::GlobalCleanup();
        return 1;
    }
    ARBGATE_LOG_INFO("{} is running in {} mode.", app_config.name, to_string(orchestrator_config.mode));

    const auto status_interval = std::chrono::seconds(app_config.status_interval_sec);
    while (app_state.wait_for(status_interval)) {
        const nlohmann::json status = orchestrator.get_status();
        const nlohmann::json scans = aggregator.get_stats();
        ARBGATE_LOG_INFO("Status: {}", status.dump());
        ARBGATE_LOG_INFO("Scanner: {}", scans.dump());
    }

    const std::string reason = app_state.shutdown_reason();
    ARBGATE_LOG_INFO("Shutting down{}", reason.empty() ? std::string("") : " (" + reason + ")");

    orchestrator.stop();
    bus.unsubscribe(&kill_switch);

    const nlohmann::json daily_stats = orchestrator.get_daily_stats();
    ARBGATE_LOG_INFO("Daily stats: {}", daily_stats.dump());
    std::cout << daily_stats.dump(2) << std::endl;

    if (telemetry) {
        telemetry->flush();
    }
    RestClient::GlobalCleanup();
    ARBGATE_LOG_INFO("Shutdown complete");
    utils::Logger::shutdown();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const std::string config_path = argc > 1 ? argv[1] : "config/settings.json";
    try {
        return run(config_path);
    } catch (const std::exception& e) {
        ARBGATE_LOG_CRITICAL("Fatal error: {}", e.what());
        std::cerr << "FATAL: " << e.what() << std::endl;
        return 1;
    }
}
