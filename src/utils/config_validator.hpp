#pragma once

#include <string>
#include <vector>
#include "config_manager.hpp"
#include "../core/result.hpp"

namespace arbgate {

struct ValidationIssue {
    std::string field;
    std::string message;
    std::string value;
};

class ConfigValidator {
public:
    using ValidationResult = Result<bool>;

    // Checks every section and collects all issues; the error string
    // summarises them.
    ValidationResult validate(const ConfigManager& config);

    const std::vector<ValidationIssue>& get_errors() const { return errors_; }
    void clear_errors() { errors_.clear(); }

private:
    void validate_scanner(const ScannerConfig& config);
    void validate_venues(const std::vector<VenueConfig>& venues);
    void validate_fees(const FeeConfig& config);
    void validate_orchestrator(const OrchestratorConfig& config, const FeeConfig& fees);
    void validate_risk_oracle(const RiskOracleConfig& config);
    void validate_execution(const ExecutionConfig& config);
    void validate_app(const AppConfig& app, const LoggingConfig& logging, const TelemetryConfig& telemetry);

    void check_rate(const std::string& field, double value);
    void add_error(const std::string& field, const std::string& message, const std::string& value = "");

    std::vector<ValidationIssue> errors_;
};

} // namespace arbgate
