#pragma once

#include <stdexcept>
#include <string>

namespace arbgate {

class ArbGateException : public std::runtime_error {
public:
    explicit ArbGateException(const std::string& message) : std::runtime_error(message) {}
    explicit ArbGateException(const char* message) : std::runtime_error(message) {}
};

class ConfigurationError : public ArbGateException {
public:
    explicit ConfigurationError(const std::string& message)
        : ArbGateException("Configuration Error: " + message) {}
};

class ValidationError : public ArbGateException {
public:
    explicit ValidationError(const std::string& message)
        : ArbGateException("Validation Error: " + message) {}
};

// Raised by a MarketDataSource when a venue cannot deliver quotes.
class MarketDataError : public ArbGateException {
public:
    explicit MarketDataError(const std::string& message)
        : ArbGateException("Market Data Error: " + message) {}
};

class ExecutionError : public ArbGateException {
public:
    explicit ExecutionError(const std::string& message)
        : ArbGateException("Execution Error: " + message) {}
};

class RiskOracleError : public ArbGateException {
public:
    explicit RiskOracleError(const std::string& message)
        : ArbGateException("Risk Oracle Error: " + message) {}
};

// A reservation was refused after admission had already passed the capital
// check. Never retried.
class CapitalLedgerError : public ArbGateException {
public:
    explicit CapitalLedgerError(const std::string& message)
        : ArbGateException("Capital Ledger Error: " + message) {}
};

} // namespace arbgate
