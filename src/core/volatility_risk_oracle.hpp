#pragma once

#include <deque>
#include <map>
#include <mutex>
#include <string>
#include "risk_oracle.hpp"
#include "types.hpp"
#include "../utils/config_types.hpp"

namespace arbgate {

// Vetoes opportunities whose sell leg could move against the trade by more
// than the configured risk budget within the execution window. Volatility
// is estimated from the log returns of each venue's own price series, so a
// steady cross-venue gap is never mistaken for price movement. The widest
// venue estimate for a symbol wins.
class VolatilityRiskOracle : public RiskOracle {
public:
    struct Assessment {
        size_t samples = 0;
        double sigma_per_ms = 0.0;
        double worst_case_sell_price = 0.0;
        double best_case_sell_price = 0.0;
        double potential_loss_percent = 0.0;
        double worst_case_profit_percent = 0.0;
    };

    explicit VolatilityRiskOracle(const RiskOracleConfig& config);

    void observe(const PriceQuote& quote);

    // Longest venue series held for the symbol.
    size_t sample_count(const std::string& symbol) const;
    size_t sample_count(const std::string& venue, const std::string& symbol) const;

    // Throws RiskOracleError on non-positive prices.
    RiskVerdict evaluate(const std::string& symbol,
                         double buy_price,
                         double sell_price,
                         double expected_profit,
                         std::chrono::milliseconds window) override;

    Assessment assess(const std::string& symbol,
                      double buy_price,
                      double sell_price,
                      std::chrono::milliseconds window) const;

private:
    struct Sample {
        Timestamp at;
        double price;
    };

    double estimate_sigma_per_ms(const std::deque<Sample>& samples) const;

    using VenueSeries = std::map<std::string, std::deque<Sample>>;

    RiskOracleConfig config_;
    mutable std::mutex mutex_;
    std::map<std::string, VenueSeries> history_;   // symbol -> venue -> samples
};

} // namespace arbgate
