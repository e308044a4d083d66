#pragma once

#include <map>
#include <mutex>
#include <random>
#include "../core/clock.hpp"
#include "../core/market_data_source.hpp"
#include "../utils/config_types.hpp"

namespace arbgate {

// Quotes drawn uniformly within +/- variance_percent of a base price.
// Deterministic for a non-zero seed.
class SimulatedPriceSource : public MarketDataSource {
public:
    SimulatedPriceSource(const VenueConfig& config, Clock& clock);

    std::string venue() const override { return name_; }
    std::vector<PriceQuote> fetch_prices(const std::vector<std::string>& symbols,
                                         std::chrono::milliseconds timeout) override;

    static const std::map<std::string, double>& default_base_prices();

private:
    std::string name_;
    std::map<std::string, double> base_prices_;
    double variance_percent_;
    Clock& clock_;

    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

} // namespace arbgate
