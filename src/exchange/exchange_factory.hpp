#pragma once

#include <memory>
#include <vector>
#include "../core/clock.hpp"
#include "../core/market_data_source.hpp"
#include "../utils/config_types.hpp"

namespace arbgate {

class ExchangeFactory {
public:
    // Throws ConfigurationError for an unknown venue type.
    static std::shared_ptr<MarketDataSource> create_source(const VenueConfig& config, Clock& clock);

    // Enabled venues only, in configuration order.
    static std::vector<std::shared_ptr<MarketDataSource>> create_sources(
        const std::vector<VenueConfig>& configs, Clock& clock);
};

} // namespace arbgate
