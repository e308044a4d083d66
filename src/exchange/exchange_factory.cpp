#include "exchange_factory.hpp"
#include "rest_price_source.hpp"
#include "simulated_price_source.hpp"
#include "../core/exceptions.hpp"

namespace arbgate {

std::shared_ptr<MarketDataSource> ExchangeFactory::create_source(const VenueConfig& config, Clock& clock) {
    if (config.type == "simulated") {
        return std::make_shared<SimulatedPriceSource>(config, clock);
    }
    if (config.type == "rest") {
        return std::make_shared<RestPriceSource>(config, clock);
    }
    throw ConfigurationError("unknown venue type '" + config.type + "' for " + config.name);
}

std::vector<std::shared_ptr<MarketDataSource>> ExchangeFactory::create_sources(
    const std::vector<VenueConfig>& configs, Clock& clock) {
    std::vector<std::shared_ptr<MarketDataSource>> sources;
    for (const auto& config : configs) {
        if (!config.enabled) {
            continue;
        }
        sources.push_back(create_source(config, clock));
    }
    return sources;
}

} // namespace arbgate
