#include "simulated_price_source.hpp"

namespace arbgate {

const std::map<std::string, double>& SimulatedPriceSource::default_base_prices() {
    static const std::map<std::string, double> prices = {
        {"BTC", 42500.0},
        {"ETH", 2250.0},
        {"SOL", 110.0},
        {"XRP", 0.62},
        {"ADA", 0.61},
        {"DOGE", 0.092},
        {"MATIC", 0.87},
        {"AVAX", 38.5}
    };
    return prices;
}

SimulatedPriceSource::SimulatedPriceSource(const VenueConfig& config, Clock& clock)
    : name_(config.name)
    , base_prices_(config.base_prices.empty() ? default_base_prices() : config.base_prices)
    , variance_percent_(config.variance_percent)
    , clock_(clock)
    , rng_(config.seed != 0 ? config.seed : std::random_device{}()) {
}

std::vector<PriceQuote> SimulatedPriceSource::fetch_prices(const std::vector<std::string>& symbols,
                                                           std::chrono::milliseconds /*timeout*/) {
    std::uniform_real_distribution<double> variance(-variance_percent_, variance_percent_);
    const Timestamp now = clock_.now();

    std::vector<PriceQuote> quotes;
    quotes.reserve(symbols.size());

    std::lock_guard<std::mutex> lock(rng_mutex_);
    for (const auto& symbol : symbols) {
        auto it = base_prices_.find(symbol);
        if (it == base_prices_.end()) {
            continue;
        }

        PriceQuote quote;
        quote.venue = name_;
        quote.symbol = symbol;
        quote.price = it->second * (1.0 + variance(rng_) / 100.0);
        quote.observed_at = now;
        quotes.push_back(quote);
    }
    return quotes;
}

} // namespace arbgate
