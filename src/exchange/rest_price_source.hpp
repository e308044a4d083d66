#pragma once

#include <string>
#include "../core/clock.hpp"
#include "../core/market_data_source.hpp"
#include "../network/rest_client.hpp"
#include "../utils/config_types.hpp"

namespace arbgate {

// One GET per symbol against url_template with {symbol} substituted; the
// price is read from the JSON body at price_pointer, as a number or a
// numeric string. A 4xx answer means the venue does not list the symbol.
class RestPriceSource : public MarketDataSource {
public:
    RestPriceSource(const VenueConfig& config, Clock& clock);

    std::string venue() const override { return name_; }

    // Throws MarketDataError on transport errors, 5xx answers, unparsable
    // bodies, or when the timeout runs out.
    std::vector<PriceQuote> fetch_prices(const std::vector<std::string>& symbols,
                                         std::chrono::milliseconds timeout) override;

    std::string build_url(const std::string& symbol) const;

    static double parse_price_response(const std::string& body, const std::string& price_pointer);

    const RestClient& client() const { return client_; }

private:
    std::string name_;
    std::string url_template_;
    std::string price_pointer_;
    Clock& clock_;
    RestClient client_;
};

} // namespace arbgate
