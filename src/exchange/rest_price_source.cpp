#include "rest_price_source.hpp"
#include <cmath>
#include <nlohmann/json.hpp>
#include "../core/exceptions.hpp"
#include "../utils/logger.hpp"

namespace arbgate {

namespace {

const std::string kSymbolPlaceholder = "{symbol}";

} // namespace

RestPriceSource::RestPriceSource(const VenueConfig& config, Clock& clock)
    : name_(config.name)
    , url_template_(config.url_template)
    , price_pointer_(config.price_pointer.empty() ? "/price" : config.price_pointer)
    , clock_(clock) {
    if (url_template_.empty()) {
        throw ConfigurationError("venue " + name_ + " has no url_template");
    }

    client_.SetUserAgent(config.user_agent);
    client_.SetConnectTimeout(config.connect_timeout_ms);
    client_.SetSslVerification(config.verify_ssl);
    if (!config.verify_ssl) {
        ARBGATE_LOG_WARN("TLS verification disabled for venue {}", name_);
    }
}

std::string RestPriceSource::build_url(const std::string& symbol) const {
    std::string url = url_template_;
    size_t pos = 0;
    while ((pos = url.find(kSymbolPlaceholder, pos)) != std::string::npos) {
        url.replace(pos, kSymbolPlaceholder.size(), symbol);
        pos += symbol.size();
    }
    return url;
}

std::vector<PriceQuote> RestPriceSource::fetch_prices(const std::vector<std::string>& symbols,
                                                      std::chrono::milliseconds timeout) {
    using SteadyClock = std::chrono::steady_clock;
    const auto deadline = SteadyClock::now() + timeout;

    std::vector<PriceQuote> quotes;
    for (const auto& symbol : symbols) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - SteadyClock::now());
        if (remaining.count() <= 0) {
            throw MarketDataError(name_ + ": timed out after " + std::to_string(timeout.count()) + "ms");
        }

        const std::string url = build_url(symbol);
        const HttpResponse response = client_.Get(url, static_cast<long>(remaining.count()));

        if (!response.error_message.empty()) {
            throw MarketDataError(name_ + ": " + response.error_message);
        }
        if (response.IsClientError()) {
            ARBGATE_LOG_DEBUG("{} does not list {} (HTTP {})", name_, symbol, response.status_code);
            continue;
        }
        if (!response.IsSuccess()) {
            throw MarketDataError(name_ + ": HTTP " + std::to_string(response.status_code) + " for " + symbol);
        }

        PriceQuote quote;
        quote.venue = name_;
        quote.symbol = symbol;
        quote.price = parse_price_response(response.body, price_pointer_);
        quote.observed_at = clock_.now();
        quote.latency = std::chrono::milliseconds(response.response_time_ms);
        quotes.push_back(quote);
    }
    return quotes;
}

double RestPriceSource::parse_price_response(const std::string& body, const std::string& price_pointer) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw MarketDataError(std::string("invalid JSON response: ") + e.what());
    }

    nlohmann::json value;
    try {
        value = j.at(nlohmann::json::json_pointer(price_pointer));
    } catch (const nlohmann::json::exception& e) {
        throw MarketDataError("no price at " + price_pointer + ": " + e.what());
    }

    double price = 0.0;
    if (value.is_number()) {
        price = value.get<double>();
    } else if (value.is_string()) {
        try {
            size_t consumed = 0;
            const std::string text = value.get<std::string>();
            price = std::stod(text, &consumed);
            if (consumed != text.size()) {
                throw MarketDataError("trailing characters in price '" + text + "'");
            }
        } catch (const std::logic_error& e) {
            throw MarketDataError("price at " + price_pointer + " is not numeric: " + e.what());
        }
    } else {
        throw MarketDataError("price at " + price_pointer + " is neither number nor string");
    }

    if (!std::isfinite(price) || price <= 0.0) {
        throw MarketDataError("non-positive price " + std::to_string(price));
    }
    return price;
}

} // namespace arbgate
