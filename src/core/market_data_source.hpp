#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "types.hpp"

namespace arbgate {

// Per-venue price fetcher. Implementations throw MarketDataError when the
// venue cannot deliver; symbols the venue does not list are omitted.
class MarketDataSource {
public:
    virtual ~MarketDataSource() = default;

    virtual std::string venue() const = 0;
    virtual std::vector<PriceQuote> fetch_prices(const std::vector<std::string>& symbols,
                                                 std::chrono::milliseconds timeout) = 0;
};

} // namespace arbgate
