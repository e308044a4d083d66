#pragma once

#include <string>
#include "types.hpp"

namespace arbgate {

struct ExecutionRequest {
    std::string trade_id;
    std::string symbol;
    std::string buy_venue;
    std::string sell_venue;
    double buy_price = 0.0;
    double sell_price = 0.0;
    double quantity = 0.0;
    double expected_profit = 0.0;
};

// Settles the two-leg swap. Returns a terminal TradeRecord (executed or
// failed, possibly rolled back) or throws ExecutionError. May block for as
// long as settlement takes.
class ExecutionEngine {
public:
    virtual ~ExecutionEngine() = default;

    virtual TradeRecord execute(const ExecutionRequest& request) = 0;
};

} // namespace arbgate
