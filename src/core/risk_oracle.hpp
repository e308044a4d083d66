#pragma once

#include <chrono>
#include <string>

namespace arbgate {

struct RiskVerdict {
    bool proceed = false;
    std::string rationale;
};

// Independent predictive check consulted before capital is reserved.
class RiskOracle {
public:
    virtual ~RiskOracle() = default;

    virtual RiskVerdict evaluate(const std::string& symbol,
                                 double buy_price,
                                 double sell_price,
                                 double expected_profit,
                                 std::chrono::milliseconds window) = 0;
};

} // namespace arbgate
