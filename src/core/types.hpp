#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../utils/config_types.hpp"

namespace arbgate {

using Timestamp = std::chrono::system_clock::time_point;

long long to_epoch_ms(Timestamp time);

// Last price seen for one symbol on one venue.
struct PriceQuote {
    std::string venue;
    std::string symbol;
    double price = 0.0;
    Timestamp observed_at{};
    std::chrono::milliseconds latency{0};
};

// Widest cross-venue gap for one symbol in one scan cycle.
// high_price >= low_price, spread_percent = (high - low) / low * 100
struct Spread {
    std::string symbol;
    std::string low_venue;
    std::string high_venue;
    double low_price = 0.0;
    double high_price = 0.0;
    double spread_percent = 0.0;
    Timestamp observed_at{};
};

struct FeeBreakdown {
    double maker = 0.0;     // both legs take liquidity, so always 0
    double taker = 0.0;     // buy_fee + sell_fee
    double network = 0.0;
};

struct Opportunity {
    std::string id;
    std::string symbol;
    std::string buy_venue;
    std::string sell_venue;
    double buy_price = 0.0;
    double sell_price = 0.0;
    double quantity = 0.0;

    double gross_cost = 0.0;
    double gross_revenue = 0.0;
    double gross_profit = 0.0;
    double buy_fee = 0.0;
    double sell_fee = 0.0;
    FeeBreakdown fees;
    double slippage_estimate = 0.0;

    double net_profit = 0.0;
    double net_profit_percent = 0.0;
    double confidence_score = 0.0;    // [0, 99.9]
    double gross_spread_percent = 0.0;
    Timestamp created_at{};
};

enum class TradeStatus {
    PENDING,
    EXECUTING,
    EXECUTED,
    FAILED,
    CANCELLED
};

std::string to_string(TradeStatus status);

struct TradeRecord {
    std::string id;
    std::string opportunity_id;
    std::string symbol;
    std::string buy_venue;
    std::string sell_venue;
    double quantity = 0.0;
    double volume = 0.0;              // buy notional
    TradingMode mode = TradingMode::SIMULATION;
    TradeStatus status = TradeStatus::PENDING;
    double expected_profit = 0.0;
    double actual_profit = 0.0;
    double fees = 0.0;
    bool rolled_back = false;
    Timestamp started_at{};
    Timestamp completed_at{};
    std::optional<std::string> error;
};

void to_json(nlohmann::json& j, const PriceQuote& quote);
void to_json(nlohmann::json& j, const Spread& spread);
void to_json(nlohmann::json& j, const Opportunity& opportunity);
void to_json(nlohmann::json& j, const TradeRecord& record);

} // namespace arbgate
