#include "types.hpp"

namespace arbgate {

long long to_epoch_ms(Timestamp time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

std::string to_string(TradeStatus status) {
    switch (status) {
        case TradeStatus::PENDING: return "pending";
        case TradeStatus::EXECUTING: return "executing";
        case TradeStatus::EXECUTED: return "executed";
        case TradeStatus::FAILED: return "failed";
        case TradeStatus::CANCELLED: return "cancelled";
    }
    return "pending";
}

void to_json(nlohmann::json& j, const PriceQuote& quote) {
    j = nlohmann::json{{"venue", quote.venue},
                       {"symbol", quote.symbol},
                       {"price", quote.price},
                       {"observed_at", to_epoch_ms(quote.observed_at)},
                       {"latency_ms", quote.latency.count()}};
}

void to_json(nlohmann::json& j, const Spread& spread) {
    j = nlohmann::json{{"symbol", spread.symbol},
                       {"low_venue", spread.low_venue},
                       {"high_venue", spread.high_venue},
                       {"low_price", spread.low_price},
                       {"high_price", spread.high_price},
                       {"spread_percent", spread.spread_percent},
                       {"observed_at", to_epoch_ms(spread.observed_at)}};
}

void to_json(nlohmann::json& j, const Opportunity& opportunity) {
    j = nlohmann::json{{"id", opportunity.id},
                       {"symbol", opportunity.symbol},
                       {"buy_venue", opportunity.buy_venue},
                       {"sell_venue", opportunity.sell_venue},
                       {"buy_price", opportunity.buy_price},
                       {"sell_price", opportunity.sell_price},
                       {"quantity", opportunity.quantity},
                       {"gross_profit", opportunity.gross_profit},
                       {"fees", {{"maker", opportunity.fees.maker},
                                 {"taker", opportunity.fees.taker},
                                 {"network", opportunity.fees.network}}},
                       {"slippage_estimate", opportunity.slippage_estimate},
                       {"net_profit", opportunity.net_profit},
                       {"net_profit_percent", opportunity.net_profit_percent},
                       {"confidence_score", opportunity.confidence_score},
                       {"gross_spread_percent", opportunity.gross_spread_percent},
                       {"created_at", to_epoch_ms(opportunity.created_at)}};
}

void to_json(nlohmann::json& j, const TradeRecord& record) {
    j = nlohmann::json{{"id", record.id},
                       {"opportunity_id", record.opportunity_id},
                       {"symbol", record.symbol},
                       {"buy_venue", record.buy_venue},
                       {"sell_venue", record.sell_venue},
                       {"quantity", record.quantity},
                       {"volume", record.volume},
                       {"mode", record.mode},
                       {"status", to_string(record.status)},
                       {"expected_profit", record.expected_profit},
                       {"actual_profit", record.actual_profit},
                       {"fees", record.fees},
                       {"rolled_back", record.rolled_back},
                       {"started_at", to_epoch_ms(record.started_at)},
                       {"completed_at", to_epoch_ms(record.completed_at)}};
    if (record.error) {
        j["error"] = *record.error;
    }
}

} // namespace arbgate
