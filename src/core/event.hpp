#pragma once

#include "types.hpp"
#include <string>
#include <variant>
#include <vector>

namespace arbgate {

struct SpreadsEvent {
    std::vector<Spread> spreads;
};

struct OpportunityBlockedEvent {
    Opportunity opportunity;
    std::string reason;
};

struct TradeCompletedEvent {
    TradeRecord trade;
};

struct TradeFailedEvent {
    TradeRecord trade;
};

struct TradeRollbackEvent {
    TradeRecord trade;
};

enum class SafetyLimit {
    DAILY_LOSS,
    CAPITAL_RESERVATION
};

std::string to_string(SafetyLimit limit);

struct SafetyLimitEvent {
    SafetyLimit limit;
    std::string message;
    double current_value = 0.0;
    double threshold = 0.0;
};

using Event = std::variant<SpreadsEvent,
                           OpportunityBlockedEvent,
                           TradeCompletedEvent,
                           TradeFailedEvent,
                           TradeRollbackEvent,
                           SafetyLimitEvent>;

// "spreads", "opportunity-blocked", "trade-completed", "trade-failed",
// "trade-rollback" or "safety-limit"
std::string event_name(const Event& event);

nlohmann::json event_to_json(const Event& event);

} // namespace arbgate
