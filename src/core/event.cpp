#include "event.hpp"
#include <type_traits>

namespace arbgate {

std::string to_string(SafetyLimit limit) {
    switch (limit) {
        case SafetyLimit::DAILY_LOSS: return "daily-loss";
        case SafetyLimit::CAPITAL_RESERVATION: return "capital-reservation";
    }
    return "unknown";
}

std::string event_name(const Event& event) {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, SpreadsEvent>) {
            return "spreads";
        } else if constexpr (std::is_same_v<T, OpportunityBlockedEvent>) {
            return "opportunity-blocked";
        } else if constexpr (std::is_same_v<T, TradeCompletedEvent>) {
            return "trade-completed";
        } else if constexpr (std::is_same_v<T, TradeFailedEvent>) {
            return "trade-failed";
        } else if constexpr (std::is_same_v<T, TradeRollbackEvent>) {
            return "trade-rollback";
        } else {
            return "safety-limit";
        }
    }, event);
}

nlohmann::json event_to_json(const Event& event) {
    nlohmann::json j;
    j["type"] = event_name(event);

    std::visit([&j](auto&& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, SpreadsEvent>) {
            j["spreads"] = arg.spreads;
        } else if constexpr (std::is_same_v<T, OpportunityBlockedEvent>) {
            j["opportunity"] = arg.opportunity;
            j["reason"] = arg.reason;
        } else if constexpr (std::is_same_v<T, SafetyLimitEvent>) {
            j["limit"] = to_string(arg.limit);
            j["message"] = arg.message;
            j["current_value"] = arg.current_value;
            j["threshold"] = arg.threshold;
        } else {
            j["trade"] = arg.trade;
        }
    }, event);

    return j;
}

} // namespace arbgate
