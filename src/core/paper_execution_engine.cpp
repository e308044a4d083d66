#include "paper_execution_engine.hpp"
#include <spdlog/fmt/fmt.h>
#include "exceptions.hpp"
#include "../utils/logger.hpp"

namespace arbgate {

PaperExecutionEngine::PaperExecutionEngine(const FeeConfig& fees, const ExecutionConfig& config, Clock& clock)
    : fees_(fees), config_(config), clock_(clock) {
}

TradeRecord PaperExecutionEngine::execute(const ExecutionRequest& request) {
    if (!(request.quantity > 0.0) || !(request.buy_price > 0.0) || !(request.sell_price > 0.0)) {
        throw ExecutionError(fmt::format("invalid order for {}: qty={} buy={} sell={}",
                                         request.symbol, request.quantity,
                                         request.buy_price, request.sell_price));
    }

    const uint64_t n = ++executions_;

    TradeRecord record;
    record.id = request.trade_id;
    record.symbol = request.symbol;
    record.buy_venue = request.buy_venue;
    record.sell_venue = request.sell_venue;
    record.quantity = request.quantity;
    record.mode = TradingMode::PAPER;
    record.expected_profit = request.expected_profit;
    record.started_at = clock_.now();

    const double buy_fill = request.buy_price * (1.0 + config_.adverse_slippage_rate);
    const double cost = buy_fill * request.quantity;
    record.volume = cost;

    if (config_.fail_every_n > 0 && n % static_cast<uint64_t>(config_.fail_every_n) == 0) {
        // Buy leg filled, sell leg rejected: unwind the buy at the same price.
        record.fees = 2.0 * cost * fees_.taker_fee_rate;
        record.actual_profit = -record.fees;
        record.status = TradeStatus::FAILED;
        record.rolled_back = true;
        record.error = "sell leg rejected on " + request.sell_venue + ", buy leg rolled back";
        record.completed_at = clock_.now();
        ARBGATE_LOG_WARN("Paper trade {} failed and rolled back, cost ${:.2f}", record.id, record.fees);
        return record;
    }

    const double sell_fill = request.sell_price * (1.0 - config_.adverse_slippage_rate);
    const double revenue = sell_fill * request.quantity;

    record.fees = (cost + revenue) * fees_.taker_fee_rate + fees_.network_fee;
    record.actual_profit = revenue - cost - record.fees;
    record.status = TradeStatus::EXECUTED;
    record.completed_at = clock_.now();

    ARBGATE_LOG_INFO("Paper trade {} {} buy@{} on {} sell@{} on {}: profit ${:.2f}",
                     record.id, record.symbol, buy_fill, record.buy_venue,
                     sell_fill, record.sell_venue, record.actual_profit);
    return record;
}

} // namespace arbgate
