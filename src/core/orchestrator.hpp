#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "capital_ledger.hpp"
#include "clock.hpp"
#include "event.hpp"
#include "event_sink.hpp"
#include "execution_engine.hpp"
#include "price_aggregator.hpp"
#include "result.hpp"
#include "risk_oracle.hpp"
#include "types.hpp"
#include "../utils/config_types.hpp"

namespace arbgate {

enum class AdmissionDecision {
    ADMITTED,
    NOT_RUNNING,
    RATE_LIMITED,
    DAILY_LOSS_LIMIT,
    INSUFFICIENT_CAPITAL,
    QUEUE_FULL
};

std::string to_string(AdmissionDecision decision);

// Fields left empty keep their current value.
struct OrchestratorConfigUpdate {
    std::optional<TradingMode> mode;
    std::optional<double> capital_usd;
    std::optional<int> max_trades_per_hour;
    std::optional<double> daily_loss_limit;
    std::optional<bool> enable_risk_oracle;
    std::optional<int> risk_window_ms;
    std::optional<size_t> max_queue_size;
};

struct OrchestratorStatus {
    bool running = false;
    TradingMode mode = TradingMode::SIMULATION;
    std::chrono::seconds uptime{0};

    double total_capital = 0.0;
    double reserved_capital = 0.0;
    double available_capital = 0.0;

    double today_profit = 0.0;
    double total_profit = 0.0;
    uint64_t trades_executed = 0;
    uint64_t successful_trades = 0;
    double win_rate = 0.0;            // percent

    size_t queued_opportunities = 0;
    int trades_this_hour = 0;
    bool daily_loss_limit_reached = false;

    std::map<std::string, uint64_t> rejections;   // by reason
    std::optional<Timestamp> last_trade_at;
};

struct DailyStats {
    std::string date;                 // UTC, YYYY-MM-DD
    uint64_t trades_executed = 0;
    uint64_t successful_trades = 0;
    uint64_t failed_trades = 0;
    double total_profit = 0.0;
    double total_volume = 0.0;
    double average_profit = 0.0;      // per successful trade
    double best_trade = 0.0;
    double worst_trade = 0.0;
    double uptime_percent = 0.0;
};

void to_json(nlohmann::json& j, const OrchestratorStatus& status);
void to_json(nlohmann::json& j, const DailyStats& stats);

// Admits viable opportunities through the rate, loss and capital gates and
// executes them one at a time on a single worker thread.
//
// Collaborators are not owned. engine, oracle, events and aggregator may be
// null; without an engine only simulation mode can run.
class Orchestrator {
public:
    Orchestrator(const OrchestratorConfig& config,
                 const FeeConfig& fees,
                 Clock& clock,
                 ExecutionEngine* engine = nullptr,
                 RiskOracle* oracle = nullptr,
                 EventSink* events = nullptr,
                 PriceAggregator* aggregator = nullptr);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Starts the worker and, if wired, the aggregator. Returns false when
    // the mode needs an execution engine that is not configured.
    bool start();

    // Stops accepting work and cancels queued trades; a trade already
    // executing runs to completion. Safe from any thread.
    void stop();
    bool is_running() const { return running_; }

    AdmissionDecision submit(const Opportunity& opportunity);

    // Spread batch from the aggregator: evaluate, count rejections, submit
    // the viable ones.
    void on_spreads(const std::vector<Spread>& spreads);

    // A mode change while running rejects the whole update.
    Result<OrchestratorConfig> update_config(const OrchestratorConfigUpdate& update);
    OrchestratorConfig get_config() const;

    OrchestratorStatus get_status() const;
    DailyStats get_daily_stats() const;

    // Day rollover: clears daily P&L and stats and re-arms the loss breaker.
    void reset_daily();

    // True once the queue is empty and no trade is executing.
    bool wait_for_idle(std::chrono::milliseconds timeout);

    std::vector<TradeRecord> get_recent_trades(size_t count) const;

    const CapitalLedger& ledger() const { return ledger_; }

private:
    struct QueueItem {
        Opportunity opportunity;
        TradeRecord record;
    };

    void worker_loop();
    void process(QueueItem& item);
    TradeRecord execute_trade(const QueueItem& item, TradingMode mode);

    AdmissionDecision admit_locked(std::optional<SafetyLimitEvent>& safety_event);
    void roll_hour_window_locked(Timestamp now);
    bool check_loss_breaker_locked(std::optional<SafetyLimitEvent>& safety_event);
    void record_trade_locked(const TradeRecord& record);
    void push_history_locked(const TradeRecord& record);
    void finish_item();

    void emit(const Event& event);

    OrchestratorConfig config_;
    const FeeConfig fees_;
    Clock& clock_;
    ExecutionEngine* engine_;
    RiskOracle* oracle_;
    EventSink* events_;
    PriceAggregator* aggregator_;

    CapitalLedger ledger_;

    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<QueueItem> queue_;
    bool in_flight_ = false;      // counts against the hourly quota
    bool worker_busy_ = false;    // cleared after terminal events are emitted

    std::atomic<bool> running_{false};
    std::thread worker_;
    Timestamp started_at_{};

    int trades_this_hour_ = 0;
    Timestamp hour_window_start_{};
    double daily_pnl_ = 0.0;
    double total_pnl_ = 0.0;
    bool daily_loss_limit_reached_ = false;

    uint64_t trade_sequence_ = 0;
    uint64_t total_trades_ = 0;
    uint64_t total_successful_ = 0;
    std::map<std::string, uint64_t> rejections_;
    std::optional<Timestamp> last_trade_at_;
    DailyStats daily_;
    std::deque<TradeRecord> history_;
};

} // namespace arbgate
