#include "orchestrator.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>
#include "exceptions.hpp"
#include "opportunity_evaluator.hpp"
#include "../utils/logger.hpp"

namespace arbgate {

namespace {

constexpr auto kHourWindow = std::chrono::hours(1);
constexpr double kSecondsPerDay = 86400.0;
const char* const kOracleBlocked = "oracle-blocked";

} // namespace

std::string to_string(AdmissionDecision decision) {
    switch (decision) {
        case AdmissionDecision::ADMITTED: return "admitted";
        case AdmissionDecision::NOT_RUNNING: return "not-running";
        case AdmissionDecision::RATE_LIMITED: return "rate-limited";
        case AdmissionDecision::DAILY_LOSS_LIMIT: return "daily-loss-limit";
        case AdmissionDecision::INSUFFICIENT_CAPITAL: return "insufficient-capital";
        case AdmissionDecision::QUEUE_FULL: return "queue-full";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const OrchestratorStatus& status) {
    j = nlohmann::json{
        {"running", status.running},
        {"mode", to_string(status.mode)},
        {"uptime_sec", status.uptime.count()},
        {"total_capital", status.total_capital},
        {"reserved_capital", status.reserved_capital},
        {"available_capital", status.available_capital},
        {"today_profit", status.today_profit},
        {"total_profit", status.total_profit},
        {"trades_executed", status.trades_executed},
        {"successful_trades", status.successful_trades},
        {"win_rate", status.win_rate},
        {"queued_opportunities", status.queued_opportunities},
        {"trades_this_hour", status.trades_this_hour},
        {"daily_loss_limit_reached", status.daily_loss_limit_reached},
        {"rejections", status.rejections}
    };
    if (status.last_trade_at) {
        j["last_trade_at"] = to_epoch_ms(*status.last_trade_at);
    } else {
        j["last_trade_at"] = nullptr;
    }
}

void to_json(nlohmann::json& j, const DailyStats& stats) {
    j = nlohmann::json{
        {"date", stats.date},
        {"trades_executed", stats.trades_executed},
        {"successful_trades", stats.successful_trades},
        {"failed_trades", stats.failed_trades},
        {"total_profit", stats.total_profit},
        {"total_volume", stats.total_volume},
        {"average_profit", stats.average_profit},
        {"best_trade", stats.best_trade},
        {"worst_trade", stats.worst_trade},
        {"uptime_percent", stats.uptime_percent}
    };
}

Orchestrator::Orchestrator(const OrchestratorConfig& config,
                           const FeeConfig& fees,
                           Clock& clock,
                           ExecutionEngine* engine,
                           RiskOracle* oracle,
                           EventSink* events,
                           PriceAggregator* aggregator)
    : config_(config)
    , fees_(fees)
    , clock_(clock)
    , engine_(engine)
    , oracle_(oracle)
    , events_(events)
    , aggregator_(aggregator)
    , ledger_(config.capital_usd) {
    hour_window_start_ = clock_.now();
    daily_.date = format_date(hour_window_start_);
}

Orchestrator::~Orchestrator() {
    stop();
    if (aggregator_) {
        aggregator_->set_spread_callback(nullptr);
    }
    if (worker_.joinable()) {
        worker_.detach();
    }
}

bool Orchestrator::start() {
    if (!running_ && worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return true;
        }
        if (config_.mode != TradingMode::SIMULATION && engine_ == nullptr) {
            ARBGATE_LOG_ERROR("Cannot start in {} mode without an execution engine",
                              to_string(config_.mode));
            return false;
        }

        running_ = true;
        started_at_ = clock_.now();
        worker_ = std::thread(&Orchestrator::worker_loop, this);
    }

    if (aggregator_) {
        aggregator_->set_spread_callback([this](const std::vector<Spread>& spreads) {
            on_spreads(spreads);
        });
        aggregator_->start();
    }

    ARBGATE_LOG_INFO("Orchestrator started: mode={}, capital=${:.2f}, max {} trades/hour, daily loss limit ${:.2f}",
                     to_string(config_.mode), ledger_.total_capital(),
                     config_.max_trades_per_hour, config_.daily_loss_limit);
    return true;
}

void Orchestrator::stop() {
    size_t cancelled = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            running_ = false;

            const Timestamp now = clock_.now();
            while (!queue_.empty()) {
                TradeRecord record = std::move(queue_.front().record);
                queue_.pop_front();
                record.status = TradeStatus::CANCELLED;
                record.error = "orchestrator stopped";
                record.completed_at = now;
                push_history_locked(record);
                ++cancelled;
            }
        }
    }
    queue_cv_.notify_all();
    idle_cv_.notify_all();

    if (aggregator_) {
        aggregator_->stop();
    }

    // An event listener on the worker thread may stop the orchestrator.
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }

    if (cancelled > 0) {
        ARBGATE_LOG_WARN("Orchestrator stopped, {} queued trades cancelled", cancelled);
    }
}

AdmissionDecision Orchestrator::submit(const Opportunity& opportunity) {
    std::optional<SafetyLimitEvent> safety_event;
    AdmissionDecision decision;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        decision = admit_locked(safety_event);

        if (decision == AdmissionDecision::ADMITTED) {
            QueueItem item;
            item.opportunity = opportunity;

            TradeRecord& record = item.record;
            record.id = fmt::format("TRD-{:06d}", ++trade_sequence_);
            record.opportunity_id = opportunity.id;
            record.symbol = opportunity.symbol;
            record.buy_venue = opportunity.buy_venue;
            record.sell_venue = opportunity.sell_venue;
            record.quantity = opportunity.quantity;
            record.volume = opportunity.gross_cost;
            record.mode = config_.mode;
            record.status = TradeStatus::PENDING;
            record.expected_profit = opportunity.net_profit;
            record.started_at = clock_.now();

            queue_.push_back(std::move(item));
        } else {
            rejections_[to_string(decision)]++;
        }
    }

    if (safety_event) {
        emit(*safety_event);
    }

    if (decision == AdmissionDecision::ADMITTED) {
        queue_cv_.notify_one();
        ARBGATE_LOG_DEBUG("Admitted {} ({} -> {}, expected ${:.2f})", opportunity.id,
                          opportunity.buy_venue, opportunity.sell_venue, opportunity.net_profit);
    } else {
        ARBGATE_LOG_DEBUG("Rejected {}: {}", opportunity.id, to_string(decision));
    }
    return decision;
}

void Orchestrator::on_spreads(const std::vector<Spread>& spreads) {
    emit(SpreadsEvent{spreads});
    if (!running_) {
        return;
    }

    for (const auto& spread : spreads) {
        Opportunity opportunity;
        try {
            opportunity = OpportunityEvaluator::evaluate(spread, fees_);
        } catch (const ValidationError& e) {
            ARBGATE_LOG_WARN("Skipping spread for {}: {}", spread.symbol, e.what());
            continue;
        }

        const Viability viability = OpportunityEvaluator::check_viability(opportunity, fees_);
        if (viability != Viability::VIABLE) {
            std::lock_guard<std::mutex> lock(mutex_);
            rejections_[to_string(viability)]++;
            continue;
        }

        submit(opportunity);
    }
}

AdmissionDecision Orchestrator::admit_locked(std::optional<SafetyLimitEvent>& safety_event) {
    if (!running_) {
        return AdmissionDecision::NOT_RUNNING;
    }

    roll_hour_window_locked(clock_.now());
    const size_t pending = queue_.size() + (in_flight_ ? 1 : 0);
    if (static_cast<size_t>(trades_this_hour_) + pending >=
        static_cast<size_t>(std::max(config_.max_trades_per_hour, 0))) {
        return AdmissionDecision::RATE_LIMITED;
    }

    if (check_loss_breaker_locked(safety_event)) {
        return AdmissionDecision::DAILY_LOSS_LIMIT;
    }

    if (ledger_.available_capital() < fees_.capital_allocation) {
        return AdmissionDecision::INSUFFICIENT_CAPITAL;
    }

    if (queue_.size() >= config_.max_queue_size) {
        return AdmissionDecision::QUEUE_FULL;
    }

    return AdmissionDecision::ADMITTED;
}

void Orchestrator::roll_hour_window_locked(Timestamp now) {
    if (now - hour_window_start_ >= kHourWindow) {
        trades_this_hour_ = 0;
        hour_window_start_ = now;
    }
}

bool Orchestrator::check_loss_breaker_locked(std::optional<SafetyLimitEvent>& safety_event) {
    if (daily_loss_limit_reached_) {
        return true;
    }
    if (daily_pnl_ < -config_.daily_loss_limit) {
        daily_loss_limit_reached_ = true;

        SafetyLimitEvent event;
        event.limit = SafetyLimit::DAILY_LOSS;
        event.message = fmt::format("daily loss ${:.2f} exceeds limit ${:.2f}, admission closed",
                                    -daily_pnl_, config_.daily_loss_limit);
        event.current_value = daily_pnl_;
        event.threshold = -config_.daily_loss_limit;
        safety_event = event;

        ARBGATE_LOG_CRITICAL("Daily loss limit reached: {}", event.message);
        return true;
    }
    return false;
}

void Orchestrator::worker_loop() {
    while (true) {
        QueueItem item;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            queue_cv_.wait(lock, [this] { return !running_ || !queue_.empty(); });
            if (!running_) {
                break;
            }
            item = std::move(queue_.front());
            queue_.pop_front();
            item.record.status = TradeStatus::EXECUTING;
            in_flight_ = true;
            worker_busy_ = true;
        }

        try {
            process(item);
        } catch (const std::exception& e) {
            ARBGATE_LOG_CRITICAL("Unhandled error processing {}: {}", item.record.id, e.what());
        } catch (...) {
            ARBGATE_LOG_CRITICAL("Unhandled unknown error processing {}", item.record.id);
        }
        finish_item();
    }
}

void Orchestrator::process(QueueItem& item) {
    const Opportunity& opportunity = item.opportunity;
    OrchestratorConfig config;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config = config_;
    }

    if (config.enable_risk_oracle && oracle_) {
        RiskVerdict verdict;
        try {
            verdict = oracle_->evaluate(opportunity.symbol, opportunity.buy_price, opportunity.sell_price,
                                        opportunity.net_profit,
                                        std::chrono::milliseconds(config.risk_window_ms));
        } catch (const std::exception& e) {
            verdict.proceed = false;
            verdict.rationale = std::string("risk oracle unavailable: ") + e.what();
            ARBGATE_LOG_ERROR("Risk oracle failed for {}: {}", opportunity.id, e.what());
        } catch (...) {
            verdict.proceed = false;
            verdict.rationale = "risk oracle unavailable: unknown error";
            ARBGATE_LOG_ERROR("Risk oracle failed for {}: unknown error", opportunity.id);
        }

        if (!verdict.proceed) {
            TradeRecord record = item.record;
            record.status = TradeStatus::CANCELLED;
            record.error = verdict.rationale;
            record.completed_at = clock_.now();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                rejections_[kOracleBlocked]++;
                push_history_locked(record);
                in_flight_ = false;
            }
            ARBGATE_LOG_INFO("Opportunity {} blocked by risk oracle: {}", opportunity.id, verdict.rationale);
            emit(OpportunityBlockedEvent{opportunity, verdict.rationale});
            return;
        }
    }

    TradeRecord record = item.record;
    std::optional<SafetyLimitEvent> reservation_event;
    try {
        CapitalReservation reservation(ledger_, fees_.capital_allocation);
        record = execute_trade(item, config.mode);
    } catch (const CapitalLedgerError& e) {
        record.status = TradeStatus::FAILED;
        record.error = e.what();
        record.completed_at = clock_.now();

        SafetyLimitEvent event;
        event.limit = SafetyLimit::CAPITAL_RESERVATION;
        event.message = e.what();
        event.current_value = ledger_.available_capital();
        event.threshold = fees_.capital_allocation;
        reservation_event = event;

        ARBGATE_LOG_CRITICAL("Capital reservation for {} refused after admission: {}", record.id, e.what());
    }

    std::optional<SafetyLimitEvent> loss_event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        record_trade_locked(record);
        check_loss_breaker_locked(loss_event);
        in_flight_ = false;
    }

    if (record.status == TradeStatus::EXECUTED) {
        ARBGATE_LOG_INFO("Trade {} executed: {} {} -> {}, profit ${:.2f}", record.id, record.symbol,
                         record.buy_venue, record.sell_venue, record.actual_profit);
        emit(TradeCompletedEvent{record});
    } else if (record.rolled_back) {
        ARBGATE_LOG_WARN("Trade {} rolled back: {}", record.id, record.error.value_or(""));
        emit(TradeRollbackEvent{record});
    } else {
        ARBGATE_LOG_WARN("Trade {} failed: {}", record.id, record.error.value_or(""));
        emit(TradeFailedEvent{record});
    }

    if (reservation_event) {
        emit(*reservation_event);
    }
    if (loss_event) {
        emit(*loss_event);
    }
}

TradeRecord Orchestrator::execute_trade(const QueueItem& item, TradingMode mode) {
    const Opportunity& opportunity = item.opportunity;
    TradeRecord record = item.record;
    record.mode = mode;

    if (mode == TradingMode::SIMULATION) {
        record.status = TradeStatus::EXECUTED;
        record.actual_profit = opportunity.net_profit;
        record.fees = opportunity.fees.taker + opportunity.fees.network;
        record.completed_at = clock_.now();
        return record;
    }

    if (engine_ == nullptr) {
        record.status = TradeStatus::FAILED;
        record.error = "no execution engine configured";
        record.completed_at = clock_.now();
        return record;
    }

    ExecutionRequest request;
    request.trade_id = record.id;
    request.symbol = opportunity.symbol;
    request.buy_venue = opportunity.buy_venue;
    request.sell_venue = opportunity.sell_venue;
    request.buy_price = opportunity.buy_price;
    request.sell_price = opportunity.sell_price;
    request.quantity = opportunity.quantity;
    request.expected_profit = opportunity.net_profit;

    try {
        const TradeRecord outcome = engine_->execute(request);
        record.actual_profit = std::isfinite(outcome.actual_profit) ? outcome.actual_profit : 0.0;
        record.fees = outcome.fees;
        record.rolled_back = outcome.rolled_back;
        record.error = outcome.error;
        if (outcome.volume > 0.0) {
            record.volume = outcome.volume;
        }

        if (outcome.status == TradeStatus::EXECUTED) {
            record.status = TradeStatus::EXECUTED;
        } else {
            record.status = TradeStatus::FAILED;
            if (!record.error) {
                record.error = "execution engine returned status " + to_string(outcome.status);
            }
        }
    } catch (const std::exception& e) {
        record.status = TradeStatus::FAILED;
        record.actual_profit = 0.0;
        record.error = e.what();
        ARBGATE_LOG_ERROR("Execution of {} failed: {}", record.id, e.what());
    } catch (...) {
        record.status = TradeStatus::FAILED;
        record.actual_profit = 0.0;
        record.error = "unknown error";
        ARBGATE_LOG_ERROR("Execution of {} failed: unknown error", record.id);
    }

    record.completed_at = clock_.now();
    return record;
}

void Orchestrator::record_trade_locked(const TradeRecord& record) {
    roll_hour_window_locked(clock_.now());
    trades_this_hour_++;

    daily_pnl_ += record.actual_profit;
    total_pnl_ += record.actual_profit;
    ledger_.apply_pnl(record.actual_profit);

    total_trades_++;
    const bool success = record.status == TradeStatus::EXECUTED;
    if (success) {
        total_successful_++;
    }

    daily_.trades_executed++;
    if (success) {
        daily_.successful_trades++;
    } else {
        daily_.failed_trades++;
    }
    daily_.total_profit += record.actual_profit;
    daily_.total_volume += record.volume;
    if (daily_.trades_executed == 1) {
        daily_.best_trade = record.actual_profit;
        daily_.worst_trade = record.actual_profit;
    } else {
        daily_.best_trade = std::max(daily_.best_trade, record.actual_profit);
        daily_.worst_trade = std::min(daily_.worst_trade, record.actual_profit);
    }

    last_trade_at_ = record.completed_at;
    push_history_locked(record);
}

void Orchestrator::push_history_locked(const TradeRecord& record) {
    history_.push_back(record);
    while (history_.size() > config_.max_trade_history) {
        history_.pop_front();
    }
}

void Orchestrator::finish_item() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_ = false;
        worker_busy_ = false;
    }
    idle_cv_.notify_all();
}

Result<OrchestratorConfig> Orchestrator::update_config(const OrchestratorConfigUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (update.mode && *update.mode != config_.mode && running_) {
        ARBGATE_LOG_ERROR("Cannot change mode from {} to {} while running",
                          to_string(config_.mode), to_string(*update.mode));
        return Result<OrchestratorConfig>::error("cannot change trading mode while running");
    }
    if (update.max_trades_per_hour && *update.max_trades_per_hour <= 0) {
        return Result<OrchestratorConfig>::error("max_trades_per_hour must be positive");
    }
    if (update.daily_loss_limit && !(*update.daily_loss_limit >= 0.0)) {
        return Result<OrchestratorConfig>::error("daily_loss_limit must not be negative");
    }
    if (update.risk_window_ms && *update.risk_window_ms < 0) {
        return Result<OrchestratorConfig>::error("risk_window_ms must not be negative");
    }
    if (update.max_queue_size && *update.max_queue_size == 0) {
        return Result<OrchestratorConfig>::error("max_queue_size must be positive");
    }

    OrchestratorConfig next = config_;
    if (update.mode) next.mode = *update.mode;
    if (update.max_trades_per_hour) next.max_trades_per_hour = *update.max_trades_per_hour;
    if (update.daily_loss_limit) next.daily_loss_limit = *update.daily_loss_limit;
    if (update.enable_risk_oracle) next.enable_risk_oracle = *update.enable_risk_oracle;
    if (update.risk_window_ms) next.risk_window_ms = *update.risk_window_ms;
    if (update.max_queue_size) next.max_queue_size = *update.max_queue_size;

    if (update.capital_usd) {
        auto result = ledger_.set_total_capital(*update.capital_usd);
        if (result.is_error()) {
            return Result<OrchestratorConfig>::error(result.error());
        }
        next.capital_usd = result.value();
    }

    if (next.mode != config_.mode) {
        ARBGATE_LOG_INFO("Trading mode changed: {} -> {}", to_string(config_.mode), to_string(next.mode));
    }
    config_ = next;
    return Result<OrchestratorConfig>::success(config_);
}

OrchestratorConfig Orchestrator::get_config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

OrchestratorStatus Orchestrator::get_status() const {
    const Timestamp now = clock_.now();
    const CapitalLedger::Snapshot capital = ledger_.snapshot();

    std::lock_guard<std::mutex> lock(mutex_);
    OrchestratorStatus status;
    status.running = running_;
    status.mode = config_.mode;
    if (running_) {
        status.uptime = std::chrono::duration_cast<std::chrono::seconds>(now - started_at_);
    }
    status.total_capital = capital.total;
    status.reserved_capital = capital.reserved;
    status.available_capital = capital.available();
    status.today_profit = daily_pnl_;
    status.total_profit = total_pnl_;
    status.trades_executed = total_trades_;
    status.successful_trades = total_successful_;
    status.win_rate = total_trades_ > 0
        ? static_cast<double>(total_successful_) / total_trades_ * 100.0
        : 0.0;
    status.queued_opportunities = queue_.size();
    status.trades_this_hour = now - hour_window_start_ >= kHourWindow ? 0 : trades_this_hour_;
    status.daily_loss_limit_reached = daily_loss_limit_reached_;
    status.rejections = rejections_;
    status.last_trade_at = last_trade_at_;
    return status;
}

DailyStats Orchestrator::get_daily_stats() const {
    const Timestamp now = clock_.now();

    std::lock_guard<std::mutex> lock(mutex_);
    DailyStats stats = daily_;
    stats.average_profit = stats.successful_trades > 0
        ? stats.total_profit / stats.successful_trades
        : 0.0;
    if (running_) {
        const double running_sec = std::chrono::duration<double>(now - started_at_).count();
        stats.uptime_percent = std::min(100.0, running_sec / kSecondsPerDay * 100.0);
    }
    return stats;
}

void Orchestrator::reset_daily() {
    std::lock_guard<std::mutex> lock(mutex_);
    ARBGATE_LOG_INFO("Daily reset: P&L ${:.2f} over {} trades{}", daily_pnl_, daily_.trades_executed,
                     daily_loss_limit_reached_ ? ", loss breaker re-armed" : "");
    daily_pnl_ = 0.0;
    daily_loss_limit_reached_ = false;
    daily_ = DailyStats{};
    daily_.date = format_date(clock_.now());
}

bool Orchestrator::wait_for_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return queue_.empty() && !worker_busy_; });
}

std::vector<TradeRecord> Orchestrator::get_recent_trades(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t n = std::min(count, history_.size());
    return std::vector<TradeRecord>(history_.end() - static_cast<std::ptrdiff_t>(n), history_.end());
}

void Orchestrator::emit(const Event& event) {
    if (events_ == nullptr) {
        return;
    }
    try {
        events_->push_event(event);
    } catch (const std::exception& e) {
        ARBGATE_LOG_ERROR("Event listener failed on '{}': {}", event_name(event), e.what());
    }
}

} // namespace arbgate
