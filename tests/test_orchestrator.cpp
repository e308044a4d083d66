#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include "core/exceptions.hpp"
#include "core/opportunity_evaluator.hpp"
#include "core/orchestrator.hpp"
#include "mocks/manual_clock.hpp"
#include "mocks/mock_event_sink.hpp"
#include "mocks/mock_execution_engine.hpp"
#include "mocks/mock_risk_oracle.hpp"

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StrictMock;
using ::testing::Throw;

namespace {

// Holds the execution engine inside execute() until released.
class Gate {
public:
    void enter_and_wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        entered_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this] { return released_; });
    }

    bool wait_entered(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return entered_; });
    }

    void release() {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool entered_ = false;
    bool released_ = false;
};

arbgate::TradeRecord engine_result(arbgate::TradeStatus status, double actual_profit, bool rolled_back = false) {
    arbgate::TradeRecord record;
    record.status = status;
    record.actual_profit = actual_profit;
    record.fees = 4.0;
    record.rolled_back = rolled_back;
    record.mode = arbgate::TradingMode::PAPER;
    return record;
}

const auto kIdle = std::chrono::milliseconds(2000);

} // namespace

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.mode = arbgate::TradingMode::SIMULATION;
        config.capital_usd = 10000.0;
        config.max_trades_per_hour = 50;
        config.daily_loss_limit = 500.0;
        config.enable_risk_oracle = true;
        config.risk_window_ms = 5000;
        config.max_queue_size = 100;
    }

    arbgate::Opportunity opportunity(double buy = 100.0, double sell = 102.0) {
        arbgate::Spread spread;
        spread.symbol = "ETH";
        spread.low_venue = "alpha";
        spread.high_venue = "bravo";
        spread.low_price = buy;
        spread.high_price = sell;
        spread.spread_percent = (sell - buy) / buy * 100.0;
        spread.observed_at = clock.now();
        return arbgate::OpportunityEvaluator::evaluate(spread, fees);
    }

    arbgate::OrchestratorConfig config;
    arbgate::FeeConfig fees;
    arbgate::testing::ManualClock clock;
    arbgate::testing::RecordingEventSink events;
};

TEST_F(OrchestratorTest, RejectsWhenNotRunning) {
    arbgate::Orchestrator orchestrator(config, fees, clock, nullptr, nullptr, &events);

    EXPECT_EQ(orchestrator.submit(opportunity()), arbgate::AdmissionDecision::NOT_RUNNING);
    EXPECT_EQ(orchestrator.get_status().rejections["not-running"], 1u);
}

TEST_F(OrchestratorTest, SimulationTradeSettlesAtExpectedProfit) {
    arbgate::Orchestrator orchestrator(config, fees, clock, nullptr, nullptr, &events);
    ASSERT_TRUE(orchestrator.start());

    const auto opp = opportunity();
    EXPECT_EQ(orchestrator.submit(opp), arbgate::AdmissionDecision::ADMITTED);
    ASSERT_TRUE(orchestrator.wait_for_idle(kIdle));

    auto completed = events.of_type<arbgate::TradeCompletedEvent>();
    ASSERT_EQ(completed.size(), 1u);
    const auto& trade = completed[0].trade;
    EXPECT_EQ(trade.id, "TRD-000001");
    EXPECT_EQ(trade.opportunity_id, opp.id);
    EXPECT_EQ(trade.status, arbgate::TradeStatus::EXECUTED);
    EXPECT_EQ(trade.mode, arbgate::TradingMode::SIMULATION);
    EXPECT_DOUBLE_EQ(trade.actual_profit, opp.net_profit);

    auto status = orchestrator.get_status();
    EXPECT_EQ(status.trades_executed, 1u);
    EXPECT_EQ(status.successful_trades, 1u);
    EXPECT_DOUBLE_EQ(status.win_rate, 100.0);
    EXPECT_NEAR(status.total_profit, 14.46, 0.01);
    EXPECT_DOUBLE_EQ(status.reserved_capital, 0.0);
    EXPECT_NEAR(status.total_capital, 10000.0 + opp.net_profit, 1e-9);
    EXPECT_EQ(status.trades_this_hour, 1);
    EXPECT_TRUE(status.last_trade_at.has_value());

    orchestrator.stop();
}

TEST_F(OrchestratorTest, HourlyQuotaRejectsUntilWindowRolls) {
    config.max_trades_per_hour = 5;
    arbgate::Orchestrator orchestrator(config, fees, clock, nullptr, nullptr, &events);
    ASSERT_TRUE(orchestrator.start());

    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(orchestrator.submit(opportunity()), arbgate::AdmissionDecision::ADMITTED);
    }
    ASSERT_TRUE(orchestrator.wait_for_idle(kIdle));

    EXPECT_EQ(orchestrator.submit(opportunity()), arbgate::AdmissionDecision::RATE_LIMITED);
    EXPECT_EQ(events.count("trade-completed"), 5u);

    clock.advance(std::chrono::hours(1));
    EXPECT_EQ(orchestrator.submit(opportunity()), arbgate::AdmissionDecision::ADMITTED);
    ASSERT_TRUE(orchestrator.wait_for_idle(kIdle));

    auto status = orchestrator.get_status();
    EXPECT_EQ(status.trades_executed, 6u);
    EXPECT_EQ(status.rejections["rate-limited"], 1u);

    orchestrator.stop();
}

TEST_F(OrchestratorTest, QueuedOpportunitiesCountAgainstQuota) {
    config.mode = arbgate::TradingMode::PAPER;
    config.max_trades_per_hour = 2;
    StrictMock<arbgate::testing::MockExecutionEngine> engine;
    Gate gate;
    EXPECT_CALL(engine, execute(_)).Times(2).WillRepeatedly([&gate](const arbgate::ExecutionRequest&) {
        gate.enter_and_wait();
        return engine_result(arbgate::TradeStatus::EXECUTED, 10.0);
    });

    arbgate::Orchestrator orchestrator(config, fees, clock, &engine, nullptr, &events);
    ASSERT_TRUE(orchestrator.start());

    EXPECT_EQ(orchestrator.submit(opportunity()), arbgate::AdmissionDecision::ADMITTED);
    ASSERT_TRUE(gate.wait_entered(kIdle));
    EXPECT_EQ(orchestrator.submit(opportunity()), arbgate::AdmissionDecision::ADMITTED);
    EXPECT_EQ(orchestrator.submit(opportunity()), arbgate::AdmissionDecision::RATE_LIMITED);

    gate.release();
    ASSERT_TRUE(orchestrator.wait_for_idle(kIdle));
    EXPECT_EQ(orchestrator.get_status().trades_this_hour, 2);

    orchestrator.stop();
}

TEST_F(OrchestratorTest, ModeCannotChangeWhileRunning) {
    arbgate::Orchestrator orchestrator(config, fees, clock);
    ASSERT_TRUE(orchestrator.start());

    arbgate::OrchestratorConfigUpdate update;
    update.mode = arbgate::TradingMode::PAPER;
    update.max_trades_per_hour = 10;

    auto result = orchestrator.update_config(update);
    ASSERT_TRUE(result.is_error());
    EXPECT_THAT(result.error(), HasSubstr("mode"));
    EXPECT_EQ(orchestrator.get_config().mode, arbgate::TradingMode::SIMULATION);
    EXPECT_EQ(orchestrator.get_config().max_trades_per_hour, 50);

    orchestrator.stop();

    result = orchestrator.update_config(update);
    ASSERT_TRUE(result.is_success());
    EXPECT_EQ(result.value().mode, arbgate::TradingMode::PAPER);
    EXPECT_EQ(orchestrator.get_config().max_trades_per_hour, 10);
}

TEST_F(OrchestratorTest, ConfigUpdateAppliesWhileRunning) {
    arbgate::Orchestrator orchestrator(config, fees, clock);
    ASSERT_TRUE(orchestrator.start());

    arbgate::OrchestratorConfigUpdate update;
    update.capital_usd = 20000.0;
    update.daily_loss_limit = 250.0;
    update.mode = arbgate::TradingMode::SIMULATION;

    auto result = orchestrator.update_config(update);
    ASSERT_TRUE(result.is_success());
    EXPECT_DOUBLE_EQ(orchestrator.ledger().total_capital(), 20000.0);
    EXPECT_DOUBLE_EQ(orchestrator.get_config().daily_loss_limit, 250.0);

    arbgate::OrchestratorConfigUpdate invalid;
    invalid.max_trades_per_hour = 0;
    EXPECT_TRUE(orchestrator.update_config(invalid).is_error());

    arbgate::OrchestratorConfigUpdate negative_capital;
    negative_capital.capital_usd = -1.0;
    EXPECT_TRUE(orchestrator.update_config(negative_capital).is_error());
    EXPECT_DOUBLE_EQ(orchestrator.ledger().total_capital(), 20000.0);

    orchestrator.stop();
}

TEST_F(OrchestratorTest, DailyLossLimitClosesAdmissionUntilReset) {
    config.mode = arbgate::TradingMode::PAPER;
    NiceMock<arbgate::testing::MockExecutionEngine> engine;
    ON_CALL(engine, execute(_)).WillByDefault(Return(engine_result(arbgate::TradeStatus::EXECUTED, -500.01)));

    arbgate::Orchestrator orchestrator(config, fees, clock, &engine, nullptr, &events);
    ASSERT_TRUE(orchestrator.start());

    EXPECT_EQ(orchestrator.submit(opportunity()), arbgate::AdmissionDecision::ADMITTED);
    ASSERT_TRUE(orchestrator.wait_for_idle(kIdle));

    auto limits = events.of_type<arbgate::SafetyLimitEvent>();
    ASSERT_EQ(limits.size(), 1u);
    EXPECT_EQ(limits[0].limit, arbgate::SafetyLimit::DAILY_LOSS);
    EXPECT_DOUBLE_EQ(limits[0].current_value, -500.01);
    EXPECT_DOUBLE_EQ(limits[0].threshold, -500.0);

    // Even a very profitable opportunity is refused.
    EXPECT_EQ(orchestrator.submit(opportunity(100.0, 110.0)), arbgate::AdmissionDecision::DAILY_LOSS_LIMIT);
    EXPECT_EQ(orchestrator.submit(opportunity()), arbgate::AdmissionDecision::DAILY_LOSS_LIMIT);
    EXPECT_TRUE(orchestrator.get_status().daily_loss_limit_reached);
    EXPECT_EQ(events.of_type<arbgate::SafetyLimitEvent>().size(), 1u);

    orchestrator.reset_daily();
    EXPECT_FALSE(orchestrator.get_status().daily_loss_limit_reached);
    EXPECT_DOUBLE_EQ(orchestrator.get_status().today_profit, 0.0);
    EXPECT_EQ(orchestrator.submit(opportunity()), arbgate::AdmissionDecision::ADMITTED);
    ASSERT_TRUE(orchestrator.wait_for_idle(kIdle));

    orchestrator.stop();
}

TEST_F(OrchestratorTest, LossEqualToLimitKeepsAdmissionOpen) {
    config.mode = arbgate::TradingMode::PAPER;
    NiceMock<arbgate::testing::MockExecutionEngine> engine;
    ON_CALL(engine, execute(_)).WillByDefault(Return(engine_result(arbgate::TradeStatus::EXECUTED, -500.0)));

    arbgate::Orchestrator orchestrator(config, fees, clock, &engine, nullptr, &events);
    ASSERT_TRUE(orchestrator.start());

    EXPECT_EQ(orchestrator.submit(opportunity()), arbgate::AdmissionDecision::ADMITTED);
    ASSERT_TRUE(orchestrator.wait_for_idle(kIdle));

    EXPECT_EQ(events.count("safety-limit"), 0u);
    EXPECT_EQ(orchestrator.submit(opportunity()), arbgate::AdmissionDecision::ADMITTED);
    ASSERT_TRUE(orchestrator.wait_for_idle(kIdle));

    orchestrator.stop();
}

TEST_F(OrchestratorTest, CapitalIsReservedDuringExecutionAndAlwaysReleased) {
    config.mode = arbgate::TradingMode::PAPER;
    StrictMock<arbgate::testing::MockExecutionEngine> engine;

    arbgate::Orchestrator orchestrator(config, fees, clock, &engine, nullptr, &events);

    std::vector<double> reserved_during;
    EXPECT_CALL(engine, execute(_))
        .WillOnce([&](const arbgate::ExecutionRequest& request) {
            reserved_during.push_back(orchestrator.ledger().reserved_capital());
            EXPECT_EQ(request.symbol, "ETH");
            EXPECT_EQ(request.buy_venue, "alpha");
            EXPECT_EQ(request.sell_venue, "bravo");
            EXPECT_DOUBLE_EQ(request.quantity, 10.0);
            return engine_result(arbgate::TradeStatus::EXECUTED, 12.0);
        })
        .WillOnce([&](const arbgate::ExecutionRequest&) {
            reserved_during.push_back(orchestrator.ledger().reserved_capital());
            return engine_result(arbgate::TradeStatus::FAILED, 0.0);
        })
        .WillOnce(Throw(arbgate::ExecutionError("venue disconnected")));

    ASSERT_TRUE(orchestrator.start());
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(orchestrator.submit(opportunity()), arbgate::AdmissionDecision::ADMITTED);
        ASSERT_TRUE(orchestrator.wait_for_idle(kIdle));
        EXPECT_DOUBLE_EQ(orchestrator.ledger().reserved_capital(), 0.0);
    }

    ASSERT_EQ(reserved_during.size(), 2u);
    EXPECT_DOUBLE_EQ(reserved_during[0], fees.capital_allocation);
    EXPECT_DOUBLE_EQ(reserved_during[1], fees.capital_allocation);

    EXPECT_EQ(events.count("trade-completed"), 1u);
    auto failed = events.of_type<arbgate::TradeFailedEvent>();
    ASSERT_EQ(failed.size(), 2u);
    EXPECT_EQ(failed[0].trade.status, arbgate::TradeStatus::FAILED);
    ASSERT_TRUE(failed[1].trade.error.has_value());
    EXPECT_THAT(*failed[1].trade.error, HasSubstr("venue disconnected"));

    auto status = orchestrator.get_status();
    EXPECT_EQ(status.trades_executed, 3u);
    EXPECT_EQ(status.successful_trades, 1u);
    EXPECT_NEAR(status.win_rate, 100.0 / 3.0, 1e-9);
    EXPECT_DOUBLE_EQ(status.total_capital, 10012.0);

    orchestrator.stop();
}

TEST_F(OrchestratorTest, ReservationRefusedAfterAdmissionFailsTheTrade) {
    config.mode = arbgate::TradingMode::PAPER;
    config.capital_usd = 2500.0;
    config.daily_loss_limit = 100000.0;
    fees.capital_allocation = 1000.0;
    StrictMock<arbgate::testing::MockExecutionEngine> engine;
    Gate gate;
    EXPECT_CALL(engine, execute(_)).WillOnce([&gate](const arbgate::ExecutionRequest&) {
        gate.enter_and_wait();
        auto outcome = engine_result(arbgate::TradeStatus::FAILED, -1600.0, true);
        outcome.error = "sell leg rejected";
        return outcome;
    });

    arbgate::Orchestrator orchestrator(config, fees, clock, &engine, nullptr, &events);
    ASSERT_TRUE(orchestrator.start());

    EXPECT_EQ(orchestrator.submit(opportunity()), arbgate::AdmissionDecision::ADMITTED);
    ASSERT_TRUE(gate.wait_entered(kIdle));
    // 1500 is still free while the first trade holds its 1000.
    EXPECT_EQ(orchestrator.submit(opportunity()), arbgate::AdmissionDecision::ADMITTED);
    gate.release();
    ASSERT_TRUE(orchestrator.wait_for_idle(kIdle));

    EXPECT_EQ(events.count("trade-rollback"), 1u);
    auto failed = events.of_type<arbgate::TradeFailedEvent>();
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].trade.id, "TRD-000002");
    EXPECT_EQ(failed[0].trade.status, arbgate::TradeStatus::FAILED);
    EXPECT_THAT(failed[0].trade.error.value_or(""), HasSubstr("insufficient capital"));

    auto safety = events.of_type<arbgate::SafetyLimitEvent>();
    ASSERT_EQ(safety.size(), 1u);
    EXPECT_EQ(safety[0].limit, arbgate::SafetyLimit::CAPITAL_RESERVATION);
    EXPECT_DOUBLE_EQ(safety[0].threshold, 1000.0);

    EXPECT_DOUBLE_EQ(orchestrator.ledger().reserved_capital(), 0.0);
    auto status = orchestrator.get_status();
    EXPECT_DOUBLE_EQ(status.total_capital, 900.0);
    EXPECT_EQ(status.trades_executed, 2u);
    EXPECT_FALSE(status.daily_loss_limit_reached);

    orchestrator.stop();
}

TEST_F(OrchestratorTest, NonStandardEngineErrorFailsTheTrade) {
    config.mode = arbgate::TradingMode::PAPER;
    NiceMock<arbgate::testing::MockExecutionEngine> engine;
    ON_CALL(engine, execute(_)).WillByDefault([](const arbgate::ExecutionRequest&) -> arbgate::TradeRecord {
        throw 42;
    });

    arbgate::Orchestrator orchestrator(config, fees, clock, &engine, nullptr, &events);
    ASSERT_TRUE(orchestrator.start());
    orchestrator.submit(opportunity());
    ASSERT_TRUE(orchestrator.wait_for_idle(kIdle));

    auto failed = events.of_type<arbgate::TradeFailedEvent>();
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].trade.error.value_or(""), "unknown error");
    EXPECT_DOUBLE_EQ(orchestrator.ledger().reserved_capital(), 0.0);

    // The worker survives and keeps processing.
    ON_CALL(engine, execute(_)).WillByDefault(Return(engine_result(arbgate::TradeStatus::EXECUTED, 3.0)));
    orchestrator.submit(opportunity());
    ASSERT_TRUE(orchestrator.wait_for_idle(kIdle));
    EXPECT_EQ(events.count("trade-completed"), 1u);

    orchestrator.stop();
}

TEST_F(OrchestratorTest, RolledBackTradeEmitsRollback) {
    config.mode = arbgate::TradingMode::PAPER;
    NiceMock<arbgate::testing::MockExecutionEngine> engine;
    auto rolled_back = engine_result(arbgate::TradeStatus::FAILED, -4.0, true);
    rolled_back.error = "sell leg rejected";
    ON_CALL(engine, execute(_)).WillByDefault(Return(rolled_back));

    arbgate::Orchestrator orchestrator(config, fees, clock, &engine, nullptr, &events);
    ASSERT_TRUE(orchestrator.start());
    orchestrator.submit(opportunity());
    ASSERT_TRUE(orchestrator.wait_for_idle(kIdle));

    auto rollbacks = events.of_type<arbgate::TradeRollbackEvent>();
    ASSERT_EQ(rollbacks.size(), 1u);
    EXPECT_TRUE(rollbacks[0].trade.rolled_back);
    EXPECT_EQ(rollbacks[0].trade.error.value_or(""), "sell leg rejected");
    EXPECT_EQ(events.count("trade-failed"), 0u);
    EXPECT_DOUBLE_EQ(orchestrator.get_status().today_profit, -4.0);

    orchestrator.stop();
}

TEST_F(OrchestratorTest, OracleVetoBlocksBeforeCapitalIsTouched) {
    StrictMock<arbgate::testing::MockRiskOracle> oracle;
    EXPECT_CALL(oracle, evaluate("ETH", 100.0, 102.0, _, std::chrono::milliseconds(5000)))
        .WillOnce(Return(arbgate::RiskVerdict{false, "volatility band too wide"}));

    arbgate::Orchestrator orchestrator(config, fees, clock, nullptr, &oracle, &events);
    ASSERT_TRUE(orchestrator.start());

    EXPECT_EQ(orchestrator.submit(opportunity()), arbgate::AdmissionDecision::ADMITTED);
    ASSERT_TRUE(orchestrator.wait_for_idle(kIdle));

    auto blocked = events.of_type<arbgate::OpportunityBlockedEvent>();
    ASSERT_EQ(blocked.size(), 1u);
    EXPECT_EQ(blocked[0].reason, "volatility band too wide");
    EXPECT_EQ(blocked[0].opportunity.symbol, "ETH");
    EXPECT_EQ(events.count("trade-completed"), 0u);

    auto status = orchestrator.get_status();
    EXPECT_EQ(status.trades_executed, 0u);
    EXPECT_EQ(status.trades_this_hour, 0);
    EXPECT_EQ(status.rejections["oracle-blocked"], 1u);
    EXPECT_DOUBLE_EQ(status.total_capital, 10000.0);

    auto history = orchestrator.get_recent_trades(10);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].status, arbgate::TradeStatus::CANCELLED);

    orchestrator.stop();
}

TEST_F(OrchestratorTest, OracleFailureBlocksTheOpportunity) {
    NiceMock<arbgate::testing::MockRiskOracle> oracle;
    ON_CALL(oracle, evaluate(_, _, _, _, _)).WillByDefault(Throw(arbgate::RiskOracleError("no price history")));

    arbgate::Orchestrator orchestrator(config, fees, clock, nullptr, &oracle, &events);
    ASSERT_TRUE(orchestrator.start());
    orchestrator.submit(opportunity());
    ASSERT_TRUE(orchestrator.wait_for_idle(kIdle));

    auto blocked = events.of_type<arbgate::OpportunityBlockedEvent>();
    ASSERT_EQ(blocked.size(), 1u);
    EXPECT_THAT(blocked[0].reason, HasSubstr("no price history"));
    EXPECT_EQ(events.count("trade-completed"), 0u);

    orchestrator.stop();
}

TEST_F(OrchestratorTest, NonStandardOracleErrorIsAVeto) {
    NiceMock<arbgate::testing::MockRiskOracle> oracle;
    ON_CALL(oracle, evaluate(_, _, _, _, _)).WillByDefault(
        [](const std::string&, double, double, double, std::chrono::milliseconds) -> arbgate::RiskVerdict {
            throw 7;
        });

    arbgate::Orchestrator orchestrator(config, fees, clock, nullptr, &oracle, &events);
    ASSERT_TRUE(orchestrator.start());
    orchestrator.submit(opportunity());
    ASSERT_TRUE(orchestrator.wait_for_idle(kIdle));

    auto blocked = events.of_type<arbgate::OpportunityBlockedEvent>();
    ASSERT_EQ(blocked.size(), 1u);
    EXPECT_EQ(blocked[0].reason, "risk oracle unavailable: unknown error");
    EXPECT_EQ(orchestrator.get_status().rejections["oracle-blocked"], 1u);

    orchestrator.stop();
}

TEST_F(OrchestratorTest, DisabledOracleIsNotConsulted) {
    config.enable_risk_oracle = false;
    StrictMock<arbgate::testing::MockRiskOracle> oracle;
    EXPECT_CALL(oracle, evaluate(_, _, _, _, _)).Times(0);

    arbgate::Orchestrator orchestrator(config, fees, clock, nullptr, &oracle, &events);
    ASSERT_TRUE(orchestrator.start());
    orchestrator.submit(opportunity());
    ASSERT_TRUE(orchestrator.wait_for_idle(kIdle));

    EXPECT_EQ(events.count("trade-completed"), 1u);
    orchestrator.stop();
}

TEST_F(OrchestratorTest, RejectsWhenCapitalIsShort) {
    config.capital_usd = 500.0;
    arbgate::Orchestrator orchestrator(config, fees, clock, nullptr, nullptr, &events);
    ASSERT_TRUE(orchestrator.start());

    EXPECT_EQ(orchestrator.submit(opportunity()), arbgate::AdmissionDecision::INSUFFICIENT_CAPITAL);
    EXPECT_EQ(orchestrator.get_status().rejections["insufficient-capital"], 1u);

    orchestrator.stop();
}

TEST_F(OrchestratorTest, RejectsWhenQueueIsFull) {
    config.mode = arbgate::TradingMode::PAPER;
    config.max_queue_size = 1;
    NiceMock<arbgate::testing::MockExecutionEngine> engine;
    Gate gate;
    ON_CALL(engine, execute(_)).WillByDefault([&gate](const arbgate::ExecutionRequest&) {
        gate.enter_and_wait();
        return engine_result(arbgate::TradeStatus::EXECUTED, 1.0);
    });

    arbgate::Orchestrator orchestrator(config, fees, clock, &engine, nullptr, &events);
    ASSERT_TRUE(orchestrator.start());

    EXPECT_EQ(orchestrator.submit(opportunity()), arbgate::AdmissionDecision::ADMITTED);
    ASSERT_TRUE(gate.wait_entered(kIdle));
    EXPECT_EQ(orchestrator.submit(opportunity()), arbgate::AdmissionDecision::ADMITTED);
    EXPECT_EQ(orchestrator.submit(opportunity()), arbgate::AdmissionDecision::QUEUE_FULL);
    EXPECT_EQ(orchestrator.get_status().queued_opportunities, 1u);

    gate.release();
    ASSERT_TRUE(orchestrator.wait_for_idle(kIdle));
    orchestrator.stop();
}

TEST_F(OrchestratorTest, StopCancelsQueuedTradesAndFinishesTheActiveOne) {
    config.mode = arbgate::TradingMode::PAPER;
    NiceMock<arbgate::testing::MockExecutionEngine> engine;
    Gate gate;
    EXPECT_CALL(engine, execute(_)).Times(1).WillOnce([&gate](const arbgate::ExecutionRequest&) {
        gate.enter_and_wait();
        return engine_result(arbgate::TradeStatus::EXECUTED, 5.0);
    });

    arbgate::Orchestrator orchestrator(config, fees, clock, &engine, nullptr, &events);
    ASSERT_TRUE(orchestrator.start());

    orchestrator.submit(opportunity());
    ASSERT_TRUE(gate.wait_entered(kIdle));
    orchestrator.submit(opportunity());
    orchestrator.submit(opportunity());

    std::thread stopper([&orchestrator] { orchestrator.stop(); });
    while (orchestrator.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    gate.release();
    stopper.join();

    auto history = orchestrator.get_recent_trades(10);
    ASSERT_EQ(history.size(), 3u);
    const auto cancelled = std::count_if(history.begin(), history.end(), [](const arbgate::TradeRecord& r) {
        return r.status == arbgate::TradeStatus::CANCELLED && r.error.value_or("") == "orchestrator stopped";
    });
    EXPECT_EQ(cancelled, 2);
    EXPECT_EQ(events.count("trade-completed"), 1u);
    EXPECT_DOUBLE_EQ(orchestrator.ledger().reserved_capital(), 0.0);
    EXPECT_EQ(orchestrator.submit(opportunity()), arbgate::AdmissionDecision::NOT_RUNNING);
}

TEST_F(OrchestratorTest, PaperModeNeedsAnEngine) {
    config.mode = arbgate::TradingMode::PAPER;
    arbgate::Orchestrator orchestrator(config, fees, clock);

    EXPECT_FALSE(orchestrator.start());
    EXPECT_FALSE(orchestrator.is_running());
}

TEST_F(OrchestratorTest, SpreadBatchIsEvaluatedAndRejectionsCounted) {
    arbgate::Orchestrator orchestrator(config, fees, clock, nullptr, nullptr, &events);
    ASSERT_TRUE(orchestrator.start());

    auto make_spread = [this](double sell) {
        arbgate::Spread spread;
        spread.symbol = "BTC";
        spread.low_venue = "alpha";
        spread.high_venue = "charlie";
        spread.low_price = 100.0;
        spread.high_price = sell;
        spread.spread_percent = sell - 100.0;
        spread.observed_at = clock.now();
        return spread;
    };

    orchestrator.on_spreads({make_spread(102.0), make_spread(100.3), make_spread(100.9)});
    ASSERT_TRUE(orchestrator.wait_for_idle(kIdle));

    auto batches = events.of_type<arbgate::SpreadsEvent>();
    ASSERT_EQ(batches.size(), 1u);
    EXPECT_EQ(batches[0].spreads.size(), 3u);
    EXPECT_EQ(events.count("trade-completed"), 1u);

    auto status = orchestrator.get_status();
    EXPECT_EQ(status.rejections["not-profitable"], 1u);
    EXPECT_EQ(status.rejections["below-min-profit"], 1u);

    orchestrator.stop();
}

TEST_F(OrchestratorTest, DailyStatsSummariseTheDay) {
    config.mode = arbgate::TradingMode::PAPER;
    NiceMock<arbgate::testing::MockExecutionEngine> engine;
    EXPECT_CALL(engine, execute(_))
        .WillOnce(Return(engine_result(arbgate::TradeStatus::EXECUTED, 12.0)))
        .WillOnce(Return(engine_result(arbgate::TradeStatus::EXECUTED, 8.0)))
        .WillOnce(Return(engine_result(arbgate::TradeStatus::FAILED, -2.0)));

    arbgate::Orchestrator orchestrator(config, fees, clock, &engine, nullptr, &events);
    ASSERT_TRUE(orchestrator.start());
    for (int i = 0; i < 3; ++i) {
        orchestrator.submit(opportunity());
        ASSERT_TRUE(orchestrator.wait_for_idle(kIdle));
    }

    clock.advance(std::chrono::hours(6));
    auto stats = orchestrator.get_daily_stats();
    EXPECT_EQ(stats.date.size(), 10u);
    EXPECT_EQ(stats.trades_executed, 3u);
    EXPECT_EQ(stats.successful_trades, 2u);
    EXPECT_EQ(stats.failed_trades, 1u);
    EXPECT_DOUBLE_EQ(stats.total_profit, 18.0);
    EXPECT_DOUBLE_EQ(stats.average_profit, 9.0);
    EXPECT_DOUBLE_EQ(stats.best_trade, 12.0);
    EXPECT_DOUBLE_EQ(stats.worst_trade, -2.0);
    EXPECT_NEAR(stats.total_volume, 3000.0, 1e-9);
    EXPECT_NEAR(stats.uptime_percent, 25.0, 1e-9);

    orchestrator.reset_daily();
    EXPECT_EQ(orchestrator.get_daily_stats().trades_executed, 0u);
    EXPECT_EQ(orchestrator.get_status().trades_executed, 3u);

    orchestrator.stop();
}
