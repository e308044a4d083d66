#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <thread>
#include "core/exceptions.hpp"
#include "core/price_aggregator.hpp"
#include "mocks/manual_clock.hpp"
#include "mocks/mock_market_data_source.hpp"

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

arbgate::PriceQuote quote(const std::string& venue, const std::string& symbol, double price) {
    arbgate::PriceQuote q;
    q.venue = venue;
    q.symbol = symbol;
    q.price = price;
    return q;
}

} // namespace

class PriceAggregatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.symbols = {"BTC", "ETH"};
        config.scan_interval_ms = 10;
        config.min_spread_percent = 0.5;
        config.cache_ttl_ms = 5000;
    }

    std::shared_ptr<NiceMock<arbgate::testing::MockMarketDataSource>> venue(
        const std::string& name, std::map<std::string, double> prices) {
        auto source = std::make_shared<NiceMock<arbgate::testing::MockMarketDataSource>>();
        ON_CALL(*source, venue()).WillByDefault(Return(name));
        ON_CALL(*source, fetch_prices(_, _))
            .WillByDefault([name, prices](const std::vector<std::string>& symbols, std::chrono::milliseconds) {
                return arbgate::testing::make_quotes(name, prices, symbols);
            });
        return source;
    }

    arbgate::ScannerConfig config;
    arbgate::testing::ManualClock clock;
};

TEST_F(PriceAggregatorTest, SpreadUsesMinAndMaxAcrossVenues) {
    std::vector<arbgate::PriceQuote> quotes = {
        quote("alpha", "BTC", 101.0),
        quote("bravo", "BTC", 100.0),
        quote("charlie", "BTC", 103.0),
    };

    auto spreads = arbgate::PriceAggregator::compute_spreads(quotes, 0.5, clock.now());
    ASSERT_EQ(spreads.size(), 1u);
    EXPECT_EQ(spreads[0].low_venue, "bravo");
    EXPECT_EQ(spreads[0].high_venue, "charlie");
    EXPECT_DOUBLE_EQ(spreads[0].low_price, 100.0);
    EXPECT_DOUBLE_EQ(spreads[0].high_price, 103.0);
    EXPECT_NEAR(spreads[0].spread_percent, 3.0, 1e-9);
    EXPECT_GE(spreads[0].high_price, spreads[0].low_price);
}

TEST_F(PriceAggregatorTest, TiesResolveToEarliestRegisteredVenue) {
    std::vector<arbgate::PriceQuote> quotes = {
        quote("alpha", "ETH", 102.0),
        quote("bravo", "ETH", 100.0),
        quote("charlie", "ETH", 100.0),
        quote("delta", "ETH", 102.0),
    };

    auto spreads = arbgate::PriceAggregator::compute_spreads(quotes, 0.5, clock.now());
    ASSERT_EQ(spreads.size(), 1u);
    EXPECT_EQ(spreads[0].low_venue, "bravo");
    EXPECT_EQ(spreads[0].high_venue, "alpha");
}

TEST_F(PriceAggregatorTest, OnlySpreadsAboveFloorAreEmittedWidestFirst) {
    std::vector<arbgate::PriceQuote> quotes = {
        quote("alpha", "BTC", 100.0), quote("bravo", "BTC", 100.4),
        quote("alpha", "ETH", 100.0), quote("bravo", "ETH", 100.6),
        quote("alpha", "SOL", 100.0), quote("bravo", "SOL", 102.0),
        quote("alpha", "XRP", 1.0),
    };

    auto spreads = arbgate::PriceAggregator::compute_spreads(quotes, 0.5, clock.now());
    ASSERT_EQ(spreads.size(), 2u);
    EXPECT_EQ(spreads[0].symbol, "SOL");
    EXPECT_EQ(spreads[1].symbol, "ETH");
    EXPECT_GT(spreads[0].spread_percent, spreads[1].spread_percent);
}

TEST_F(PriceAggregatorTest, NonPositivePricesAreIgnored) {
    std::vector<arbgate::PriceQuote> quotes = {
        quote("alpha", "BTC", 0.0),
        quote("bravo", "BTC", 100.0),
        quote("charlie", "BTC", 110.0),
    };

    auto spreads = arbgate::PriceAggregator::compute_spreads(quotes, 0.5, clock.now());
    ASSERT_EQ(spreads.size(), 1u);
    EXPECT_EQ(spreads[0].low_venue, "bravo");
}

TEST_F(PriceAggregatorTest, FailingVenueDoesNotFailTheScan) {
    arbgate::PriceAggregator aggregator(config, clock);
    aggregator.add_venue(venue("alpha", {{"BTC", 100.0}}), std::chrono::milliseconds(1000));
    aggregator.add_venue(venue("bravo", {{"BTC", 102.0}}), std::chrono::milliseconds(1000));

    auto broken = venue("broken", {});
    ON_CALL(*broken, fetch_prices(_, _)).WillByDefault([](const std::vector<std::string>&, std::chrono::milliseconds)
        -> std::vector<arbgate::PriceQuote> {
        throw arbgate::MarketDataError("connection refused");
    });
    aggregator.add_venue(broken, std::chrono::milliseconds(1000));

    auto result = aggregator.scan();
    EXPECT_EQ(result.quotes.size(), 2u);
    ASSERT_EQ(result.errors.count("broken"), 1u);
    EXPECT_NE(result.errors["broken"].find("connection refused"), std::string::npos);
    ASSERT_EQ(result.spreads.size(), 1u);
    EXPECT_EQ(result.spreads[0].low_venue, "alpha");
    EXPECT_EQ(result.spreads[0].high_venue, "bravo");
}

TEST_F(PriceAggregatorTest, SlowVenueTimesOutWithoutBlockingOthers) {
    arbgate::PriceAggregator aggregator(config, clock);
    aggregator.add_venue(venue("alpha", {{"BTC", 100.0}}), std::chrono::milliseconds(1000));
    aggregator.add_venue(venue("bravo", {{"BTC", 101.0}}), std::chrono::milliseconds(1000));

    auto slow = venue("slow", {{"BTC", 90.0}});
    EXPECT_CALL(*slow, fetch_prices(_, _))
        .Times(1)
        .WillOnce([](const std::vector<std::string>& symbols, std::chrono::milliseconds) {
            std::this_thread::sleep_for(std::chrono::milliseconds(600));
            return arbgate::testing::make_quotes("slow", {{"BTC", 90.0}}, symbols);
        });
    aggregator.add_venue(slow, std::chrono::milliseconds(50));

    const auto start = std::chrono::steady_clock::now();
    auto first = aggregator.scan();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(500));

    EXPECT_EQ(first.quotes.size(), 2u);
    ASSERT_EQ(first.errors.count("slow"), 1u);
    ASSERT_EQ(first.spreads.size(), 1u);
    EXPECT_EQ(first.spreads[0].low_venue, "alpha");
    EXPECT_EQ(first.spreads[0].high_venue, "bravo");

    // Previous fetch has not settled: the venue is skipped, not fetched twice.
    auto second = aggregator.scan();
    ASSERT_EQ(second.errors.count("slow"), 1u);
    EXPECT_EQ(second.errors["slow"], "fetch still in flight");
    EXPECT_EQ(second.quotes.size(), 2u);
}

TEST_F(PriceAggregatorTest, CallbackReceivesOnlyNonEmptyBatches) {
    arbgate::PriceAggregator aggregator(config, clock);
    auto alpha = venue("alpha", {{"BTC", 100.0}});
    auto bravo = venue("bravo", {{"BTC", 102.0}});
    aggregator.add_venue(alpha, std::chrono::milliseconds(1000));
    aggregator.add_venue(bravo, std::chrono::milliseconds(1000));

    std::vector<std::vector<arbgate::Spread>> batches;
    aggregator.set_spread_callback([&batches](const std::vector<arbgate::Spread>& spreads) {
        batches.push_back(spreads);
    });

    aggregator.scan();
    ASSERT_EQ(batches.size(), 1u);
    EXPECT_EQ(batches[0].size(), 1u);

    ON_CALL(*bravo, fetch_prices(_, _))
        .WillByDefault([](const std::vector<std::string>& symbols, std::chrono::milliseconds) {
            return arbgate::testing::make_quotes("bravo", {{"BTC", 100.1}}, symbols);
        });
    aggregator.scan();
    EXPECT_EQ(batches.size(), 1u);
}

TEST_F(PriceAggregatorTest, QuoteObserverSeesRespondingVenues) {
    arbgate::PriceAggregator aggregator(config, clock);
    aggregator.add_venue(venue("alpha", {{"BTC", 100.0}, {"ETH", 10.0}}), std::chrono::milliseconds(1000));
    aggregator.add_venue(venue("bravo", {{"BTC", 100.0}}), std::chrono::milliseconds(1000));

    std::vector<arbgate::PriceQuote> observed;
    aggregator.set_quote_observer([&observed](const arbgate::PriceQuote& q) { observed.push_back(q); });

    aggregator.scan();
    EXPECT_EQ(observed.size(), 3u);
}

TEST_F(PriceAggregatorTest, StatsAndVenueHealthTrackFailures) {
    arbgate::PriceAggregator aggregator(config, clock);
    aggregator.add_venue(venue("alpha", {{"BTC", 100.0}}), std::chrono::milliseconds(1000));

    auto broken = venue("broken", {});
    ON_CALL(*broken, fetch_prices(_, _)).WillByDefault([](const std::vector<std::string>&, std::chrono::milliseconds)
        -> std::vector<arbgate::PriceQuote> {
        throw arbgate::MarketDataError("HTTP 503");
    });
    aggregator.add_venue(broken, std::chrono::milliseconds(1000));

    aggregator.scan();
    aggregator.scan();

    auto stats = aggregator.get_stats();
    EXPECT_EQ(stats.total_scans, 2u);
    EXPECT_EQ(stats.total_fetches, 4u);
    EXPECT_EQ(stats.successful_fetches, 2u);
    EXPECT_DOUBLE_EQ(stats.success_rate, 50.0);
    EXPECT_EQ(stats.venues_monitored, 2u);

    auto health = aggregator.get_venue_health();
    ASSERT_EQ(health.size(), 2u);
    EXPECT_EQ(health[0].venue, "alpha");
    EXPECT_EQ(health[0].consecutive_failures, 0u);
    EXPECT_EQ(health[1].venue, "broken");
    EXPECT_EQ(health[1].consecutive_failures, 2u);
    EXPECT_NE(health[1].last_error.find("HTTP 503"), std::string::npos);
}

TEST_F(PriceAggregatorTest, CachedPricesExpireAfterTtl) {
    arbgate::PriceAggregator aggregator(config, clock);
    aggregator.add_venue(venue("alpha", {{"BTC", 100.0}}), std::chrono::milliseconds(1000));
    aggregator.add_venue(venue("bravo", {{"BTC", 105.0}}), std::chrono::milliseconds(1000));

    aggregator.scan();
    EXPECT_EQ(aggregator.get_prices("alpha").size(), 1u);
    EXPECT_EQ(aggregator.get_all_prices().size(), 2u);

    auto top = aggregator.get_top_spreads(5);
    ASSERT_EQ(top.size(), 1u);
    EXPECT_EQ(top[0].high_venue, "bravo");

    clock.advance(std::chrono::milliseconds(config.cache_ttl_ms + 1));
    EXPECT_TRUE(aggregator.get_prices("alpha").empty());
    EXPECT_TRUE(aggregator.get_top_spreads(5).empty());
}

TEST_F(PriceAggregatorTest, RemovedVenueIsNoLongerScanned) {
    arbgate::PriceAggregator aggregator(config, clock);
    aggregator.add_venue(venue("alpha", {{"BTC", 100.0}}), std::chrono::milliseconds(1000));
    aggregator.add_venue(venue("bravo", {{"BTC", 105.0}}), std::chrono::milliseconds(1000));

    EXPECT_TRUE(aggregator.remove_venue("bravo"));
    EXPECT_FALSE(aggregator.remove_venue("bravo"));

    auto result = aggregator.scan();
    EXPECT_EQ(result.quotes.size(), 1u);
    EXPECT_TRUE(result.spreads.empty());
    EXPECT_EQ(aggregator.venues(), std::vector<std::string>{"alpha"});
}

TEST_F(PriceAggregatorTest, LoopScansUntilStopped) {
    arbgate::PriceAggregator aggregator(config, clock);
    aggregator.add_venue(venue("alpha", {{"BTC", 100.0}}), std::chrono::milliseconds(1000));
    aggregator.add_venue(venue("bravo", {{"BTC", 105.0}}), std::chrono::milliseconds(1000));

    std::atomic<int> batches{0};
    aggregator.set_spread_callback([&batches](const std::vector<arbgate::Spread>&) { batches++; });

    aggregator.start();
    EXPECT_TRUE(aggregator.is_running());
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    aggregator.stop();
    EXPECT_FALSE(aggregator.is_running());

    const auto scans = aggregator.get_stats().total_scans;
    EXPECT_GE(scans, 2u);
    EXPECT_EQ(batches.load(), static_cast<int>(scans));

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(aggregator.get_stats().total_scans, scans);
}

TEST_F(PriceAggregatorTest, CallbackMayStopTheLoop) {
    arbgate::PriceAggregator aggregator(config, clock);
    aggregator.add_venue(venue("alpha", {{"BTC", 100.0}}), std::chrono::milliseconds(1000));
    aggregator.add_venue(venue("bravo", {{"BTC", 105.0}}), std::chrono::milliseconds(1000));

    aggregator.set_spread_callback([&aggregator](const std::vector<arbgate::Spread>&) { aggregator.stop(); });
    aggregator.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    EXPECT_FALSE(aggregator.is_running());
    EXPECT_EQ(aggregator.get_stats().total_scans, 1u);
    aggregator.stop();
}
