#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "clock.hpp"
#include "market_data_source.hpp"
#include "types.hpp"
#include "../data/price_cache.hpp"
#include "../utils/config_types.hpp"

namespace arbgate {

// Outcome of one scan cycle. quotes and errors are keyed by venue; a venue
// appears in exactly one of them.
struct ScanResult {
    std::map<std::string, std::vector<PriceQuote>> quotes;
    std::map<std::string, std::string> errors;
    std::vector<Spread> spreads;
    Timestamp started_at{};
    std::chrono::milliseconds duration{0};
};

struct VenueHealth {
    std::string venue;
    uint64_t fetches = 0;
    uint64_t successes = 0;
    uint64_t consecutive_failures = 0;
    std::string last_error;
    std::chrono::milliseconds last_latency{0};
};

struct AggregatorStats {
    uint64_t total_scans = 0;
    uint64_t total_fetches = 0;
    uint64_t successful_fetches = 0;
    double success_rate = 0.0;    // percent
    size_t venues_monitored = 0;
    std::chrono::milliseconds last_scan_duration{0};
};

void to_json(nlohmann::json& j, const VenueHealth& health);
void to_json(nlohmann::json& j, const AggregatorStats& stats);

class PriceAggregator {
public:
    using SpreadCallback = std::function<void(const std::vector<Spread>&)>;
    using QuoteObserver = std::function<void(const PriceQuote&)>;

    PriceAggregator(const ScannerConfig& config, Clock& clock);
    ~PriceAggregator();

    PriceAggregator(const PriceAggregator&) = delete;
    PriceAggregator& operator=(const PriceAggregator&) = delete;

    // Registration order is the tie order for equal extreme prices.
    void add_venue(std::shared_ptr<MarketDataSource> source, std::chrono::milliseconds timeout);
    bool remove_venue(const std::string& venue);
    std::vector<std::string> venues() const;

    // One cycle: fetch every venue concurrently, each against its own
    // deadline, then compute spreads from the venues that answered.
    ScanResult scan(const std::vector<std::string>& symbols);
    ScanResult scan();

    // Fixed-interval scan loop on a dedicated thread.
    void start();
    void stop();
    bool is_running() const { return running_; }

    // Invoked with each non-empty spread batch, on the scanning thread.
    void set_spread_callback(SpreadCallback callback);
    void set_quote_observer(QuoteObserver observer);

    std::vector<PriceQuote> get_prices(const std::string& venue) const;
    std::map<std::string, std::vector<PriceQuote>> get_all_prices() const;
    std::vector<Spread> get_top_spreads(size_t limit) const;

    AggregatorStats get_stats() const;
    std::vector<VenueHealth> get_venue_health() const;

    // Quotes in venue registration order. Per symbol: buy leg is the first
    // venue at the minimum price, sell leg the first venue at the maximum.
    // Only spreads strictly above min_spread_percent are returned, widest
    // first.
    static std::vector<Spread> compute_spreads(const std::vector<PriceQuote>& quotes,
                                               double min_spread_percent,
                                               Timestamp observed_at);

private:
    struct FetchOutcome {
        std::vector<PriceQuote> quotes;
        std::chrono::milliseconds latency{0};
    };

    struct VenueSlot {
        std::string name;
        std::shared_ptr<MarketDataSource> source;
        std::chrono::milliseconds timeout{0};
        std::future<FetchOutcome> in_flight;    // left over from a timed-out cycle
        VenueHealth health;
    };

    void run();
    void drain_abandoned();
    void record_success(VenueSlot& slot, std::chrono::milliseconds latency);
    void record_failure(VenueSlot& slot, const std::string& error);
    bool is_registered(const VenueSlot* slot) const;
    std::vector<PriceQuote> ordered_cache_snapshot(Timestamp now) const;

    ScannerConfig config_;
    Clock& clock_;
    PriceCache cache_;

    std::mutex scan_mutex_;     // one cycle at a time
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<VenueSlot>> venues_;
    std::vector<std::future<FetchOutcome>> abandoned_;
    SpreadCallback spread_callback_;
    QuoteObserver quote_observer_;
    AggregatorStats stats_;

    std::atomic<bool> running_{false};
    std::mutex run_mutex_;
    std::condition_variable run_cv_;
    std::thread thread_;
};

} // namespace arbgate
