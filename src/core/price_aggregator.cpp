#include "price_aggregator.hpp"
#include <algorithm>
#include <cmath>
#include <system_error>
#include "../utils/logger.hpp"

namespace arbgate {

namespace {

constexpr uint64_t kProgressLogInterval = 100;
const char* const kStillInFlight = "fetch still in flight";

} // namespace

void to_json(nlohmann::json& j, const VenueHealth& health) {
    j = nlohmann::json{
        {"venue", health.venue},
        {"fetches", health.fetches},
        {"successes", health.successes},
        {"consecutive_failures", health.consecutive_failures},
        {"last_error", health.last_error},
        {"last_latency_ms", health.last_latency.count()}
    };
}

void to_json(nlohmann::json& j, const AggregatorStats& stats) {
    j = nlohmann::json{
        {"total_scans", stats.total_scans},
        {"total_fetches", stats.total_fetches},
        {"successful_fetches", stats.successful_fetches},
        {"success_rate", stats.success_rate},
        {"venues_monitored", stats.venues_monitored},
        {"last_scan_duration_ms", stats.last_scan_duration.count()}
    };
}

PriceAggregator::PriceAggregator(const ScannerConfig& config, Clock& clock)
    : config_(config)
    , clock_(clock)
    , cache_(std::chrono::milliseconds(config.cache_ttl_ms)) {
}

PriceAggregator::~PriceAggregator() {
    stop();
    if (thread_.joinable()) {
        thread_.detach();
    }
}

void PriceAggregator::add_venue(std::shared_ptr<MarketDataSource> source,
                                std::chrono::milliseconds timeout) {
    if (!source) {
        return;
    }

    auto slot = std::make_shared<VenueSlot>();
    slot->name = source->venue();
    slot->source = std::move(source);
    slot->timeout = timeout;
    slot->health.venue = slot->name;

    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = std::find_if(venues_.begin(), venues_.end(),
                                 [&](const auto& v) { return v->name == slot->name; });
    if (existing != venues_.end()) {
        ARBGATE_LOG_WARN("Venue {} already registered, replacing source", slot->name);
        if ((*existing)->in_flight.valid()) {
            abandoned_.push_back(std::move((*existing)->in_flight));
        }
        *existing = slot;
    } else {
        venues_.push_back(slot);
    }
    stats_.venues_monitored = venues_.size();
    ARBGATE_LOG_INFO("Venue {} added (timeout {}ms)", slot->name, timeout.count());
}

bool PriceAggregator::remove_venue(const std::string& venue) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(venues_.begin(), venues_.end(),
                               [&](const auto& v) { return v->name == venue; });
        if (it == venues_.end()) {
            return false;
        }
        if ((*it)->in_flight.valid()) {
            abandoned_.push_back(std::move((*it)->in_flight));
        }
        venues_.erase(it);
        stats_.venues_monitored = venues_.size();
    }
    cache_.remove(venue);
    ARBGATE_LOG_INFO("Venue {} removed", venue);
    return true;
}

std::vector<std::string> PriceAggregator::venues() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(venues_.size());
    for (const auto& slot : venues_) {
        names.push_back(slot->name);
    }
    return names;
}

ScanResult PriceAggregator::scan() {
    return scan(config_.symbols);
}

ScanResult PriceAggregator::scan(const std::vector<std::string>& symbols) {
    std::lock_guard<std::mutex> scan_lock(scan_mutex_);
    ARBGATE_SCOPED_TIMER("price_scan");

    using SteadyClock = std::chrono::steady_clock;

    struct PendingFetch {
        std::shared_ptr<VenueSlot> slot;
        std::future<FetchOutcome> future;
        SteadyClock::time_point deadline;
    };

    ScanResult result;
    result.started_at = clock_.now();
    const auto scan_start = SteadyClock::now();

    std::vector<PendingFetch> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drain_abandoned();

        for (const auto& slot : venues_) {
            if (slot->in_flight.valid()) {
                if (slot->in_flight.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
                    record_failure(*slot, kStillInFlight);
                    result.errors[slot->name] = kStillInFlight;
                    ARBGATE_LOG_DEBUG("Skipping {}: {}", slot->name, kStillInFlight);
                    continue;
                }
                try {
                    slot->in_flight.get();
                } catch (const std::exception& e) {
                    ARBGATE_LOG_DEBUG("Late fetch from {} failed: {}", slot->name, e.what());
                }
            }

            auto source = slot->source;
            auto timeout = slot->timeout;
            PendingFetch fetch;
            fetch.slot = slot;
            fetch.deadline = SteadyClock::now() + timeout;
            try {
                fetch.future = std::async(std::launch::async, [source, symbols, timeout]() {
                    const auto begin = SteadyClock::now();
                    FetchOutcome outcome;
                    outcome.quotes = source->fetch_prices(symbols, timeout);
                    outcome.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                        SteadyClock::now() - begin);
                    return outcome;
                });
            } catch (const std::system_error& e) {
                record_failure(*slot, e.what());
                result.errors[slot->name] = e.what();
                ARBGATE_LOG_ERROR("Could not start fetch for {}: {}", slot->name, e.what());
                continue;
            }
            pending.push_back(std::move(fetch));
        }
    }

    std::vector<PriceQuote> responded;
    for (auto& fetch : pending) {
        const std::string& venue = fetch.slot->name;

        if (fetch.future.wait_until(fetch.deadline) != std::future_status::ready) {
            const std::string error = "timed out after " +
                std::to_string(fetch.slot->timeout.count()) + "ms";
            std::lock_guard<std::mutex> lock(mutex_);
            record_failure(*fetch.slot, error);
            if (is_registered(fetch.slot.get())) {
                fetch.slot->in_flight = std::move(fetch.future);
            } else {
                abandoned_.push_back(std::move(fetch.future));
            }
            result.errors[venue] = error;
            ARBGATE_LOG_WARN("Price fetch from {} {}", venue, error);
            continue;
        }

        try {
            FetchOutcome outcome = fetch.future.get();
            for (auto& quote : outcome.quotes) {
                if (quote.venue.empty()) {
                    quote.venue = venue;
                }
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                record_success(*fetch.slot, outcome.latency);
            }
            cache_.update(venue, outcome.quotes, clock_.now());
            responded.insert(responded.end(), outcome.quotes.begin(), outcome.quotes.end());
            result.quotes[venue] = std::move(outcome.quotes);
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            record_failure(*fetch.slot, e.what());
            result.errors[venue] = e.what();
            ARBGATE_LOG_WARN("Price fetch from {} failed: {}", venue, e.what());
        }
    }

    result.spreads = compute_spreads(responded, config_.min_spread_percent, result.started_at);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        SteadyClock::now() - scan_start);

    SpreadCallback spread_callback;
    QuoteObserver quote_observer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.total_scans++;
        stats_.last_scan_duration = result.duration;
        stats_.success_rate = stats_.total_fetches > 0
            ? static_cast<double>(stats_.successful_fetches) / stats_.total_fetches * 100.0
            : 0.0;
        if (stats_.total_scans % kProgressLogInterval == 0) {
            ARBGATE_LOG_INFO("Scan #{}: {} venues, success rate {:.1f}%, {} spreads this cycle",
                             stats_.total_scans, stats_.venues_monitored,
                             stats_.success_rate, result.spreads.size());
        }
        spread_callback = spread_callback_;
        quote_observer = quote_observer_;
    }

    if (quote_observer) {
        for (const auto& quote : responded) {
            try {
                quote_observer(quote);
            } catch (const std::exception& e) {
                ARBGATE_LOG_ERROR("Quote observer failed: {}", e.what());
            }
        }
    }

    if (spread_callback && !result.spreads.empty()) {
        try {
            spread_callback(result.spreads);
        } catch (const std::exception& e) {
            ARBGATE_LOG_ERROR("Spread callback failed: {}", e.what());
        }
    }

    return result;
}

std::vector<Spread> PriceAggregator::compute_spreads(const std::vector<PriceQuote>& quotes,
                                                     double min_spread_percent,
                                                     Timestamp observed_at) {
    std::vector<std::string> symbol_order;
    std::map<std::string, std::vector<const PriceQuote*>> by_symbol;
    for (const auto& quote : quotes) {
        if (!std::isfinite(quote.price) || quote.price <= 0.0) {
            continue;
        }
        auto& bucket = by_symbol[quote.symbol];
        if (bucket.empty()) {
            symbol_order.push_back(quote.symbol);
        }
        bucket.push_back(&quote);
    }

    std::vector<Spread> spreads;
    for (const auto& symbol : symbol_order) {
        auto& bucket = by_symbol[symbol];
        if (bucket.size() < 2) {
            continue;
        }

        std::stable_sort(bucket.begin(), bucket.end(),
                         [](const PriceQuote* a, const PriceQuote* b) { return a->price < b->price; });

        const PriceQuote* low = bucket.front();
        const double max_price = bucket.back()->price;
        const PriceQuote* high = *std::find_if(bucket.begin(), bucket.end(),
                                               [max_price](const PriceQuote* q) { return q->price == max_price; });

        const double spread_percent = (high->price - low->price) / low->price * 100.0;
        if (!(spread_percent > min_spread_percent)) {
            continue;
        }

        Spread spread;
        spread.symbol = symbol;
        spread.low_venue = low->venue;
        spread.high_venue = high->venue;
        spread.low_price = low->price;
        spread.high_price = high->price;
        spread.spread_percent = spread_percent;
        spread.observed_at = observed_at;
        spreads.push_back(std::move(spread));
    }

    std::stable_sort(spreads.begin(), spreads.end(),
                     [](const Spread& a, const Spread& b) { return a.spread_percent > b.spread_percent; });
    return spreads;
}

void PriceAggregator::start() {
    if (!running_ && thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }

    std::lock_guard<std::mutex> lock(run_mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    thread_ = std::thread(&PriceAggregator::run, this);
    ARBGATE_LOG_INFO("Price aggregator started: {} symbols, interval {}ms, floor {}%",
                     config_.symbols.size(), config_.scan_interval_ms, config_.min_spread_percent);
}

void PriceAggregator::stop() {
    bool was_running = false;
    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        was_running = running_.exchange(false);
    }
    run_cv_.notify_all();

    // A callback running on the scan thread may stop the aggregator.
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
    if (was_running) {
        ARBGATE_LOG_INFO("Price aggregator stopped");
    }
}

void PriceAggregator::run() {
    const auto interval = std::chrono::milliseconds(std::max(1, config_.scan_interval_ms));
    auto next_tick = std::chrono::steady_clock::now();

    while (running_) {
        try {
            scan();
        } catch (const std::exception& e) {
            ARBGATE_LOG_ERROR("Scan cycle failed: {}", e.what());
        }

        next_tick += interval;
        const auto now = std::chrono::steady_clock::now();
        if (next_tick < now) {
            next_tick = now;
        }

        std::unique_lock<std::mutex> lock(run_mutex_);
        run_cv_.wait_until(lock, next_tick, [this] { return !running_; });
    }
}

void PriceAggregator::set_spread_callback(SpreadCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    spread_callback_ = std::move(callback);
}

void PriceAggregator::set_quote_observer(QuoteObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    quote_observer_ = std::move(observer);
}

std::vector<PriceQuote> PriceAggregator::get_prices(const std::string& venue) const {
    return cache_.get(venue, clock_.now());
}

std::map<std::string, std::vector<PriceQuote>> PriceAggregator::get_all_prices() const {
    return cache_.snapshot(clock_.now());
}

std::vector<Spread> PriceAggregator::get_top_spreads(size_t limit) const {
    const Timestamp now = clock_.now();
    auto spreads = compute_spreads(ordered_cache_snapshot(now), config_.min_spread_percent, now);
    if (spreads.size() > limit) {
        spreads.resize(limit);
    }
    return spreads;
}

AggregatorStats PriceAggregator::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

std::vector<VenueHealth> PriceAggregator::get_venue_health() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<VenueHealth> health;
    health.reserve(venues_.size());
    for (const auto& slot : venues_) {
        health.push_back(slot->health);
    }
    return health;
}

void PriceAggregator::drain_abandoned() {
    abandoned_.erase(
        std::remove_if(abandoned_.begin(), abandoned_.end(), [](std::future<FetchOutcome>& future) {
            if (future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
                return false;
            }
            try {
                future.get();
            } catch (const std::exception& e) {
                ARBGATE_LOG_DEBUG("Abandoned fetch failed: {}", e.what());
            }
            return true;
        }),
        abandoned_.end());
}

void PriceAggregator::record_success(VenueSlot& slot, std::chrono::milliseconds latency) {
    slot.health.fetches++;
    slot.health.successes++;
    slot.health.consecutive_failures = 0;
    slot.health.last_latency = latency;
    stats_.total_fetches++;
    stats_.successful_fetches++;
}

void PriceAggregator::record_failure(VenueSlot& slot, const std::string& error) {
    slot.health.fetches++;
    slot.health.consecutive_failures++;
    slot.health.last_error = error;
    stats_.total_fetches++;
}

bool PriceAggregator::is_registered(const VenueSlot* slot) const {
    return std::any_of(venues_.begin(), venues_.end(),
                       [slot](const auto& v) { return v.get() == slot; });
}

std::vector<PriceQuote> PriceAggregator::ordered_cache_snapshot(Timestamp now) const {
    std::vector<PriceQuote> ordered;
    for (const auto& venue : venues()) {
        auto quotes = cache_.get(venue, now);
        ordered.insert(ordered.end(), quotes.begin(), quotes.end());
    }
    return ordered;
}

} // namespace arbgate
