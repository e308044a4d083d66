#include "volatility_risk_oracle.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>
#include "exceptions.hpp"
#include "../utils/logger.hpp"

namespace arbgate {

VolatilityRiskOracle::VolatilityRiskOracle(const RiskOracleConfig& config)
    : config_(config) {
}

void VolatilityRiskOracle::observe(const PriceQuote& quote) {
    if (!std::isfinite(quote.price) || quote.price <= 0.0) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& samples = history_[quote.symbol][quote.venue];
    samples.push_back(Sample{quote.observed_at, quote.price});
    while (samples.size() > config_.max_samples) {
        samples.pop_front();
    }
}

size_t VolatilityRiskOracle::sample_count(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = history_.find(symbol);
    if (it == history_.end()) {
        return 0;
    }

    size_t longest = 0;
    for (const auto& venue : it->second) {
        longest = std::max(longest, venue.second.size());
    }
    return longest;
}

size_t VolatilityRiskOracle::sample_count(const std::string& venue, const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = history_.find(symbol);
    if (it == history_.end()) {
        return 0;
    }
    auto series = it->second.find(venue);
    return series == it->second.end() ? 0 : series->second.size();
}

VolatilityRiskOracle::Assessment VolatilityRiskOracle::assess(const std::string& symbol,
                                                              double buy_price,
                                                              double sell_price,
                                                              std::chrono::milliseconds window) const {
    if (!(buy_price > 0.0) || !(sell_price > 0.0)) {
        throw RiskOracleError(fmt::format("invalid prices for {}: buy={} sell={}",
                                          symbol, buy_price, sell_price));
    }

    Assessment assessment;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = history_.find(symbol);
        if (it != history_.end()) {
            for (const auto& venue : it->second) {
                assessment.samples = std::max(assessment.samples, venue.second.size());
                assessment.sigma_per_ms = std::max(assessment.sigma_per_ms,
                                                   estimate_sigma_per_ms(venue.second));
            }
        }
    }

    const double horizon_ms = static_cast<double>(std::max<long long>(window.count(), 0));
    const double band = config_.band_sigmas * assessment.sigma_per_ms * std::sqrt(horizon_ms);
    assessment.worst_case_sell_price = sell_price * std::exp(-band);
    assessment.best_case_sell_price = sell_price * std::exp(band);
    assessment.potential_loss_percent =
        (sell_price - assessment.worst_case_sell_price) / sell_price * 100.0;
    assessment.worst_case_profit_percent =
        (assessment.worst_case_sell_price - buy_price) / buy_price * 100.0;
    return assessment;
}

RiskVerdict VolatilityRiskOracle::evaluate(const std::string& symbol,
                                           double buy_price,
                                           double sell_price,
                                           double expected_profit,
                                           std::chrono::milliseconds window) {
    const Assessment a = assess(symbol, buy_price, sell_price, window);

    RiskVerdict verdict;
    if (a.samples < config_.min_samples) {
        verdict.rationale = fmt::format("insufficient price history for {} ({} of {} samples)",
                                        symbol, a.samples, config_.min_samples);
    } else if (a.potential_loss_percent > config_.max_risk_percent) {
        verdict.rationale = fmt::format("potential loss {:.2f}% exceeds max risk {:.2f}%",
                                        a.potential_loss_percent, config_.max_risk_percent);
    } else if (a.worst_case_profit_percent < -config_.max_risk_percent) {
        verdict.rationale = fmt::format("worst case {:.2f}% is beyond max risk {:.2f}%",
                                        a.worst_case_profit_percent, config_.max_risk_percent);
    } else {
        verdict.proceed = true;
        verdict.rationale = fmt::format("risk {:.2f}% within limits, expected profit ${:.2f}",
                                        a.potential_loss_percent, expected_profit);
    }

    ARBGATE_LOG_DEBUG("Risk oracle {} {}: {}", symbol, verdict.proceed ? "approved" : "blocked",
                      verdict.rationale);
    return verdict;
}

double VolatilityRiskOracle::estimate_sigma_per_ms(const std::deque<Sample>& samples) const {
    if (samples.size() < 2) {
        return 0.0;
    }

    double sum = 0.0;
    double sum_sq = 0.0;
    size_t n = 0;
    for (size_t i = 1; i < samples.size(); ++i) {
        const double r = std::log(samples[i].price / samples[i - 1].price);
        sum += r;
        sum_sq += r * r;
        ++n;
    }

    const double mean = sum / n;
    const double variance = n > 1 ? std::max(0.0, (sum_sq - n * mean * mean) / (n - 1)) : 0.0;

    const auto span = std::chrono::duration_cast<std::chrono::milliseconds>(
        samples.back().at - samples.front().at).count();
    const double interval_ms = std::max(1.0, static_cast<double>(span) / n);

    return std::sqrt(variance / interval_ms);
}

} // namespace arbgate
