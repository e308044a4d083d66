#include "opportunity_evaluator.hpp"
#include "exceptions.hpp"
#include <algorithm>

namespace arbgate {

std::string to_string(Viability viability) {
    switch (viability) {
        case Viability::VIABLE: return "viable";
        case Viability::NOT_PROFITABLE: return "not-profitable";
        case Viability::BELOW_MIN_PROFIT: return "below-min-profit";
        case Viability::LOW_CONFIDENCE: return "low-confidence";
    }
    return "unknown";
}

std::string OpportunityEvaluator::make_id(const Spread& spread) {
    return "ARB-" + spread.symbol + "-" + spread.low_venue + "-" + spread.high_venue + "-" +
           std::to_string(to_epoch_ms(spread.observed_at));
}

Opportunity OpportunityEvaluator::evaluate(const Spread& spread, const FeeConfig& config) {
    if (spread.low_price <= 0.0) {
        throw ValidationError("spread for " + spread.symbol + " has non-positive buy price");
    }

    Opportunity opp;
    opp.id = make_id(spread);
    opp.symbol = spread.symbol;
    opp.buy_venue = spread.low_venue;
    opp.sell_venue = spread.high_venue;
    opp.buy_price = spread.low_price;
    opp.sell_price = spread.high_price;
    opp.gross_spread_percent = spread.spread_percent;
    opp.created_at = spread.observed_at;

    opp.quantity = config.capital_allocation / opp.buy_price;

    opp.gross_cost = opp.buy_price * opp.quantity;
    opp.gross_revenue = opp.sell_price * opp.quantity;
    opp.gross_profit = opp.gross_revenue - opp.gross_cost;

    opp.buy_fee = opp.gross_cost * config.taker_fee_rate;
    opp.sell_fee = opp.gross_revenue * config.taker_fee_rate;
    const double network_fee = config.network_fee;

    // Worst-case shift on both legs: buy higher, sell lower.
    opp.slippage_estimate = config.max_slippage_rate * (opp.gross_cost + opp.gross_revenue);

    opp.fees.maker = 0.0;
    opp.fees.taker = opp.buy_fee + opp.sell_fee;
    opp.fees.network = network_fee;

    opp.net_profit = opp.gross_profit - opp.buy_fee - opp.sell_fee - network_fee - opp.slippage_estimate;
    opp.net_profit_percent = opp.net_profit / opp.gross_cost * 100.0;

    opp.confidence_score = confidence_score(opp.net_profit, opp.net_profit_percent,
                                            config.min_profit_threshold);
    return opp;
}

double OpportunityEvaluator::confidence_score(double net_profit, double net_profit_percent,
                                              double min_profit_threshold) {
    if (!(net_profit > 0.0)) {
        return 0.0;
    }

    double confidence = 90.0;
    if (net_profit_percent > min_profit_threshold * 2.0) {
        confidence += 5.0;
    }
    if (net_profit_percent > min_profit_threshold * 4.0) {
        confidence += 4.0;
    }
    if (net_profit_percent < 0.2) {
        confidence -= 20.0;
    }

    return std::clamp(confidence, 0.0, kMaxConfidence);
}

Viability OpportunityEvaluator::check_viability(const Opportunity& opportunity, const FeeConfig& config) {
    if (!(opportunity.net_profit > 0.0)) {
        return Viability::NOT_PROFITABLE;
    }
    if (!(opportunity.net_profit_percent >= config.min_profit_threshold)) {
        return Viability::BELOW_MIN_PROFIT;
    }
    if (!(opportunity.confidence_score >= config.min_confidence)) {
        return Viability::LOW_CONFIDENCE;
    }
    return Viability::VIABLE;
}

bool OpportunityEvaluator::is_viable(const Opportunity& opportunity, const FeeConfig& config) {
    return check_viability(opportunity, config) == Viability::VIABLE;
}

std::vector<Opportunity> OpportunityEvaluator::evaluate_batch(const std::vector<Spread>& spreads,
                                                              const FeeConfig& config) {
    std::vector<Opportunity> viable;
    for (const auto& spread : spreads) {
        if (spread.low_price <= 0.0) {
            continue;
        }
        Opportunity opp = evaluate(spread, config);
        if (is_viable(opp, config)) {
            viable.push_back(std::move(opp));
        }
    }
    return viable;
}

} // namespace arbgate
