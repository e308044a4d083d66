#pragma once

#include <string>
#include <vector>
#include "types.hpp"
#include "../utils/config_types.hpp"

namespace arbgate {

enum class Viability {
    VIABLE,
    NOT_PROFITABLE,
    BELOW_MIN_PROFIT,
    LOW_CONFIDENCE
};

std::string to_string(Viability viability);

// Turns a raw spread into a fully-costed opportunity. Pure and
// deterministic: no I/O, no clock, no randomness.
class OpportunityEvaluator {
public:
    static constexpr double kMaxConfidence = 99.9;

    // Throws ValidationError if the spread's buy price is not positive.
    static Opportunity evaluate(const Spread& spread, const FeeConfig& config);

    // First failing gate, in order: profit > 0, profit % >= threshold,
    // confidence >= minimum.
    static Viability check_viability(const Opportunity& opportunity, const FeeConfig& config);
    static bool is_viable(const Opportunity& opportunity, const FeeConfig& config);

    static double confidence_score(double net_profit, double net_profit_percent,
                                   double min_profit_threshold);

    // Viable opportunities only, in spread order.
    static std::vector<Opportunity> evaluate_batch(const std::vector<Spread>& spreads,
                                                   const FeeConfig& config);

    static std::string make_id(const Spread& spread);
};

} // namespace arbgate
