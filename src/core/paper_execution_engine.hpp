#pragma once

#include <atomic>
#include <cstdint>
#include "clock.hpp"
#include "execution_engine.hpp"
#include "../utils/config_types.hpp"

namespace arbgate {

// Settles both legs on paper at the quoted prices, shifted against the
// trade by adverse_slippage_rate. With fail_every_n > 0 every n-th call
// fails after the buy leg and reports it rolled back.
class PaperExecutionEngine : public ExecutionEngine {
public:
    PaperExecutionEngine(const FeeConfig& fees, const ExecutionConfig& config, Clock& clock);

    TradeRecord execute(const ExecutionRequest& request) override;

    uint64_t execution_count() const { return executions_; }

private:
    FeeConfig fees_;
    ExecutionConfig config_;
    Clock& clock_;
    std::atomic<uint64_t> executions_{0};
};

} // namespace arbgate
