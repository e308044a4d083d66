#include "capital_ledger.hpp"
#include "exceptions.hpp"
#include "../utils/logger.hpp"
#include <cmath>
#include <string>

namespace arbgate {

CapitalLedger::CapitalLedger(double total_capital)
    : total_(total_capital), reserved_(0.0) {
    if (!std::isfinite(total_capital) || total_capital < 0.0) {
        throw ValidationError("total capital must be a non-negative number");
    }
}

Result<double> CapitalLedger::reserve(double amount) {
    if (!std::isfinite(amount) || amount <= 0.0) {
        return Result<double>::error("reservation amount must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (total_ - reserved_ < amount) {
        return Result<double>::error("insufficient capital: requested " + std::to_string(amount) +
                                     ", available " + std::to_string(total_ - reserved_));
    }
    reserved_ += amount;
    return Result<double>::success(reserved_);
}

void CapitalLedger::release(double amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (amount > reserved_) {
        ARBGATE_LOG_ERROR("Release of {:.2f} exceeds reserved {:.2f}; clamping to zero", amount, reserved_);
        reserved_ = 0.0;
        return;
    }
    reserved_ -= amount;
}

Result<double> CapitalLedger::set_total_capital(double total_capital) {
    if (!std::isfinite(total_capital) || total_capital < 0.0) {
        return Result<double>::error("total capital must be a non-negative number");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (total_capital < reserved_) {
        return Result<double>::error("total capital " + std::to_string(total_capital) +
                                     " is below reserved " + std::to_string(reserved_));
    }
    total_ = total_capital;
    return Result<double>::success(total_);
}

void CapitalLedger::apply_pnl(double pnl) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_ += pnl;
    if (total_ < reserved_) {
        ARBGATE_LOG_WARN("Loss of {:.2f} drove capital below reserved {:.2f}; clamping", pnl, reserved_);
        total_ = reserved_;
    }
}

double CapitalLedger::total_capital() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

double CapitalLedger::reserved_capital() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserved_;
}

double CapitalLedger::available_capital() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_ - reserved_;
}

bool CapitalLedger::can_reserve(double amount) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_ - reserved_ >= amount;
}

CapitalLedger::Snapshot CapitalLedger::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Snapshot{total_, reserved_};
}

CapitalReservation::CapitalReservation(CapitalLedger& ledger, double amount)
    : ledger_(ledger), amount_(amount) {
    auto result = ledger_.reserve(amount);
    if (result.is_error()) {
        throw CapitalLedgerError(result.error());
    }
}

CapitalReservation::~CapitalReservation() {
    ledger_.release(amount_);
}

} // namespace arbgate
