#pragma once

#include <mutex>
#include "result.hpp"

namespace arbgate {

// Tracks total and reserved capital. Invariant, at every observable point:
// 0 <= reserved <= total.
class CapitalLedger {
public:
    struct Snapshot {
        double total = 0.0;
        double reserved = 0.0;
        double available() const { return total - reserved; }
    };

    explicit CapitalLedger(double total_capital);

    CapitalLedger(const CapitalLedger&) = delete;
    CapitalLedger& operator=(const CapitalLedger&) = delete;

    // Fails fast, never blocks. On success returns the reserved total.
    Result<double> reserve(double amount);
    void release(double amount);

    // Refused if the new total would drop below what is reserved.
    Result<double> set_total_capital(double total_capital);

    // Realized profit or loss of a finished trade.
    void apply_pnl(double pnl);

    double total_capital() const;
    double reserved_capital() const;
    double available_capital() const;
    bool can_reserve(double amount) const;
    Snapshot snapshot() const;

private:
    mutable std::mutex mutex_;
    double total_;
    double reserved_;
};

// Holds a reservation for its lifetime and releases it on every exit path.
class CapitalReservation {
public:
    // Throws CapitalLedgerError if the ledger refuses the reservation.
    CapitalReservation(CapitalLedger& ledger, double amount);
    ~CapitalReservation();

    CapitalReservation(const CapitalReservation&) = delete;
    CapitalReservation& operator=(const CapitalReservation&) = delete;

    double amount() const { return amount_; }

private:
    CapitalLedger& ledger_;
    double amount_;
};

} // namespace arbgate
