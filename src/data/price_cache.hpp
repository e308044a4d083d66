#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "../core/types.hpp"

namespace arbgate {

// Last successful quotes per venue. Entries older than the TTL are treated
// as absent.
class PriceCache {
public:
    explicit PriceCache(std::chrono::milliseconds ttl = std::chrono::milliseconds(5000));

    void update(const std::string& venue, std::vector<PriceQuote> quotes, Timestamp now);
    std::vector<PriceQuote> get(const std::string& venue, Timestamp now) const;
    std::map<std::string, std::vector<PriceQuote>> snapshot(Timestamp now) const;

    size_t evict_expired(Timestamp now);
    void remove(const std::string& venue);
    void clear();

    size_t venue_count() const;
    std::chrono::milliseconds ttl() const { return ttl_; }

private:
    struct Entry {
        std::vector<PriceQuote> quotes;
        Timestamp stored_at;
    };

    bool is_expired(const Entry& entry, Timestamp now) const {
        return now - entry.stored_at > ttl_;
    }

    std::chrono::milliseconds ttl_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
};

} // namespace arbgate
