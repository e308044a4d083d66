#include "price_cache.hpp"

namespace arbgate {

PriceCache::PriceCache(std::chrono::milliseconds ttl) : ttl_(ttl) {}

void PriceCache::update(const std::string& venue, std::vector<PriceQuote> quotes, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[venue] = Entry{std::move(quotes), now};
}

std::vector<PriceQuote> PriceCache::get(const std::string& venue, Timestamp now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(venue);
    if (it == entries_.end() || is_expired(it->second, now)) {
        return {};
    }
    return it->second.quotes;
}

std::map<std::string, std::vector<PriceQuote>> PriceCache::snapshot(Timestamp now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::vector<PriceQuote>> result;
    for (const auto& [venue, entry] : entries_) {
        if (!is_expired(entry, now)) {
            result[venue] = entry.quotes;
        }
    }
    return result;
}

size_t PriceCache::evict_expired(Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t evicted = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (is_expired(it->second, now)) {
            it = entries_.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }
    return evicted;
}

void PriceCache::remove(const std::string& venue) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(venue);
}

void PriceCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t PriceCache::venue_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace arbgate
