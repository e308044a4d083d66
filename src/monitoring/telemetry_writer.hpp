#pragma once

#include <cstdint>
#include <deque>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../core/clock.hpp"
#include "../core/event_sink.hpp"
#include "../utils/config_types.hpp"

namespace arbgate {

// Appends every pipeline event as one JSON object per line and keeps the
// most recent entries in memory.
class TelemetryWriter : public EventSink {
public:
    TelemetryWriter(const TelemetryConfig& config, Clock& clock);
    ~TelemetryWriter();

    TelemetryWriter(const TelemetryWriter&) = delete;
    TelemetryWriter& operator=(const TelemetryWriter&) = delete;

    void push_event(const Event& event) override;

    std::vector<nlohmann::json> recent(size_t count) const;
    size_t size() const;
    uint64_t total_events() const;
    bool is_file_open() const;
    void flush();

private:
    TelemetryConfig config_;
    Clock& clock_;
    mutable std::mutex mutex_;
    std::ofstream file_;
    std::deque<nlohmann::json> buffer_;
    uint64_t total_events_ = 0;
};

} // namespace arbgate
