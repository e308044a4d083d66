#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include "event_sink.hpp"
#include "../utils/config_types.hpp"

namespace arbgate {

// Emergency stop. Listens for safety-limit events and fires its shutdown
// callback at most once until reset().
class KillSwitch : public EventSink {
public:
    using ShutdownCallback = std::function<void(const std::string& reason)>;

    KillSwitch(const KillSwitchConfig& config, ShutdownCallback callback);

    void push_event(const Event& event) override;

    // Manual trigger; ignored if already triggered.
    void trigger(const std::string& reason);
    void reset();

    bool is_triggered() const { return triggered_; }
    std::string reason() const;
    int safety_event_count() const { return safety_events_; }

private:
    KillSwitchConfig config_;
    ShutdownCallback callback_;
    std::atomic<bool> triggered_{false};
    std::atomic<int> safety_events_{0};
    mutable std::mutex mutex_;
    std::string reason_;
};

} // namespace arbgate
