#include "event_bus.hpp"
#include "../utils/logger.hpp"
#include <algorithm>
#include <exception>

namespace arbgate {

void EventBus::subscribe(EventSink* sink) {
    if (sink == nullptr || sink == this) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(sinks_.begin(), sinks_.end(), sink) == sinks_.end()) {
        sinks_.push_back(sink);
    }
}

void EventBus::unsubscribe(EventSink* sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_.size();
}

void EventBus::push_event(const Event& event) {
    // Copy so a sink may (un)subscribe or stop the pipeline while handling.
    std::vector<EventSink*> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks = sinks_;
    }

    for (auto* sink : sinks) {
        try {
            sink->push_event(event);
        } catch (const std::exception& e) {
            ARBGATE_LOG_ERROR("Event sink failed on '{}': {}", event_name(event), e.what());
        }
    }
}

} // namespace arbgate
