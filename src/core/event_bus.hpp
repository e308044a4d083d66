#pragma once

#include <mutex>
#include <vector>
#include "event_sink.hpp"

namespace arbgate {

// Delivers each event to every subscribed sink, in subscription order, on
// the publishing thread. Sinks are not owned and must outlive the bus.
class EventBus : public EventSink {
public:
    void subscribe(EventSink* sink);
    void unsubscribe(EventSink* sink);
    size_t subscriber_count() const;

    void push_event(const Event& event) override;

private:
    mutable std::mutex mutex_;
    std::vector<EventSink*> sinks_;
};

} // namespace arbgate
