#pragma once

#include "event.hpp"

namespace arbgate {

class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void push_event(const Event& event) = 0;
};

} // namespace arbgate
