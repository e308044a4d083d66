#pragma once

#include "types.hpp"

namespace arbgate {

// Source of wall-clock time for every time-based rule (rate window,
// cache TTL, trade timestamps, daily stats).
class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override;
};

std::string format_date(Timestamp time);

} // namespace arbgate
