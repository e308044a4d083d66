#include "clock.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace arbgate {

Timestamp SystemClock::now() const {
    return std::chrono::system_clock::now();
}

std::string format_date(Timestamp time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);

    std::ostringstream out;
    out << std::put_time(&tm_utc, "%Y-%m-%d");
    return out.str();
}

} // namespace arbgate
