#include "toolroute/core/types.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace toolroute::core {

std::string format_timestamp(TimePoint tp) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();

    std::time_t t = Clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

}  // namespace toolroute::core
