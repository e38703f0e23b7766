#include "utils/time_format.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace time_format {

static std::tm local_calendar_time(std::time_t seconds) {
    std::tm calendar_time{};
    localtime_r(&seconds, &calendar_time);
    return calendar_time;
}

std::string to_iso8601_local(std::chrono::system_clock::time_point time_point) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(time_point);
    long microseconds = static_cast<long>(
        std::chrono::duration_cast<std::chrono::microseconds>(time_point.time_since_epoch()).count() % 1000000);
    if (microseconds < 0) {
        microseconds += 1000000;
    }

    std::tm calendar_time = local_calendar_time(seconds);

    std::ostringstream stream;
    stream << std::put_time(&calendar_time, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(6) << std::setfill('0') << microseconds;
    return stream.str();
}

std::string now_iso8601() {
    return to_iso8601_local(std::chrono::system_clock::now());
}

std::string now_human_readable() {
    std::tm calendar_time = local_calendar_time(std::time(nullptr));
    std::ostringstream stream;
    stream << std::put_time(&calendar_time, "%Y-%m-%d %H:%M:%S");
    return stream.str();
}

} // namespace time_format
