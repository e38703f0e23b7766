#ifndef TRMCPS_TIME_FORMAT_HPP
#define TRMCPS_TIME_FORMAT_HPP

// Timestamp formatting for tool output and the server status resource.

#include <chrono>
#include <string>

namespace time_format {

// Format a point in time as a local ISO-8601 timestamp with microseconds,
// e.g. "2025-01-31T14:05:09.123456".
std::string to_iso8601_local(std::chrono::system_clock::time_point time_point);

// Shorthand for to_iso8601_local(system_clock::now()).
std::string now_iso8601();

// Human-readable local time, e.g. "2025-01-31 14:05:09".
std::string now_human_readable();

} // namespace time_format

#endif // TRMCPS_TIME_FORMAT_HPP
