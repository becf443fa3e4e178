#pragma once

#include <chrono>
#include <string>

namespace axiom {

// Wall-clock timestamp, kept at microsecond precision so that it survives a
// round trip through its ISO-8601 text form unchanged.
using Timestamp = std::chrono::system_clock::time_point;

// Current time truncated to microseconds
Timestamp now();

// Format as UTC ISO-8601 with microseconds: 2026-01-02T03:04:05.123456Z
std::string to_iso8601(Timestamp t);

// Parse the format produced by to_iso8601. The fractional part and the
// trailing 'Z' are optional. Throws std::invalid_argument on malformed input.
Timestamp from_iso8601(const std::string& text);

// Seconds elapsed from start to end (negative if end precedes start)
double seconds_between(Timestamp start, Timestamp end);

} // namespace axiom
