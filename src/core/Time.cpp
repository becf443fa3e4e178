#include "Time.hpp"

#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace axiom {

Timestamp now() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now());
}

std::string to_iso8601(Timestamp t) {
    using namespace std::chrono;

    const auto since_epoch = duration_cast<microseconds>(t.time_since_epoch());
    auto secs = duration_cast<seconds>(since_epoch);
    auto micros = since_epoch - duration_cast<microseconds>(secs);
    if (micros.count() < 0) {
        secs -= seconds(1);
        micros += seconds(1);
    }

    const std::time_t tt = static_cast<std::time_t>(secs.count());
    std::tm tm{};
    gmtime_r(&tt, &tm);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ",
        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
        tm.tm_hour, tm.tm_min, tm.tm_sec,
        static_cast<long long>(micros.count()));
    return buf;
}

Timestamp from_iso8601(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
            &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        throw std::invalid_argument("Malformed timestamp: " + text);
    }

    long long micros = 0;
    std::size_t pos = static_cast<std::size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) {
            throw std::invalid_argument("Malformed timestamp fraction: " + text);
        }
        for (; digits < 6; ++digits) micros *= 10;
    }
    if (pos < text.size() && text[pos] == 'Z') ++pos;
    if (pos != text.size()) {
        throw std::invalid_argument("Unexpected trailing characters in timestamp: " + text);
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    const std::time_t tt = timegm(&tm);

    return Timestamp(std::chrono::seconds(tt)) + std::chrono::microseconds(micros);
}

double seconds_between(Timestamp start, Timestamp end) {
    return std::chrono::duration<double>(end - start).count();
}

} // namespace axiom
