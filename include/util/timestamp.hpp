#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace nb::util {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// ISO 8601 UTC with microsecond precision, e.g. 2025-03-01T09:30:00.000042Z
inline std::string timestampToString(const Timestamp ts) {
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(ts.time_since_epoch());
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(micros);
    auto frac = micros - secs;
    if (frac.count() < 0) {
        secs -= std::chrono::seconds(1);
        frac += std::chrono::seconds(1);
    }

    const std::time_t tt = secs.count();
    std::tm tm{};
    gmtime_r(&tt, &tm);

    char fracBuf[8];
    std::snprintf(fracBuf, sizeof(fracBuf), "%06lld", static_cast<long long>(frac.count()));

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << fracBuf << 'Z';
    return oss.str();
}

} // namespace nb::util
