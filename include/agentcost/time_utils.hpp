#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <sstream>
#include <string>

namespace agentcost {

using TimePoint = std::chrono::system_clock::time_point;

// Injected wall clock; tests pass a fixed one
using Clock = std::function<TimePoint()>;

inline TimePoint system_now() {
    return std::chrono::system_clock::now();
}

inline int64_t to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline TimePoint from_epoch_ms(int64_t ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

inline TimePoint days_before(TimePoint tp, int days) {
    return tp - std::chrono::hours(24 * static_cast<int64_t>(days));
}

inline TimePoint days_after(TimePoint tp, int days) {
    return tp + std::chrono::hours(24 * static_cast<int64_t>(days));
}

inline std::tm to_utc_tm(TimePoint tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    return tm_utc;
}

// 2024-01-31T12:00:00.000Z
inline std::string to_iso8601(TimePoint tp) {
    std::tm tm_utc = to_utc_tm(tp);
    auto ms = to_epoch_ms(tp) % 1000;
    if (ms < 0) ms += 1000;
    std::stringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return ss.str();
}

// UTC calendar day, e.g. 2024-01-31
inline std::string utc_day_key(TimePoint tp) {
    std::tm tm_utc = to_utc_tm(tp);
    std::stringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%d");
    return ss.str();
}

} // namespace agentcost
