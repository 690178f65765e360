#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

using SysClock = std::chrono::system_clock;

// Trading days are calendar dates, no time of day.
using Date = std::chrono::sys_days;

using days = std::chrono::days;

std::optional<Date> string_to_date(std::string_view str);
std::string date_to_string(Date date);

inline int year_of(Date date) {
  return static_cast<int>(std::chrono::year_month_day{date}.year());
}

struct Timer {
  TimePoint start;
  Timer() : start{Clock::now()} {}
  double diff_ms() const {
    return std::chrono::duration<double, std::milli>(Clock::now() - start)
        .count();
  }
};
