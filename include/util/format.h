#pragma once

#include "util/math.h"

#include <format>
#include <string>

template <typename T>
std::string to_str(const T& t);

inline std::string join(auto start, auto end, std::string sep = ", ") {
  std::string result;

  for (auto it = start; it != end; it++) {
    result += to_str(*it);

    auto _end = end;
    if (it != --_end)
      result += sep;
  }

  return result;
}

// Empty values render as `none`
inline constexpr const char* NA = "n/a";

std::string fmt_currency(Value v, const char* none = NA);
std::string fmt_percent(Value v, const char* none = NA);
std::string fmt_float(Value v, const char* none = NA);

std::string group_thousands(long long n);
