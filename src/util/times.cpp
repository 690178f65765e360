#include "util/times.h"

#include <spdlog/spdlog.h>
#include <format>
#include <sstream>

using namespace std::chrono;

std::optional<Date> string_to_date(std::string_view str) {
  if (str.size() < 10) {
    spdlog::error("[time] invalid date string '{}'", str);
    return std::nullopt;
  }

  // "2024-01-31" and "2024-01-31 16:00:00" both name the same trading day
  std::istringstream in{std::string(str.substr(0, 10))};

  sys_days date;
  in >> parse("%F", date);
  if (in.fail()) {
    spdlog::error("[time] invalid date string '{}'", str);
    return std::nullopt;
  }

  return date;
}

std::string date_to_string(Date date) {
  return std::format("{:%F}", date);
}
