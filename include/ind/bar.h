#pragma once

#include "util/times.h"

#include <cstdint>
#include <string>
#include <vector>

struct Bar {
  Date date;
  double open = 0.0;
  double high = 0.0;
  double low = 0.0;
  double close = 0.0;
  std::int64_t volume = 0;

  std::string day() const { return date_to_string(date); }
  double price() const { return close; }
};

// Chronological, one bar per trading day, dates strictly increasing.
using PriceSeries = std::vector<Bar>;
