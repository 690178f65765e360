#pragma once

#include "ind/bar.h"
#include "util/config.h"
#include "util/math.h"

#include <optional>

struct PriceMovement {
  Date from;
  Date to;
  double start_price = 0.0;
  double end_price = 0.0;
  Value change_pct;
  bool significant_growth = false;
};

std::optional<PriceMovement> price_movement(
    const PriceSeries& bars,
    const SignalConfig& cfg = config.sig_config) noexcept;
