#include "ind/price_movement.h"

std::optional<PriceMovement> price_movement(const PriceSeries& bars,
                                            const SignalConfig& cfg) noexcept {
  if (bars.empty())
    return std::nullopt;

  PriceMovement pm;
  pm.from = bars.front().date;
  pm.to = bars.back().date;
  pm.start_price = bars.front().price();
  pm.end_price = bars.back().price();

  auto change = safe_div(pm.end_price - pm.start_price, pm.start_price);
  pm.change_pct = scaled(change, 100.0);
  pm.significant_growth =
      pm.change_pct && *pm.change_pct > cfg.significant_growth_pct;

  return pm;
}
