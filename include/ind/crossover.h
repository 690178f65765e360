#pragma once

#include "ind/indicators.h"
#include "sig/signal_types.h"
#include "util/config.h"
#include "util/math.h"

#include <vector>

// +1 when `fast` moves from strictly below to strictly above `slow`
// between the two points, -1 for the inverse, 0 otherwise (including any
// undefined point).
int cross_direction(Value fast_prev,
                    Value slow_prev,
                    Value fast_last,
                    Value slow_last) noexcept;

CrossType ma_cross(const Series& fast, const Series& slow) noexcept;
MacdCross macd_cross(const std::vector<double>& macd,
                     const std::vector<double>& signal) noexcept;

// Only the most recent transition is reported.
struct Crossover {
  CrossType cross_type = CrossType::None;
  MacdCross macd_cross = MacdCross::None;

  Crossover() = default;
  Crossover(CrossType ct, MacdCross mc) : cross_type{ct}, macd_cross{mc} {}
  Crossover(const Indicators& ind,
            const IndicatorsConfig& cfg = config.ind_config) noexcept;

  bool bullish() const {
    return cross_type == CrossType::GoldenCross ||
           macd_cross == MacdCross::Bullish;
  }
  bool bearish() const {
    return cross_type == CrossType::DeathCross ||
           macd_cross == MacdCross::Bearish;
  }
};
