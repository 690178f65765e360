#include "ind/crossover.h"

#include <spdlog/spdlog.h>
#include <algorithm>

int cross_direction(Value fast_prev,
                    Value slow_prev,
                    Value fast_last,
                    Value slow_last) noexcept {
  if (!fast_prev || !slow_prev || !fast_last || !slow_last)
    return 0;

  if (*fast_prev < *slow_prev && *fast_last > *slow_last)
    return 1;
  if (*fast_prev > *slow_prev && *fast_last < *slow_last)
    return -1;
  return 0;
}

inline CrossType to_cross_type(int dir) {
  return dir > 0 ? CrossType::GoldenCross
                 : (dir < 0 ? CrossType::DeathCross : CrossType::None);
}

inline MacdCross to_macd_cross(int dir) {
  return dir > 0 ? MacdCross::Bullish
                 : (dir < 0 ? MacdCross::Bearish : MacdCross::None);
}

CrossType ma_cross(const Series& fast, const Series& slow) noexcept {
  auto n = std::min(fast.size(), slow.size());
  if (n < 2)
    return CrossType::None;

  auto dir = cross_direction(fast[n - 2], slow[n - 2], fast[n - 1],
                             slow[n - 1]);
  return to_cross_type(dir);
}

MacdCross macd_cross(const std::vector<double>& macd,
                     const std::vector<double>& signal) noexcept {
  auto n = std::min(macd.size(), signal.size());
  if (n < 2)
    return MacdCross::None;

  auto dir = cross_direction(macd[n - 2], signal[n - 2], macd[n - 1],
                             signal[n - 1]);
  return to_macd_cross(dir);
}

Crossover::Crossover(const Indicators& ind,
                     const IndicatorsConfig& cfg) noexcept {
  if (ind.size() < 2)
    return;

  // golden/death crosses need a full long-SMA history
  if (ind.size() >= size_t(cfg.sma_long))
    cross_type = ma_cross(ind.sma_short_series(), ind.sma_long_series());
  else
    spdlog::debug("[ind] {} bars, no sma{} crossover check", ind.size(),
                  cfg.sma_long);

  macd_cross = ::macd_cross(ind.macd_series(), ind.signal_series());
}
