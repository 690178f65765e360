#pragma once

#include "ind/bar.h"
#include "util/config.h"
#include "util/math.h"

#include <vector>

// Rolling mean over `window` consecutive entries, undefined until the
// window is full or while it holds an undefined entry.
Series rolling_mean(const std::vector<double>& xs, int window) noexcept;
Series rolling_mean(const Series& xs, int window) noexcept;

struct SMA {
  Series values;

  SMA() noexcept = default;
  SMA(const PriceSeries& bars, int window) noexcept;
};

// Seeded with the first value, no SMA warm-up.
struct EMA {
  std::vector<double> values;

  EMA() noexcept = default;
  EMA(const PriceSeries& bars, int span) noexcept;
  EMA(const std::vector<double>& xs, int span) noexcept;
};

// Simple rolling means of gains and losses, not Wilder smoothing.
struct RSI {
  Series values;

  RSI() noexcept = default;
  RSI(const PriceSeries& bars, int period = 14) noexcept;

  static double from_averages(double avg_gain, double avg_loss) noexcept;
};

struct MACD {
  std::vector<double> macd_line;
  EMA signal_ema;
  std::vector<double> histogram;

 private:
  EMA fast_ema;
  EMA slow_ema;

 public:
  MACD() noexcept = default;
  MACD(const PriceSeries& bars,
       int fast = 12,
       int slow = 26,
       int signal = 9) noexcept;
};

struct Stochastic {
  Series k;
  Series d;

  Stochastic() noexcept = default;
  Stochastic(const PriceSeries& bars,
             int k_period = 14,
             int d_period = 3) noexcept;
};

struct Indicators {
 private:
  PriceSeries _bars;

  SMA _sma_short, _sma_long;
  RSI _rsi;
  MACD _macd;
  Stochastic _stoch;

  size_t sanitize(int idx) const {
    return idx < 0 ? _bars.size() + idx : idx;
  }

 public:
  Indicators(PriceSeries&& bars,
             const IndicatorsConfig& cfg = config.ind_config) noexcept;

  Indicators(const Indicators&) = delete;
  Indicators& operator=(const Indicators&) = delete;

  Indicators(Indicators&&) = default;
  Indicators& operator=(Indicators&&) = default;

  auto size() const { return _bars.size(); }
  bool empty() const { return _bars.empty(); }
  const PriceSeries& bars() const { return _bars; }

  Date date(int idx) const { return _bars[sanitize(idx)].date; }
  double close(int idx) const { return _bars[sanitize(idx)].close; }

  Value sma_short(int idx) const { return _sma_short.values[sanitize(idx)]; }
  Value sma_long(int idx) const { return _sma_long.values[sanitize(idx)]; }
  Value rsi(int idx) const { return _rsi.values[sanitize(idx)]; }

  double macd(int idx) const { return _macd.macd_line[sanitize(idx)]; }
  double macd_signal(int idx) const {
    return _macd.signal_ema.values[sanitize(idx)];
  }
  double hist(int idx) const { return _macd.histogram[sanitize(idx)]; }

  Value stoch_k(int idx) const { return _stoch.k[sanitize(idx)]; }
  Value stoch_d(int idx) const { return _stoch.d[sanitize(idx)]; }

  const Series& sma_short_series() const { return _sma_short.values; }
  const Series& sma_long_series() const { return _sma_long.values; }
  const Series& rsi_series() const { return _rsi.values; }
  const std::vector<double>& macd_series() const { return _macd.macd_line; }
  const std::vector<double>& signal_series() const {
    return _macd.signal_ema.values;
  }
  const Series& stoch_k_series() const { return _stoch.k; }
  const Series& stoch_d_series() const { return _stoch.d; }
};
