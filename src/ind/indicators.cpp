#include "ind/indicators.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <numeric>

Series rolling_mean(const std::vector<double>& xs, int window) noexcept {
  Series out(xs.size());
  if (window <= 0)
    return out;

  auto w = static_cast<size_t>(window);
  for (size_t i = w - 1; i < xs.size(); i++) {
    auto first = xs.begin() + (i + 1 - w);
    out[i] = std::accumulate(first, first + w, 0.0) / window;
  }
  return out;
}

Series rolling_mean(const Series& xs, int window) noexcept {
  Series out(xs.size());
  if (window <= 0)
    return out;

  auto w = static_cast<size_t>(window);
  for (size_t i = w - 1; i < xs.size(); i++) {
    double sum = 0.0;
    bool complete = true;
    for (size_t j = i + 1 - w; j <= i; j++) {
      if (!xs[j]) {
        complete = false;
        break;
      }
      sum += *xs[j];
    }
    if (complete)
      out[i] = sum / window;
  }
  return out;
}

inline std::vector<double> closes(const PriceSeries& bars) {
  std::vector<double> xs;
  xs.reserve(bars.size());
  for (auto& bar : bars)
    xs.push_back(bar.close);
  return xs;
}

SMA::SMA(const PriceSeries& bars, int window) noexcept
    : values{rolling_mean(closes(bars), window)} {}

EMA::EMA(const PriceSeries& bars, int span) noexcept
    : EMA{closes(bars), span} {}

EMA::EMA(const std::vector<double>& xs, int span) noexcept
    : values(xs.size()) {
  if (xs.empty())
    return;

  auto alpha = 2.0 / (span + 1);
  values[0] = xs[0];
  for (size_t i = 1; i < xs.size(); i++)
    values[i] = (xs[i] - values[i - 1]) * alpha + values[i - 1];
}

double RSI::from_averages(double avg_gain, double avg_loss) noexcept {
  if (avg_loss == 0.0)
    return avg_gain == 0.0 ? 50.0 : 100.0;  // flat window, or gains only

  double rs = avg_gain / avg_loss;
  return std::clamp(100.0 - (100.0 / (1.0 + rs)), 0.0, 100.0);
}

RSI::RSI(const PriceSeries& bars, int period) noexcept
    : values(bars.size()) {
  if (period <= 0 || bars.size() < size_t(period + 1))
    return;

  // gains[0]/losses[0] stay unused: the first bar has no delta
  std::vector<double> gains(bars.size(), 0.0), losses(bars.size(), 0.0);
  for (size_t i = 1; i < bars.size(); i++) {
    double change = bars[i].price() - bars[i - 1].price();
    gains[i] = change > 0 ? change : 0.0;
    losses[i] = change < 0 ? -change : 0.0;
  }

  for (size_t i = period; i < bars.size(); i++) {
    auto from = i + 1 - period;
    double avg_gain =
        std::accumulate(gains.begin() + from, gains.begin() + i + 1, 0.0) /
        period;
    double avg_loss =
        std::accumulate(losses.begin() + from, losses.begin() + i + 1, 0.0) /
        period;
    values[i] = from_averages(avg_gain, avg_loss);
  }
}

MACD::MACD(const PriceSeries& bars, int fast, int slow, int signal) noexcept
    : macd_line{std::vector<double>(bars.size())},
      fast_ema{bars, fast},
      slow_ema{bars, slow}  //
{
  size_t n = bars.size();
  for (size_t i = 0; i < n; ++i)
    macd_line[i] = fast_ema.values[i] - slow_ema.values[i];

  signal_ema = EMA(macd_line, signal);
  auto& signal_line = signal_ema.values;
  for (size_t i = 0; i < n; ++i)
    histogram.push_back(macd_line[i] - signal_line[i]);
}

Stochastic::Stochastic(const PriceSeries& bars,
                       int k_period,
                       int d_period) noexcept
    : k(bars.size()) {
  if (k_period > 0) {
    auto w = static_cast<size_t>(k_period);
    for (size_t i = w - 1; i < bars.size(); i++) {
      auto first = bars.begin() + (i + 1 - w);
      auto last = bars.begin() + i + 1;

      double low14 = std::min_element(first, last, [](auto& a, auto& b) {
                       return a.low < b.low;
                     })->low;
      double high14 = std::max_element(first, last, [](auto& a, auto& b) {
                        return a.high < b.high;
                      })->high;

      if (high14 == low14)
        continue;  // flat range, %K undefined

      k[i] = 100.0 * (bars[i].close - low14) / (high14 - low14);
    }
  }

  d = rolling_mean(k, d_period);
}

Indicators::Indicators(PriceSeries&& bars, const IndicatorsConfig& cfg) noexcept
    : _bars{std::move(bars)},
      _sma_short{_bars, cfg.sma_short},
      _sma_long{_bars, cfg.sma_long},
      _rsi{_bars, cfg.rsi_period},
      _macd{_bars, cfg.macd_fast, cfg.macd_slow, cfg.macd_signal},
      _stoch{_bars, cfg.stoch_k, cfg.stoch_d}  //
{
  if (_bars.size() < size_t(cfg.sma_long))
    spdlog::debug("[ind] {} bars, sma{} never defined", _bars.size(),
                  cfg.sma_long);
}
