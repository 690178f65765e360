#pragma once

#include <cstddef>
#include <string>

struct IndicatorsConfig {
  static constexpr const char* name = "ind_config";
  static constexpr bool debug = true;

  int sma_short = 50;
  int sma_long = 200;  // also the history needed for golden/death crosses

  int rsi_period = 14;

  int macd_fast = 12;
  int macd_slow = 26;
  int macd_signal = 9;

  int stoch_k = 14;
  int stoch_d = 3;
};

struct QualityConfig {
  static constexpr const char* name = "quality_config";
  static constexpr bool debug = true;

  size_t max_periods = 5;

  // A period passes only if every bound holds (strict comparisons)
  double min_net_income = 0.0;
  double min_roe = 15.0;
  double min_profit_margin = 10.0;
  double max_debt_to_equity = 0.5;
  double max_pe = 20.0;
  double max_pb = 3.0;
  double max_ps = 4.0;
  double max_pfcf = 20.0;

  double pass_ratio = 0.6;
};

struct SignalConfig {
  static constexpr const char* name = "sig_config";
  static constexpr bool debug = true;

  double sentiment_positive = 0.05;
  double sentiment_negative = -0.05;

  // overall BUY needs sentiment > overall_min, call options need > option_min
  double overall_sentiment_min = 0.0;
  double option_sentiment_min = 0.05;

  double undervalued_pe = 15.0;
  double significant_growth_pct = 20.0;
};

struct Config {
  bool debug_en = false;
  bool json_en = false;

  std::string symbol;
  std::string prices_path;
  std::string fundamentals_path;
  std::string headlines_path;
  std::string json_path;
  std::string config_dir = "private";

  IndicatorsConfig ind_config;
  QualityConfig quality_config;
  SignalConfig sig_config;

  Config() = default;

  bool read_args(int argc, char* argv[]);
  void update();
};

inline Config config;
