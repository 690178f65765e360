#pragma once

#include "fund/financials.h"
#include "ind/crossover.h"
#include "sig/sentiment.h"
#include "sig/signal_types.h"
#include "util/config.h"

#include <string>
#include <vector>

// Bullish conditions are checked first, so GoldenCross with a bearish
// MACD crossover is still a BUY.
TechnicalSignal technical_signal(const Crossover& cross) noexcept;

Overall overall_rating(TechnicalSignal technical,
                       const Sentiment& sentiment,
                       const SignalConfig& cfg = config.sig_config) noexcept;

struct Recommendation {
  TechnicalSignal technical = TechnicalSignal::Hold;
  Overall overall = Overall::HoldWait;

  std::vector<std::string> notes;
  std::vector<std::string> fundamental_msgs;
  std::string sentiment_msg;

  bool suggest_calls = false;

  Recommendation() = default;
  Recommendation(const Crossover& cross,
                 const Sentiment& sentiment,
                 const QuoteSnapshot& quote,
                 const SignalConfig& cfg = config.sig_config) noexcept;
};
