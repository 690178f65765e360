#pragma once

#include "sig/signal_types.h"
#include "util/config.h"
#include "util/math.h"

#include <string>
#include <vector>

// A headline with its polarity in [-1, 1], scored upstream.
struct Headline {
  std::string title;
  std::string url;
  double polarity = 0.0;
};

struct Sentiment {
  Value average;  // empty when there were no headlines
  SentimentLabel label = SentimentLabel::NoHeadlines;
  size_t n_headlines = 0;

  Sentiment() = default;
  Sentiment(const std::vector<double>& polarities,
            const SignalConfig& cfg = config.sig_config) noexcept;
  Sentiment(const std::vector<Headline>& headlines,
            const SignalConfig& cfg = config.sig_config) noexcept;

  bool has_headlines() const { return average.has_value(); }
};
