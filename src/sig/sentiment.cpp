#include "sig/sentiment.h"

#include <spdlog/spdlog.h>
#include <cmath>

inline std::vector<double> polarities_of(const std::vector<Headline>& hs) {
  std::vector<double> ps;
  ps.reserve(hs.size());
  for (auto& h : hs)
    ps.push_back(h.polarity);
  return ps;
}

Sentiment::Sentiment(const std::vector<double>& polarities,
                     const SignalConfig& cfg) noexcept {
  double total = 0.0;
  for (auto p : polarities) {
    if (!std::isfinite(p)) {
      spdlog::warn("[sent] skipping non-finite polarity");
      continue;
    }
    total += p;
    n_headlines++;
  }

  if (n_headlines == 0)
    return;

  average = total / n_headlines;

  if (*average > cfg.sentiment_positive)
    label = SentimentLabel::Positive;
  else if (*average < cfg.sentiment_negative)
    label = SentimentLabel::Negative;
  else
    label = SentimentLabel::Neutral;

  spdlog::debug("[sent] {} headlines, average {:.3f}", n_headlines, *average);
}

Sentiment::Sentiment(const std::vector<Headline>& headlines,
                     const SignalConfig& cfg) noexcept
    : Sentiment{polarities_of(headlines), cfg} {}
