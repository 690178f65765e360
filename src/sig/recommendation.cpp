#include "sig/recommendation.h"
#include "util/format.h"

#include <spdlog/spdlog.h>

TechnicalSignal technical_signal(const Crossover& cross) noexcept {
  if (cross.bullish())
    return TechnicalSignal::Buy;
  if (cross.bearish())
    return TechnicalSignal::Sell;
  return TechnicalSignal::Hold;
}

Overall overall_rating(TechnicalSignal technical,
                       const Sentiment& sentiment,
                       const SignalConfig& cfg) noexcept {
  if (technical == TechnicalSignal::Buy && sentiment.average &&
      *sentiment.average > cfg.overall_sentiment_min)
    return Overall::Buy;
  return Overall::HoldWait;
}

Recommendation::Recommendation(const Crossover& cross,
                               const Sentiment& sentiment,
                               const QuoteSnapshot& quote,
                               const SignalConfig& cfg) noexcept
    : technical{technical_signal(cross)},
      overall{overall_rating(technical, sentiment, cfg)}  //
{
  switch (technical) {
    case TechnicalSignal::Buy:
      notes.push_back("Bullish technical signals detected.");
      break;
    case TechnicalSignal::Sell:
      notes.push_back("Bearish technical signals detected.");
      break;
    default:
      notes.push_back("No strong technical signals detected.");
  }

  if (quote.trailing_pe && *quote.trailing_pe < cfg.undervalued_pe)
    fundamental_msgs.push_back(
        "PE Ratio suggests the stock might be undervalued.");
  else
    fundamental_msgs.push_back("PE Ratio is average or high.");

  bool positive =
      sentiment.average && *sentiment.average > cfg.overall_sentiment_min;
  sentiment_msg = positive ? "News sentiment is positive."
                           : "News sentiment is neutral/negative.";

  suggest_calls = technical == TechnicalSignal::Buy && sentiment.average &&
                  *sentiment.average > cfg.option_sentiment_min;

  spdlog::debug("[sig] technical {}, overall {}, calls {}", to_str(technical),
                to_str(overall), suggest_calls);
}
