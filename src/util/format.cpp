#include "util/format.h"
#include "ind/bar.h"
#include "sig/signal_types.h"

#include <cmath>
#include <cstdlib>
#include <string>

template <>
std::string to_str(const Bar& bar) {
  return std::format("{} {:.2f} {:.2f} {:.2f} {:.2f} {}",  //
                     bar.day(), bar.open, bar.high, bar.low, bar.close,
                     bar.volume);
}

template <>
std::string to_str(const CrossType& ct) {
  switch (ct) {
    case CrossType::GoldenCross:
      return "Golden Cross";
    case CrossType::DeathCross:
      return "Death Cross";
    default:
      return "None";
  }
}

template <>
std::string to_str(const MacdCross& mc) {
  switch (mc) {
    case MacdCross::Bullish:
      return "Bullish Crossover";
    case MacdCross::Bearish:
      return "Bearish Crossover";
    default:
      return "None";
  }
}

template <>
std::string to_str(const TechnicalSignal& ts) {
  if (ts == TechnicalSignal::Buy)
    return "BUY";
  if (ts == TechnicalSignal::Sell)
    return "SELL";
  return "HOLD";
}

template <>
std::string to_str(const Overall& o) {
  return o == Overall::Buy ? "BUY" : "HOLD/WAIT";
}

template <>
std::string to_str(const SentimentLabel& label) {
  switch (label) {
    case SentimentLabel::Positive:
      return "Positive";
    case SentimentLabel::Neutral:
      return "Neutral";
    case SentimentLabel::Negative:
      return "Negative";
    default:
      return "No headlines";
  }
}

template <>
std::string to_str(const VerdictStatus& status) {
  if (status == VerdictStatus::Pass)
    return "pass";
  if (status == VerdictStatus::Fail)
    return "fail";
  return "insufficient data";
}

template <>
std::string to_str(const QualityCriterion& c) {
  switch (c) {
    case QualityCriterion::NetIncome:
      return "net income";
    case QualityCriterion::Roe:
      return "ROE";
    case QualityCriterion::ProfitMargin:
      return "profit margin";
    case QualityCriterion::DebtToEquity:
      return "debt/equity";
    case QualityCriterion::PriceEarnings:
      return "P/E";
    case QualityCriterion::PriceBook:
      return "P/B";
    case QualityCriterion::PriceSales:
      return "P/S";
    case QualityCriterion::PriceFreeCashFlow:
      return "P/FCF";
  }
  return "";
}

std::string group_thousands(long long n) {
  auto digits = std::to_string(std::llabs(n));

  std::string out;
  int count = 0;
  for (auto it = digits.rbegin(); it != digits.rend(); it++) {
    if (count > 0 && count % 3 == 0)
      out.insert(out.begin(), ',');
    out.insert(out.begin(), *it);
    count++;
  }

  return n < 0 ? "-" + out : out;
}

std::string fmt_currency(Value v, const char* none) {
  if (!v)
    return none;
  return "$" + group_thousands(std::llround(*v));
}

std::string fmt_percent(Value v, const char* none) {
  if (!v)
    return none;
  return std::format("{:.2f}%", *v);
}

std::string fmt_float(Value v, const char* none) {
  if (!v)
    return none;
  return std::format("{:.2f}", *v);
}
